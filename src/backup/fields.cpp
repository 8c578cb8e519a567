#include "backup/fields.hpp"
#include "util/sanitize.hpp"

#include <charconv>
#include <cmath>
#include <unordered_set>

namespace cuisine::backup::fields {

std::optional<std::string> toString(const nlohmann::json& value) {
    if (!value.is_string()) return std::nullopt;
    auto cleaned = util::trim(util::sanitize(value.get_ref<const std::string&>()));
    if (cleaned.empty()) return std::nullopt;
    return cleaned;
}

std::vector<std::string> toStringArray(const nlohmann::json& value) {
    std::vector<std::string> out;
    if (!value.is_array()) return out;

    std::unordered_set<std::string> seen;
    for (const auto& entry : value) {
        auto str = toString(entry);
        if (!str) continue;
        if (seen.insert(*str).second) out.push_back(std::move(*str));
    }
    return out;
}

static std::optional<double> parseRadixInteger(const std::string_view digits, const int radix) {
    if (digits.empty()) return std::nullopt;
    double result = 0;
    for (const char c : digits) {
        int d;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (c >= 'a' && c <= 'f') d = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') d = c - 'A' + 10;
        else return std::nullopt;
        if (d >= radix) return std::nullopt;
        result = result * radix + d;
    }
    if (!std::isfinite(result)) return std::nullopt;
    return result;
}

static bool isDecimalLiteral(const std::string_view s) {
    size_t i = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;

    size_t intDigits = 0, fracDigits = 0;
    while (i < s.size() && s[i] >= '0' && s[i] <= '9') { ++i; ++intDigits; }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9') { ++i; ++fracDigits; }
    }
    if (intDigits + fracDigits == 0) return false;

    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        size_t expDigits = 0;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9') { ++i; ++expDigits; }
        if (expDigits == 0) return false;
    }
    return i == s.size();
}

std::optional<double> parseNumber(const std::string_view text) {
    const auto trimmed = util::trim(text);
    if (trimmed.empty()) return std::nullopt;
    const std::string_view s = trimmed;

    if (s.size() > 2 && s[0] == '0') {
        switch (s[1]) {
            case 'x': case 'X': return parseRadixInteger(s.substr(2), 16);
            case 'o': case 'O': return parseRadixInteger(s.substr(2), 8);
            case 'b': case 'B': return parseRadixInteger(s.substr(2), 2);
            default: break;
        }
    }

    if (!isDecimalLiteral(s)) return std::nullopt;

    // from_chars rejects a leading '+'
    const auto body = s.front() == '+' ? s.substr(1) : s;
    double result = 0;
    const auto [ptr, ec] = std::from_chars(body.data(), body.data() + body.size(), result);
    if (ec != std::errc{} || ptr != body.data() + body.size()) return std::nullopt;
    if (!std::isfinite(result)) return std::nullopt;
    return result;
}

std::optional<double> toNumber(const nlohmann::json& value) {
    if (value.is_number()) {
        const auto n = value.get<double>();
        if (!std::isfinite(n)) return std::nullopt;
        return n;
    }
    if (value.is_string()) return parseNumber(value.get_ref<const std::string&>());
    return std::nullopt;
}

std::optional<int64_t> toRoundedInteger(const nlohmann::json& value) {
    const auto n = toNumber(value);
    if (!n) return std::nullopt;
    const auto rounded = std::floor(*n + 0.5);
    if (rounded < -9223372036854775808.0 || rounded >= 9223372036854775808.0) return std::nullopt;
    return static_cast<int64_t>(rounded);
}

std::optional<bool> toBoolean(const nlohmann::json& value) {
    if (!value.is_boolean()) return std::nullopt;
    return value.get<bool>();
}

std::optional<util::Timestamp> toDate(const nlohmann::json& value) {
    if (value.is_string()) return util::parseIsoTimestamp(value.get_ref<const std::string&>());
    if (value.is_number()) return util::timestampFromEpochMs(value.get<double>());
    return std::nullopt;
}

}
