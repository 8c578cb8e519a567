#pragma once

#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Field validators for untrusted backup input. Every validator returns std::nullopt on
// missing or malformed data; none of them throw for bad input.
namespace cuisine::backup::fields {

// JSON string, sanitized and trimmed. Empty after cleaning rejects.
std::optional<std::string> toString(const nlohmann::json& value);

// Non-array yields an empty list. Bad entries are dropped, survivors de-duplicated in first-seen order.
std::vector<std::string> toStringArray(const nlohmann::json& value);

// Finite JSON number, or a string holding one (decimal, 0x/0o/0b integer). Booleans are not numbers.
std::optional<double> toNumber(const nlohmann::json& value);

// Parses a numeric string with the rules of toNumber.
std::optional<double> parseNumber(std::string_view text);

// toNumber rounded half-up to an integer.
std::optional<int64_t> toRoundedInteger(const nlohmann::json& value);

// Literal true/false only.
std::optional<bool> toBoolean(const nlohmann::json& value);

// ISO 8601 string or epoch milliseconds.
std::optional<util::Timestamp> toDate(const nlohmann::json& value);

// Exact match against a closed set of string tags; no sanitizing, no case folding.
template <typename E, typename FromString>
std::optional<E> toEnum(const nlohmann::json& value, FromString&& fromString) {
    if (!value.is_string()) return std::nullopt;
    return fromString(value.get_ref<const std::string&>());
}

}
