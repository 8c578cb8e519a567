#include "util/timestamp.hpp"

#include <cmath>
#include <cstdio>

namespace cuisine::util {

namespace {

constexpr int64_t MS_PER_DAY = 86'400'000;

struct CivilDate {
    int64_t year;
    unsigned month;
    unsigned day;
};

// Proleptic Gregorian conversions (H. Hinnant's algorithms), valid over the whole timestamp range.
int64_t daysFromCivil(int64_t y, const unsigned m, const unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

CivilDate civilFromDays(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return {y + (m <= 2), m, d};
}

bool isLeap(const int64_t y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

unsigned daysInMonth(const int64_t y, const unsigned m) {
    static constexpr unsigned table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m == 2 && isLeap(y) ? 29 : table[m - 1];
}

bool readDigits(const std::string_view s, size_t& pos, const size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < count; ++i) {
        const char c = s[pos + i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    pos += count;
    out = v;
    return true;
}

bool isDigit(const char c) { return c >= '0' && c <= '9'; }

int64_t floorDiv(const int64_t a, const int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

}

std::optional<Timestamp> timestampFromEpochMs(const double ms) {
    if (!std::isfinite(ms) || std::fabs(ms) > MAX_EPOCH_MS) return std::nullopt;
    return fromEpochMs(static_cast<int64_t>(std::trunc(ms)));
}

std::optional<Timestamp> parseIsoTimestamp(std::string_view str) {
    while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) str.remove_prefix(1);
    while (!str.empty() && (str.back() == ' ' || str.back() == '\t')) str.remove_suffix(1);

    size_t pos = 0;
    const size_t size = str.size();

    int yearDigits = 0;
    int64_t year = 0;
    if (size > 0 && (str[0] == '+' || str[0] == '-')) {
        const bool negative = str[0] == '-';
        pos = 1;
        if (!readDigits(str, pos, 6, yearDigits)) return std::nullopt;
        if (negative && yearDigits == 0) return std::nullopt;
        year = negative ? -yearDigits : yearDigits;
    } else {
        if (!readDigits(str, pos, 4, yearDigits)) return std::nullopt;
        year = yearDigits;
    }

    int month = 1, day = 1;
    bool hasDay = false;
    if (pos < size && str[pos] == '-') {
        ++pos;
        if (!readDigits(str, pos, 2, month)) return std::nullopt;
        if (pos < size && str[pos] == '-') {
            ++pos;
            if (!readDigits(str, pos, 2, day)) return std::nullopt;
            hasDay = true;
        }
    }

    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || static_cast<unsigned>(day) > daysInMonth(year, static_cast<unsigned>(month))) return std::nullopt;

    int64_t timeOfDayMs = 0;
    int64_t offsetMs = 0;

    if (pos < size) {
        if (!hasDay) return std::nullopt;
        if (str[pos] != 'T' && str[pos] != 't' && str[pos] != ' ') return std::nullopt;
        ++pos;

        int hh = 0, mm = 0, ss = 0, frac = 0;
        if (!readDigits(str, pos, 2, hh)) return std::nullopt;
        if (pos >= size || str[pos] != ':') return std::nullopt;
        ++pos;
        if (!readDigits(str, pos, 2, mm)) return std::nullopt;

        if (pos < size && str[pos] == ':') {
            ++pos;
            if (!readDigits(str, pos, 2, ss)) return std::nullopt;

            if (pos < size && (str[pos] == '.' || str[pos] == ',')) {
                ++pos;
                size_t digits = 0;
                while (pos < size && isDigit(str[pos])) {
                    if (digits < 3) frac = frac * 10 + (str[pos] - '0');
                    ++digits;
                    ++pos;
                }
                if (digits == 0) return std::nullopt;
                for (; digits < 3; ++digits) frac *= 10;
            }
        }

        if (hh > 24 || mm > 59 || ss > 59) return std::nullopt;
        if (hh == 24 && (mm != 0 || ss != 0 || frac != 0)) return std::nullopt;
        timeOfDayMs = ((hh * 60LL + mm) * 60LL + ss) * 1000LL + frac;

        if (pos < size) {
            if (str[pos] == 'Z' || str[pos] == 'z') {
                ++pos;
            } else if (str[pos] == '+' || str[pos] == '-') {
                const int64_t sign = str[pos] == '-' ? -1 : 1;
                ++pos;
                int oh = 0, om = 0;
                if (!readDigits(str, pos, 2, oh)) return std::nullopt;
                if (pos < size && str[pos] == ':') ++pos;
                if (!readDigits(str, pos, 2, om)) return std::nullopt;
                if (oh > 23 || om > 59) return std::nullopt;
                offsetMs = sign * (oh * 60LL + om) * 60'000LL;
            } else {
                return std::nullopt;
            }
        }

        if (pos != size) return std::nullopt;
    }

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t ms = days * MS_PER_DAY + timeOfDayMs - offsetMs;
    if (std::fabs(static_cast<double>(ms)) > MAX_EPOCH_MS) return std::nullopt;
    return fromEpochMs(ms);
}

std::string timestampToIso(const Timestamp ts) {
    const int64_t ms = toEpochMs(ts);
    const int64_t days = floorDiv(ms, MS_PER_DAY);
    const int64_t msOfDay = ms - days * MS_PER_DAY;
    const auto [y, m, d] = civilFromDays(days);

    const auto hh = static_cast<int>(msOfDay / 3'600'000);
    const auto mi = static_cast<int>(msOfDay / 60'000 % 60);
    const auto ss = static_cast<int>(msOfDay / 1000 % 60);
    const auto fr = static_cast<int>(msOfDay % 1000);

    char buf[48];
    if (y >= 0 && y <= 9999)
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                      static_cast<long long>(y), m, d, hh, mi, ss, fr);
    else
        std::snprintf(buf, sizeof(buf), "%+07lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                      static_cast<long long>(y), m, d, hh, mi, ss, fr);
    return {buf};
}

std::string dateString(const Timestamp ts) {
    const auto iso = timestampToIso(ts);
    return iso.substr(0, iso.find('T'));
}

}
