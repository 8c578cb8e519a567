#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace cuisine::util {

// Millisecond-precision UTC instant, the resolution backups are written with.
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;
using Clock = std::function<Timestamp()>;

// Largest magnitude a timestamp may have (±100 000 000 days around the epoch).
constexpr double MAX_EPOCH_MS = 8.64e15;

inline Timestamp now() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

inline const Clock systemClock = [] { return now(); };

inline int64_t toEpochMs(const Timestamp ts) { return ts.time_since_epoch().count(); }

inline Timestamp fromEpochMs(const int64_t ms) { return Timestamp{std::chrono::milliseconds{ms}}; }

// Accepts a finite epoch-milliseconds value inside the representable range; fractions are truncated.
std::optional<Timestamp> timestampFromEpochMs(double ms);

// ISO 8601 subset: YYYY, YYYY-MM, YYYY-MM-DD, optionally followed by 'T' (or ' ') HH:MM[:SS[.fff]]
// and a 'Z' or ±HH:MM offset. Times without an offset are read as UTC.
std::optional<Timestamp> parseIsoTimestamp(std::string_view str);

// "2024-03-01T08:15:00.000Z"
std::string timestampToIso(Timestamp ts);

// "2024-03-01"
std::string dateString(Timestamp ts);

} // namespace cuisine::util
