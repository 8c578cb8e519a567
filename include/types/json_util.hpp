#pragma once

#include "util/timestamp.hpp"
#include "crypto/util/encrypt.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Helpers for the trusted storage form of entities. Malformed stored data throws.
namespace cuisine::types::json_util {

inline std::string timestamp(const util::Timestamp ts) { return util::timestampToIso(ts); }

inline util::Timestamp get_timestamp(const nlohmann::json& j, const char* key) {
    const auto str = j.at(key).get<std::string>();
    const auto ts = util::parseIsoTimestamp(str);
    if (!ts) throw std::runtime_error(std::string("Invalid stored timestamp for '") + key + "': " + str);
    return *ts;
}

inline std::optional<util::Timestamp> get_optional_timestamp(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return get_timestamp(j, key);
}

template <typename T>
std::optional<T> get_optional(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<T>();
}

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

inline void put_optional(nlohmann::json& j, const char* key, const std::optional<util::Timestamp>& value) {
    if (value) j[key] = timestamp(*value);
}

inline std::string blob(const std::vector<uint8_t>& bytes) { return crypto::util::b64_encode(bytes); }

inline std::vector<uint8_t> get_blob(const nlohmann::json& value) {
    return crypto::util::b64_decode(value.get<std::string>());
}

}
