#pragma once

#include "util/timestamp.hpp"

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace cuisine::types {

// One temperature reading. equipment_id is a loose reference, never checked against the equipment list.
struct TemperatureRecord {
    std::string id;
    std::string equipment_id;
    double temperature{0};
    util::Timestamp timestamp{};
    bool is_compliant{false};
    std::optional<std::string> signature;

    bool operator==(const TemperatureRecord&) const = default;
};

void to_json(nlohmann::json& j, const TemperatureRecord& r);
void from_json(const nlohmann::json& j, TemperatureRecord& r);

}
