#include "types/TemperatureRecord.hpp"
#include "types/json_util.hpp"

using namespace cuisine::types::json_util;

namespace cuisine::types {

void to_json(nlohmann::json& j, const TemperatureRecord& r) {
    j = {
        {"id", r.id},
        {"equipmentId", r.equipment_id},
        {"temperature", r.temperature},
        {"timestamp", timestamp(r.timestamp)},
        {"isCompliant", r.is_compliant}
    };
    put_optional(j, "signature", r.signature);
}

void from_json(const nlohmann::json& j, TemperatureRecord& r) {
    r.id = j.at("id").get<std::string>();
    r.equipment_id = j.at("equipmentId").get<std::string>();
    r.temperature = j.at("temperature").get<double>();
    r.timestamp = get_timestamp(j, "timestamp");
    r.is_compliant = j.at("isCompliant").get<bool>();
    r.signature = get_optional<std::string>(j, "signature");
}

}
