#include "types/Equipment.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace cuisine::types {

std::string to_string(const EquipmentType type) {
    switch (type) {
        case EquipmentType::Fridge: return "fridge";
        case EquipmentType::Freezer: return "freezer";
        case EquipmentType::ColdRoom: return "cold_room";
        default: throw std::invalid_argument("Unknown EquipmentType enum value");
    }
}

std::optional<EquipmentType> equipment_type_from_string(const std::string_view str) {
    if (str == "fridge") return EquipmentType::Fridge;
    if (str == "freezer") return EquipmentType::Freezer;
    if (str == "cold_room") return EquipmentType::ColdRoom;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const Equipment& e) {
    j = {
        {"id", e.id},
        {"name", e.name},
        {"type", to_string(e.type)},
        {"minTemp", e.min_temp},
        {"maxTemp", e.max_temp},
        {"order", e.order}
    };
}

void from_json(const nlohmann::json& j, Equipment& e) {
    e.id = j.at("id").get<std::string>();
    e.name = j.at("name").get<std::string>();
    const auto type = j.at("type").get<std::string>();
    const auto parsed = equipment_type_from_string(type);
    if (!parsed) throw std::invalid_argument("Invalid EquipmentType string: " + type);
    e.type = *parsed;
    e.min_temp = j.at("minTemp").get<double>();
    e.max_temp = j.at("maxTemp").get<double>();
    e.order = j.at("order").get<int64_t>();
}

}
