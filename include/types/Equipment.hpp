#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cuisine::types {

enum class EquipmentType { Fridge, Freezer, ColdRoom };

std::string to_string(EquipmentType type);
std::optional<EquipmentType> equipment_type_from_string(std::string_view str);

struct Equipment {
    std::string id;
    std::string name;
    EquipmentType type{EquipmentType::Fridge};
    double min_temp{0};
    double max_temp{0};
    int64_t order{0};

    bool operator==(const Equipment&) const = default;
};

void to_json(nlohmann::json& j, const Equipment& e);
void from_json(const nlohmann::json& j, Equipment& e);

}
