#include "types/OilChangeRecord.hpp"
#include "types/json_util.hpp"

#include <stdexcept>

using namespace cuisine::types::json_util;

namespace cuisine::types {

std::string to_string(const OilAction action) {
    switch (action) {
        case OilAction::Changed: return "changed";
        default: throw std::invalid_argument("Unknown OilAction enum value");
    }
}

std::optional<OilAction> oil_action_from_string(const std::string_view str) {
    if (str == "changed") return OilAction::Changed;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const OilChangeRecord& r) {
    j = {
        {"id", r.id},
        {"fryerId", r.fryer_id},
        {"changedAt", timestamp(r.changed_at)},
        {"action", to_string(r.action)}
    };
    put_optional(j, "operator", r.operator_name);
}

void from_json(const nlohmann::json& j, OilChangeRecord& r) {
    r.id = j.at("id").get<std::string>();
    r.fryer_id = j.at("fryerId").get<std::string>();
    r.changed_at = get_timestamp(j, "changedAt");
    const auto action = j.at("action").get<std::string>();
    const auto parsed = oil_action_from_string(action);
    if (!parsed) throw std::invalid_argument("Invalid OilAction string: " + action);
    r.action = *parsed;
    r.operator_name = get_optional<std::string>(j, "operator");
}

}
