#pragma once

#include "util/timestamp.hpp"

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace cuisine::types {

enum class OilAction { Changed };

std::string to_string(OilAction action);
std::optional<OilAction> oil_action_from_string(std::string_view str);

struct OilChangeRecord {
    std::string id;
    std::string fryer_id;
    util::Timestamp changed_at{};
    OilAction action{OilAction::Changed};
    std::optional<std::string> operator_name;

    bool operator==(const OilChangeRecord&) const = default;
};

void to_json(nlohmann::json& j, const OilChangeRecord& r);
void from_json(const nlohmann::json& j, OilChangeRecord& r);

}
