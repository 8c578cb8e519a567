#pragma once

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace cuisine::types {

struct AppSettings {
    std::string id;
    std::string establishment_name;
    bool dark_mode{false};
    bool onboarding_done{false};
    double price_alert_threshold{0};    // percent
    std::optional<std::string> ocr_api_key;

    bool operator==(const AppSettings&) const = default;
};

void to_json(nlohmann::json& j, const AppSettings& s);
void from_json(const nlohmann::json& j, AppSettings& s);

}
