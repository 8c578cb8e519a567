#include "types/AppSettings.hpp"
#include "types/json_util.hpp"

using namespace cuisine::types::json_util;

namespace cuisine::types {

void to_json(nlohmann::json& j, const AppSettings& s) {
    j = {
        {"id", s.id},
        {"establishmentName", s.establishment_name},
        {"darkMode", s.dark_mode},
        {"onboardingDone", s.onboarding_done},
        {"priceAlertThreshold", s.price_alert_threshold}
    };
    put_optional(j, "ocrApiKey", s.ocr_api_key);
}

void from_json(const nlohmann::json& j, AppSettings& s) {
    s.id = j.at("id").get<std::string>();
    s.establishment_name = j.at("establishmentName").get<std::string>();
    s.dark_mode = j.at("darkMode").get<bool>();
    s.onboarding_done = j.at("onboardingDone").get<bool>();
    s.price_alert_threshold = j.at("priceAlertThreshold").get<double>();
    s.ocr_api_key = get_optional<std::string>(j, "ocrApiKey");
}

}
