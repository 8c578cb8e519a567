#include "types/PriceHistory.hpp"
#include "types/json_util.hpp"

using namespace cuisine::types::json_util;

namespace cuisine::types {

void to_json(nlohmann::json& j, const PricePoint& p) {
    j = {
        {"date", timestamp(p.date)},
        {"price", p.price}
    };
}

void from_json(const nlohmann::json& j, PricePoint& p) {
    p.date = get_timestamp(j, "date");
    p.price = j.at("price").get<double>();
}

void to_json(nlohmann::json& j, const PriceHistory& h) {
    j = {
        {"id", h.id},
        {"itemName", h.item_name},
        {"supplier", h.supplier},
        {"prices", h.prices},
        {"averagePrice", h.average_price},
        {"minPrice", h.min_price},
        {"maxPrice", h.max_price}
    };
}

void from_json(const nlohmann::json& j, PriceHistory& h) {
    h.id = j.at("id").get<std::string>();
    h.item_name = j.at("itemName").get<std::string>();
    h.supplier = j.at("supplier").get<std::string>();
    h.prices = j.value("prices", std::vector<PricePoint>{});
    h.average_price = j.at("averagePrice").get<double>();
    h.min_price = j.at("minPrice").get<double>();
    h.max_price = j.at("maxPrice").get<double>();
}

}
