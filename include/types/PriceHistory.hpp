#pragma once

#include "util/timestamp.hpp"

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace cuisine::types {

struct PricePoint {
    util::Timestamp date{};
    double price{0};

    bool operator==(const PricePoint&) const = default;
};

struct PriceHistory {
    std::string id;
    std::string item_name;
    std::string supplier;
    std::vector<PricePoint> prices;
    double average_price{0};
    double min_price{0};
    double max_price{0};

    bool operator==(const PriceHistory&) const = default;
};

void to_json(nlohmann::json& j, const PricePoint& p);
void from_json(const nlohmann::json& j, PricePoint& p);

void to_json(nlohmann::json& j, const PriceHistory& h);
void from_json(const nlohmann::json& j, PriceHistory& h);

}
