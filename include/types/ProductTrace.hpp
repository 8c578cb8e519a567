#pragma once

#include "util/timestamp.hpp"

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cuisine::types {

struct ProductTrace {
    std::string id;
    std::optional<std::string> barcode;
    std::optional<std::vector<uint8_t>> photo;   // label picture, never exported
    std::optional<std::string> photo_url;
    std::string product_name;
    std::string supplier;
    std::string lot_number;
    util::Timestamp reception_date{};
    util::Timestamp expiration_date{};
    std::string category;
    std::vector<std::string> allergens;
    util::Timestamp scanned_at{};

    bool operator==(const ProductTrace&) const = default;
};

void to_json(nlohmann::json& j, const ProductTrace& p);
void from_json(const nlohmann::json& j, ProductTrace& p);

}
