#pragma once

#include "util/timestamp.hpp"

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cuisine::types {

enum class IngredientUnit { Kg, G, L, Ml, Unite };

std::string to_string(IngredientUnit unit);
std::optional<IngredientUnit> ingredient_unit_from_string(std::string_view str);

struct InvoiceItem {
    std::string designation;
    double quantity{0};
    double unit_price_ht{0};
    double total_price_ht{0};
    std::optional<double> conditioning_quantity;
    std::optional<IngredientUnit> conditioning_unit;

    bool operator==(const InvoiceItem&) const = default;
};

struct Invoice {
    std::string id;
    std::vector<std::vector<uint8_t>> images;    // scanned pages, never exported
    std::string supplier;
    std::string invoice_number;
    util::Timestamp invoice_date{};
    std::vector<InvoiceItem> items;
    double total_ht{0};
    double total_tva{0};
    double total_ttc{0};
    std::string ocr_text;
    std::vector<std::string> tags;
    util::Timestamp scanned_at{};

    bool operator==(const Invoice&) const = default;
};

void to_json(nlohmann::json& j, const InvoiceItem& i);
void from_json(const nlohmann::json& j, InvoiceItem& i);

void to_json(nlohmann::json& j, const Invoice& i);
void from_json(const nlohmann::json& j, Invoice& i);

}
