#include "types/Invoice.hpp"
#include "types/json_util.hpp"

#include <stdexcept>

using namespace cuisine::types::json_util;

namespace cuisine::types {

std::string to_string(const IngredientUnit unit) {
    switch (unit) {
        case IngredientUnit::Kg: return "kg";
        case IngredientUnit::G: return "g";
        case IngredientUnit::L: return "l";
        case IngredientUnit::Ml: return "ml";
        case IngredientUnit::Unite: return "unite";
        default: throw std::invalid_argument("Unknown IngredientUnit enum value");
    }
}

std::optional<IngredientUnit> ingredient_unit_from_string(const std::string_view str) {
    if (str == "kg") return IngredientUnit::Kg;
    if (str == "g") return IngredientUnit::G;
    if (str == "l") return IngredientUnit::L;
    if (str == "ml") return IngredientUnit::Ml;
    if (str == "unite") return IngredientUnit::Unite;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const InvoiceItem& i) {
    j = {
        {"designation", i.designation},
        {"quantity", i.quantity},
        {"unitPriceHT", i.unit_price_ht},
        {"totalPriceHT", i.total_price_ht}
    };
    put_optional(j, "conditioningQuantity", i.conditioning_quantity);
    if (i.conditioning_unit) j["conditioningUnit"] = to_string(*i.conditioning_unit);
}

void from_json(const nlohmann::json& j, InvoiceItem& i) {
    i.designation = j.at("designation").get<std::string>();
    i.quantity = j.at("quantity").get<double>();
    i.unit_price_ht = j.at("unitPriceHT").get<double>();
    i.total_price_ht = j.at("totalPriceHT").get<double>();
    i.conditioning_quantity = get_optional<double>(j, "conditioningQuantity");

    if (const auto unit = get_optional<std::string>(j, "conditioningUnit")) {
        i.conditioning_unit = ingredient_unit_from_string(*unit);
        if (!i.conditioning_unit) throw std::invalid_argument("Invalid IngredientUnit string: " + *unit);
    } else {
        i.conditioning_unit.reset();
    }
}

void to_json(nlohmann::json& j, const Invoice& i) {
    auto images = nlohmann::json::array();
    for (const auto& page : i.images) images.push_back(blob(page));

    j = {
        {"id", i.id},
        {"images", images},
        {"supplier", i.supplier},
        {"invoiceNumber", i.invoice_number},
        {"invoiceDate", timestamp(i.invoice_date)},
        {"items", i.items},
        {"totalHT", i.total_ht},
        {"totalTVA", i.total_tva},
        {"totalTTC", i.total_ttc},
        {"ocrText", i.ocr_text},
        {"tags", i.tags},
        {"scannedAt", timestamp(i.scanned_at)}
    };
}

void from_json(const nlohmann::json& j, Invoice& i) {
    i.id = j.at("id").get<std::string>();

    i.images.clear();
    if (j.contains("images"))
        for (const auto& page : j.at("images")) i.images.push_back(get_blob(page));

    i.supplier = j.at("supplier").get<std::string>();
    i.invoice_number = j.at("invoiceNumber").get<std::string>();
    i.invoice_date = get_timestamp(j, "invoiceDate");
    i.items = j.value("items", std::vector<InvoiceItem>{});
    i.total_ht = j.at("totalHT").get<double>();
    i.total_tva = j.at("totalTVA").get<double>();
    i.total_ttc = j.at("totalTTC").get<double>();
    i.ocr_text = j.value("ocrText", std::string{});
    i.tags = j.value("tags", std::vector<std::string>{});
    i.scanned_at = get_timestamp(j, "scannedAt");
}

}
