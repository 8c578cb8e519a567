#pragma once

#include "types/Dataset.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

// Record parsers for untrusted backup input. A parser returns the typed entity, or std::nullopt
// as soon as one required field is missing or invalid. Optional fields that fail are dropped.
namespace cuisine::backup::parsers {

std::optional<types::Equipment> parseEquipment(const nlohmann::json& value);
std::optional<types::TemperatureRecord> parseTemperatureRecord(const nlohmann::json& value);
std::optional<types::OilChangeRecord> parseOilChangeRecord(const nlohmann::json& value);
std::optional<types::Task> parseTask(const nlohmann::json& value);
std::optional<types::ProductTrace> parseProductTrace(const nlohmann::json& value);
std::optional<types::InvoiceItem> parseInvoiceItem(const nlohmann::json& value);
std::optional<types::Invoice> parseInvoice(const nlohmann::json& value);
std::optional<types::PricePoint> parsePricePoint(const nlohmann::json& value);
std::optional<types::PriceHistory> parsePriceHistory(const nlohmann::json& value);

// The OCR API key is never read: a backup cannot restore or overwrite credentials.
std::optional<types::AppSettings> parseSettings(const nlohmann::json& value);

// Member of an object, or a null value when absent.
const nlohmann::json& field(const nlohmann::json& object, const char* key);

// null/absent -> empty list, non-array -> nullopt, otherwise every element must parse.
template <typename Parser>
auto parseArray(const nlohmann::json& value, Parser&& parser)
    -> std::optional<std::vector<typename decltype(parser(value))::value_type>> {
    using T = typename decltype(parser(value))::value_type;

    if (value.is_null()) return std::vector<T>{};
    if (!value.is_array()) return std::nullopt;

    std::vector<T> parsed;
    parsed.reserve(value.size());
    for (const auto& entry : value) {
        auto row = parser(entry);
        if (!row) return std::nullopt;
        parsed.push_back(std::move(*row));
    }
    return parsed;
}

}
