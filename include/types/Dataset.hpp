#pragma once

#include "types/Equipment.hpp"
#include "types/TemperatureRecord.hpp"
#include "types/OilChangeRecord.hpp"
#include "types/Task.hpp"
#include "types/ProductTrace.hpp"
#include "types/Invoice.hpp"
#include "types/PriceHistory.hpp"
#include "types/AppSettings.hpp"

#include <nlohmann/json_fwd.hpp>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cuisine::types {

enum class Collection {
    Equipment,
    TemperatureRecords,
    OilChangeRecords,
    Tasks,
    ProductTraces,
    Invoices,
    PriceHistory,
    Settings
};

inline constexpr std::array ALL_COLLECTIONS{
    Collection::Equipment,
    Collection::TemperatureRecords,
    Collection::OilChangeRecords,
    Collection::Tasks,
    Collection::ProductTraces,
    Collection::Invoices,
    Collection::PriceHistory,
    Collection::Settings
};

// JSON key of the collection inside a backup document ("temperatureRecords", ...)
std::string to_string(Collection collection);
std::optional<Collection> collection_from_string(std::string_view str);

// The whole local dataset, one vector per collection.
struct Dataset {
    std::vector<Equipment> equipment;
    std::vector<TemperatureRecord> temperature_records;
    std::vector<OilChangeRecord> oil_change_records;
    std::vector<Task> tasks;
    std::vector<ProductTrace> product_traces;
    std::vector<Invoice> invoices;
    std::vector<PriceHistory> price_history;
    std::vector<AppSettings> settings;

    [[nodiscard]] size_t size(Collection collection) const;
    [[nodiscard]] size_t totalRecords() const;
    [[nodiscard]] std::vector<std::string> ids(Collection collection) const;
    [[nodiscard]] bool empty() const { return totalRecords() == 0; }

    bool operator==(const Dataset&) const = default;
};

// Storage form of a single collection as a JSON array of entity documents.
nlohmann::json collectionToJson(const Dataset& data, Collection collection);
void collectionFromJson(Dataset& data, Collection collection, const nlohmann::json& docs);

// Writes every collection key into j (which must be an object or null).
void to_json(nlohmann::json& j, const Dataset& data);
void from_json(const nlohmann::json& j, Dataset& data);

}
