#include "types/Dataset.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace cuisine::types {

std::string to_string(const Collection collection) {
    switch (collection) {
        case Collection::Equipment: return "equipment";
        case Collection::TemperatureRecords: return "temperatureRecords";
        case Collection::OilChangeRecords: return "oilChangeRecords";
        case Collection::Tasks: return "tasks";
        case Collection::ProductTraces: return "productTraces";
        case Collection::Invoices: return "invoices";
        case Collection::PriceHistory: return "priceHistory";
        case Collection::Settings: return "settings";
        default: throw std::invalid_argument("Unknown Collection enum value");
    }
}

std::optional<Collection> collection_from_string(const std::string_view str) {
    for (const auto c : ALL_COLLECTIONS)
        if (to_string(c) == str) return c;
    return std::nullopt;
}

size_t Dataset::size(const Collection collection) const {
    switch (collection) {
        case Collection::Equipment: return equipment.size();
        case Collection::TemperatureRecords: return temperature_records.size();
        case Collection::OilChangeRecords: return oil_change_records.size();
        case Collection::Tasks: return tasks.size();
        case Collection::ProductTraces: return product_traces.size();
        case Collection::Invoices: return invoices.size();
        case Collection::PriceHistory: return price_history.size();
        case Collection::Settings: return settings.size();
        default: throw std::invalid_argument("Unknown Collection enum value");
    }
}

size_t Dataset::totalRecords() const {
    size_t total = 0;
    for (const auto c : ALL_COLLECTIONS) total += size(c);
    return total;
}

template <typename T>
static std::vector<std::string> idsOf(const std::vector<T>& records) {
    std::vector<std::string> out;
    out.reserve(records.size());
    for (const auto& r : records) out.push_back(r.id);
    return out;
}

std::vector<std::string> Dataset::ids(const Collection collection) const {
    switch (collection) {
        case Collection::Equipment: return idsOf(equipment);
        case Collection::TemperatureRecords: return idsOf(temperature_records);
        case Collection::OilChangeRecords: return idsOf(oil_change_records);
        case Collection::Tasks: return idsOf(tasks);
        case Collection::ProductTraces: return idsOf(product_traces);
        case Collection::Invoices: return idsOf(invoices);
        case Collection::PriceHistory: return idsOf(price_history);
        case Collection::Settings: return idsOf(settings);
        default: throw std::invalid_argument("Unknown Collection enum value");
    }
}

nlohmann::json collectionToJson(const Dataset& data, const Collection collection) {
    switch (collection) {
        case Collection::Equipment: return data.equipment;
        case Collection::TemperatureRecords: return data.temperature_records;
        case Collection::OilChangeRecords: return data.oil_change_records;
        case Collection::Tasks: return data.tasks;
        case Collection::ProductTraces: return data.product_traces;
        case Collection::Invoices: return data.invoices;
        case Collection::PriceHistory: return data.price_history;
        case Collection::Settings: return data.settings;
        default: throw std::invalid_argument("Unknown Collection enum value");
    }
}

void collectionFromJson(Dataset& data, const Collection collection, const nlohmann::json& docs) {
    switch (collection) {
        case Collection::Equipment: docs.get_to(data.equipment); break;
        case Collection::TemperatureRecords: docs.get_to(data.temperature_records); break;
        case Collection::OilChangeRecords: docs.get_to(data.oil_change_records); break;
        case Collection::Tasks: docs.get_to(data.tasks); break;
        case Collection::ProductTraces: docs.get_to(data.product_traces); break;
        case Collection::Invoices: docs.get_to(data.invoices); break;
        case Collection::PriceHistory: docs.get_to(data.price_history); break;
        case Collection::Settings: docs.get_to(data.settings); break;
        default: throw std::invalid_argument("Unknown Collection enum value");
    }
}

void to_json(nlohmann::json& j, const Dataset& data) {
    if (j.is_null()) j = nlohmann::json::object();
    for (const auto c : ALL_COLLECTIONS) j[to_string(c)] = collectionToJson(data, c);
}

void from_json(const nlohmann::json& j, Dataset& data) {
    data = Dataset{};
    for (const auto c : ALL_COLLECTIONS) {
        const auto key = to_string(c);
        if (j.contains(key)) collectionFromJson(data, c, j.at(key));
    }
}

}
