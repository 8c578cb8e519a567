#include "backup/PayloadValidator.hpp"
#include "backup/fields.hpp"
#include "backup/parsers.hpp"
#include "logging/LogRegistry.hpp"

#include <cmath>
#include <nlohmann/json.hpp>

using namespace cuisine::types;
using namespace cuisine::logging;
using namespace cuisine::backup::parsers;

namespace cuisine::backup {

namespace {

// Largest integer a JSON number carries exactly.
constexpr double MAX_SAFE_INTEGER = 9007199254740991.0;

template <typename Parser, typename T>
bool parseCollection(const nlohmann::json& doc, const Collection collection, Parser&& parser, std::vector<T>& out) {
    const auto key = to_string(collection);
    auto parsed = parseArray(field(doc, key.c_str()), parser);
    if (!parsed) {
        LogRegistry::backup()->debug("[PayloadValidator] Rejected backup: invalid '{}' collection", key);
        return false;
    }
    out = std::move(*parsed);
    return true;
}

}

std::optional<BackupPayload> validateBackupImportPayload(const nlohmann::json& value) {
    if (!value.is_object()) {
        LogRegistry::backup()->debug("[PayloadValidator] Rejected backup: document is not an object");
        return std::nullopt;
    }

    const auto version = fields::toNumber(field(value, "version"));
    if (!version || std::floor(*version) != *version || *version < 1 || *version > MAX_SAFE_INTEGER) {
        LogRegistry::backup()->debug("[PayloadValidator] Rejected backup: invalid version");
        return std::nullopt;
    }

    const auto exportedAt = fields::toDate(field(value, "exportedAt"));
    if (!exportedAt) {
        LogRegistry::backup()->debug("[PayloadValidator] Rejected backup: invalid exportedAt");
        return std::nullopt;
    }

    BackupPayload payload{
        .version = static_cast<int64_t>(*version),
        .exported_at = *exportedAt,
        .data = {}
    };
    auto& d = payload.data;

    if (!parseCollection(value, Collection::Equipment, parseEquipment, d.equipment)
        || !parseCollection(value, Collection::TemperatureRecords, parseTemperatureRecord, d.temperature_records)
        || !parseCollection(value, Collection::OilChangeRecords, parseOilChangeRecord, d.oil_change_records)
        || !parseCollection(value, Collection::Tasks, parseTask, d.tasks)
        || !parseCollection(value, Collection::ProductTraces, parseProductTrace, d.product_traces)
        || !parseCollection(value, Collection::Invoices, parseInvoice, d.invoices)
        || !parseCollection(value, Collection::PriceHistory, parsePriceHistory, d.price_history)
        || !parseCollection(value, Collection::Settings, parseSettings, d.settings))
        return std::nullopt;

    return payload;
}

std::optional<BackupPayload> validateBackupImportText(const std::string_view text) {
    const auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        LogRegistry::backup()->debug("[PayloadValidator] Rejected backup: not valid JSON");
        return std::nullopt;
    }
    return validateBackupImportPayload(doc);
}

}
