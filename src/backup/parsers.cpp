#include "backup/parsers.hpp"
#include "backup/fields.hpp"
#include "util/sanitize.hpp"

using namespace cuisine::types;
using namespace cuisine::backup::fields;

namespace cuisine::backup::parsers {

const nlohmann::json& field(const nlohmann::json& object, const char* key) {
    static const nlohmann::json null_value;
    if (!object.is_object()) return null_value;
    const auto it = object.find(key);
    return it == object.end() ? null_value : *it;
}

std::optional<Equipment> parseEquipment(const nlohmann::json& value) {
    if (!value.is_object()) return std::nullopt;

    const auto id = toString(field(value, "id"));
    const auto name = toString(field(value, "name"));
    const auto type = toEnum<EquipmentType>(field(value, "type"), equipment_type_from_string);
    const auto minTemp = toNumber(field(value, "minTemp"));
    const auto maxTemp = toNumber(field(value, "maxTemp"));
    const auto order = toRoundedInteger(field(value, "order"));
    if (!id || !name || !type || !minTemp || !maxTemp || !order) return std::nullopt;

    return Equipment{
        .id = *id,
        .name = *name,
        .type = *type,
        .min_temp = *minTemp,
        .max_temp = *maxTemp,
        .order = *order
    };
}

std::optional<TemperatureRecord> parseTemperatureRecord(const nlohmann::json& value) {
    if (!value.is_object()) return std::nullopt;

    const auto id = toString(field(value, "id"));
    const auto equipmentId = toString(field(value, "equipmentId"));
    const auto temperature = toNumber(field(value, "temperature"));
    const auto timestamp = toDate(field(value, "timestamp"));
    const auto isCompliant = toBoolean(field(value, "isCompliant"));
    if (!id || !equipmentId || !temperature || !timestamp || !isCompliant) return std::nullopt;

    return TemperatureRecord{
        .id = *id,
        .equipment_id = *equipmentId,
        .temperature = *temperature,
        .timestamp = *timestamp,
        .is_compliant = *isCompliant,
        .signature = toString(field(value, "signature"))
    };
}

std::optional<OilChangeRecord> parseOilChangeRecord(const nlohmann::json& value) {
    if (!value.is_object()) return std::nullopt;

    const auto id = toString(field(value, "id"));
    const auto fryerId = toString(field(value, "fryerId"));
    const auto changedAt = toDate(field(value, "changedAt"));
    const auto action = toEnum<OilAction>(field(value, "action"), oil_action_from_string);
    if (!id || !fryerId || !changedAt || !action) return std::nullopt;

    return OilChangeRecord{
        .id = *id,
        .fryer_id = *fryerId,
        .changed_at = *changedAt,
        .action = *action,
        .operator_name = toString(field(value, "operator"))
    };
}

std::optional<Task> parseTask(const nlohmann::json& value) {
    if (!value.is_object()) return std::nullopt;

    const auto id = toString(field(value, "id"));
    const auto title = toString(field(value, "title"));
    const auto category = toEnum<TaskCategory>(field(value, "category"), task_category_from_string);
    const auto priority = toEnum<TaskPriority>(field(value, "priority"), task_priority_from_string);
    const auto completed = toBoolean(field(value, "completed"));
    const auto createdAt = toDate(field(value, "createdAt"));
    const auto archived = toBoolean(field(value, "archived"));
    const auto order = toRoundedInteger(field(value, "order"));
    if (!id || !title || !category || !priority || !completed || !createdAt || !archived || !order)
        return std::nullopt;

    // The key is mandatory; an explicit null marks a one-off task.
    if (!value.contains("recurring")) return std::nullopt;
    const auto& recurringRaw = value.at("recurring");
    std::optional<Recurrence> recurring;
    if (!recurringRaw.is_null()) {
        recurring = toEnum<Recurrence>(recurringRaw, recurrence_from_string);
        if (!recurring) return std::nullopt;
    }

    return Task{
        .id = *id,
        .title = *title,
        .category = *category,
        .priority = *priority,
        .completed = *completed,
        .estimated_time = toNumber(field(value, "estimatedTime")),
        .notes = toString(field(value, "notes")),
        .recurring = recurring,
        .created_at = *createdAt,
        .completed_at = toDate(field(value, "completedAt")),
        .archived = *archived,
        .order = *order
    };
}

std::optional<ProductTrace> parseProductTrace(const nlohmann::json& value) {
    if (!value.is_object()) return std::nullopt;

    const auto id = toString(field(value, "id"));
    const auto productName = toString(field(value, "productName"));
    const auto supplier = toString(field(value, "supplier"));
    const auto lotNumber = toString(field(value, "lotNumber"));
    const auto receptionDate = toDate(field(value, "receptionDate"));
    const auto expirationDate = toDate(field(value, "expirationDate"));
    const auto category = toString(field(value, "category"));
    const auto scannedAt = toDate(field(value, "scannedAt"));
    if (!id || !productName || !supplier || !lotNumber || !receptionDate || !expirationDate || !category || !scannedAt)
        return std::nullopt;

    return ProductTrace{
        .id = *id,
        .barcode = toString(field(value, "barcode")),
        .photo = std::nullopt,
        .photo_url = toString(field(value, "photoUrl")),
        .product_name = *productName,
        .supplier = *supplier,
        .lot_number = *lotNumber,
        .reception_date = *receptionDate,
        .expiration_date = *expirationDate,
        .category = *category,
        .allergens = toStringArray(field(value, "allergens")),
        .scanned_at = *scannedAt
    };
}

std::optional<InvoiceItem> parseInvoiceItem(const nlohmann::json& value) {
    if (!value.is_object()) return std::nullopt;

    const auto designation = toString(field(value, "designation"));
    const auto quantity = toNumber(field(value, "quantity"));
    const auto unitPrice = toNumber(field(value, "unitPriceHT"));
    const auto totalPrice = toNumber(field(value, "totalPriceHT"));
    if (!designation || !quantity || !unitPrice || !totalPrice) return std::nullopt;

    return InvoiceItem{
        .designation = *designation,
        .quantity = *quantity,
        .unit_price_ht = *unitPrice,
        .total_price_ht = *totalPrice,
        .conditioning_quantity = toNumber(field(value, "conditioningQuantity")),
        .conditioning_unit = toEnum<IngredientUnit>(field(value, "conditioningUnit"), ingredient_unit_from_string)
    };
}

std::optional<Invoice> parseInvoice(const nlohmann::json& value) {
    if (!value.is_object()) return std::nullopt;

    const auto id = toString(field(value, "id"));
    const auto supplier = toString(field(value, "supplier"));
    const auto invoiceNumber = toString(field(value, "invoiceNumber"));
    const auto invoiceDate = toDate(field(value, "invoiceDate"));
    const auto totalHT = toNumber(field(value, "totalHT"));
    const auto totalTVA = toNumber(field(value, "totalTVA"));
    const auto totalTTC = toNumber(field(value, "totalTTC"));
    const auto scannedAt = toDate(field(value, "scannedAt"));
    if (!id || !supplier || !invoiceNumber || !invoiceDate || !totalHT || !totalTVA || !totalTTC || !scannedAt)
        return std::nullopt;

    auto items = parseArray(field(value, "items"), parseInvoiceItem);
    if (!items) return std::nullopt;

    const auto& ocrRaw = field(value, "ocrText");
    auto ocrText = ocrRaw.is_string() ? util::sanitize(ocrRaw.get_ref<const std::string&>()) : std::string{};

    return Invoice{
        .id = *id,
        .images = {},
        .supplier = *supplier,
        .invoice_number = *invoiceNumber,
        .invoice_date = *invoiceDate,
        .items = std::move(*items),
        .total_ht = *totalHT,
        .total_tva = *totalTVA,
        .total_ttc = *totalTTC,
        .ocr_text = std::move(ocrText),
        .tags = toStringArray(field(value, "tags")),
        .scanned_at = *scannedAt
    };
}

std::optional<PricePoint> parsePricePoint(const nlohmann::json& value) {
    if (!value.is_object()) return std::nullopt;

    const auto date = toDate(field(value, "date"));
    const auto price = toNumber(field(value, "price"));
    if (!date || !price) return std::nullopt;

    return PricePoint{.date = *date, .price = *price};
}

std::optional<PriceHistory> parsePriceHistory(const nlohmann::json& value) {
    if (!value.is_object()) return std::nullopt;

    const auto id = toString(field(value, "id"));
    const auto itemName = toString(field(value, "itemName"));
    const auto supplier = toString(field(value, "supplier"));
    const auto averagePrice = toNumber(field(value, "averagePrice"));
    const auto minPrice = toNumber(field(value, "minPrice"));
    const auto maxPrice = toNumber(field(value, "maxPrice"));
    if (!id || !itemName || !supplier || !averagePrice || !minPrice || !maxPrice) return std::nullopt;

    auto prices = parseArray(field(value, "prices"), parsePricePoint);
    if (!prices) return std::nullopt;

    return PriceHistory{
        .id = *id,
        .item_name = *itemName,
        .supplier = *supplier,
        .prices = std::move(*prices),
        .average_price = *averagePrice,
        .min_price = *minPrice,
        .max_price = *maxPrice
    };
}

std::optional<AppSettings> parseSettings(const nlohmann::json& value) {
    if (!value.is_object()) return std::nullopt;

    const auto id = toString(field(value, "id"));
    const auto establishmentName = toString(field(value, "establishmentName"));
    const auto darkMode = toBoolean(field(value, "darkMode"));
    const auto onboardingDone = toBoolean(field(value, "onboardingDone"));
    const auto threshold = toNumber(field(value, "priceAlertThreshold"));
    if (!id || !establishmentName || !darkMode || !onboardingDone || !threshold) return std::nullopt;

    return AppSettings{
        .id = *id,
        .establishment_name = *establishmentName,
        .dark_mode = *darkMode,
        .onboarding_done = *onboardingDone,
        .price_alert_threshold = *threshold,
        .ocr_api_key = std::nullopt
    };
}

}
