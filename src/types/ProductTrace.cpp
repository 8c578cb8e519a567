#include "types/ProductTrace.hpp"
#include "types/json_util.hpp"

using namespace cuisine::types::json_util;

namespace cuisine::types {

void to_json(nlohmann::json& j, const ProductTrace& p) {
    j = {
        {"id", p.id},
        {"productName", p.product_name},
        {"supplier", p.supplier},
        {"lotNumber", p.lot_number},
        {"receptionDate", timestamp(p.reception_date)},
        {"expirationDate", timestamp(p.expiration_date)},
        {"category", p.category},
        {"allergens", p.allergens},
        {"scannedAt", timestamp(p.scanned_at)}
    };
    put_optional(j, "barcode", p.barcode);
    put_optional(j, "photoUrl", p.photo_url);
    if (p.photo) j["photo"] = blob(*p.photo);
}

void from_json(const nlohmann::json& j, ProductTrace& p) {
    p.id = j.at("id").get<std::string>();
    p.barcode = get_optional<std::string>(j, "barcode");
    p.photo_url = get_optional<std::string>(j, "photoUrl");
    p.product_name = j.at("productName").get<std::string>();
    p.supplier = j.at("supplier").get<std::string>();
    p.lot_number = j.at("lotNumber").get<std::string>();
    p.reception_date = get_timestamp(j, "receptionDate");
    p.expiration_date = get_timestamp(j, "expirationDate");
    p.category = j.at("category").get<std::string>();
    p.allergens = j.value("allergens", std::vector<std::string>{});
    p.scanned_at = get_timestamp(j, "scannedAt");

    if (j.contains("photo") && !j.at("photo").is_null()) p.photo = get_blob(j.at("photo"));
    else p.photo.reset();
}

}
