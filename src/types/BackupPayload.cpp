#include "types/BackupPayload.hpp"
#include "types/json_util.hpp"

namespace cuisine::types {

void to_json(nlohmann::json& j, const BackupPayload& p) {
    j = {
        {"version", p.version},
        {"exportedAt", json_util::timestamp(p.exported_at)}
    };
    to_json(j, p.data);
}

std::string serialize(const BackupPayload& p, const bool pretty) {
    const nlohmann::json j = p;
    return pretty ? j.dump(2) : j.dump();
}

}
