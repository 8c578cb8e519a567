#pragma once

#include "types/Dataset.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <string>

namespace cuisine::types {

constexpr int64_t CURRENT_BACKUP_VERSION = 1;

// Exportable snapshot of the local dataset. Never persisted as such; only its collections are.
struct BackupPayload {
    int64_t version{CURRENT_BACKUP_VERSION};
    util::Timestamp exported_at{};
    Dataset data;

    bool operator==(const BackupPayload&) const = default;
};

// Flat document: {version, exportedAt, equipment, temperatureRecords, ..., settings}
void to_json(nlohmann::json& j, const BackupPayload& p);

// Pretty output uses a two-space indent (export files); compact output is used for snapshots.
std::string serialize(const BackupPayload& p, bool pretty);

}
