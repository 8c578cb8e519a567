#pragma once

#include "util/timestamp.hpp"

#include <optional>
#include <string>

namespace cuisine::storage {

struct BackupSnapshot {
    std::string id;
    std::string payload;    // serialized BackupPayload, opaque to the store
    util::Timestamp created_at{};

    bool operator==(const BackupSnapshot&) const = default;
};

class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    [[nodiscard]] virtual std::optional<BackupSnapshot> get(const std::string& id) const = 0;

    // Inserts or overwrites the snapshot with the same id.
    virtual void put(const BackupSnapshot& snapshot) = 0;

    virtual void remove(const std::string& id) = 0;
};

}
