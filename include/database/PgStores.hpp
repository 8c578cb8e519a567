#pragma once

#include "storage/DataStore.hpp"
#include "storage/SnapshotStore.hpp"

namespace cuisine::database {

// Entities live in cuisine_records as jsonb documents (storage form), ordered by position.
// Requires Transactions::init().
class PgDataStore final : public storage::DataStore {
public:
    [[nodiscard]] types::Dataset getAll() const override;

    // Delete and re-insert every collection in a single transaction. A duplicate id within a
    // collection violates the primary key and rolls the whole replace back.
    void bulkReplace(const types::Dataset& data) override;

    void clear() override;
};

class PgSnapshotStore final : public storage::SnapshotStore {
public:
    [[nodiscard]] std::optional<storage::BackupSnapshot> get(const std::string& id) const override;
    void put(const storage::BackupSnapshot& snapshot) override;
    void remove(const std::string& id) override;
};

}
