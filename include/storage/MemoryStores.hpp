#pragma once

#include "storage/DataStore.hpp"
#include "storage/KeyValueStore.hpp"
#include "storage/SnapshotStore.hpp"

#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace cuisine::storage {

class MemoryDataStore final : public DataStore {
public:
    MemoryDataStore() = default;
    explicit MemoryDataStore(types::Dataset initial);

    [[nodiscard]] types::Dataset getAll() const override;
    void bulkReplace(const types::Dataset& data) override;
    void clear() override;

private:
    mutable std::shared_mutex mutex_;
    types::Dataset data_;
};

class MemorySnapshotStore final : public SnapshotStore {
public:
    [[nodiscard]] std::optional<BackupSnapshot> get(const std::string& id) const override;
    void put(const BackupSnapshot& snapshot) override;
    void remove(const std::string& id) override;

    [[nodiscard]] size_t writeCount() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, BackupSnapshot> snapshots_;
    size_t writes_{0};
};

class MemoryKeyValueStore final : public KeyValueStore {
public:
    [[nodiscard]] std::optional<std::string> get(const std::string& key) const override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

}
