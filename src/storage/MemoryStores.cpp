#include "storage/MemoryStores.hpp"

#include <stdexcept>
#include <unordered_set>

namespace cuisine::storage {

MemoryDataStore::MemoryDataStore(types::Dataset initial) : data_(std::move(initial)) {}

types::Dataset MemoryDataStore::getAll() const {
    std::shared_lock lock(mutex_);
    return data_;
}

// Same (collection, id) uniqueness the PostgreSQL primary key enforces.
static void requireUniqueIds(const types::Dataset& data) {
    for (const auto c : types::ALL_COLLECTIONS) {
        std::unordered_set<std::string> seen;
        for (const auto& id : data.ids(c))
            if (!seen.insert(id).second)
                throw std::invalid_argument("Duplicate id '" + id + "' in collection " + types::to_string(c));
    }
}

void MemoryDataStore::bulkReplace(const types::Dataset& data) {
    requireUniqueIds(data);
    auto copy = data;
    std::unique_lock lock(mutex_);
    data_ = std::move(copy);
}

void MemoryDataStore::clear() {
    std::unique_lock lock(mutex_);
    data_ = types::Dataset{};
}

std::optional<BackupSnapshot> MemorySnapshotStore::get(const std::string& id) const {
    std::lock_guard lock(mutex_);
    const auto it = snapshots_.find(id);
    if (it == snapshots_.end()) return std::nullopt;
    return it->second;
}

void MemorySnapshotStore::put(const BackupSnapshot& snapshot) {
    std::lock_guard lock(mutex_);
    snapshots_[snapshot.id] = snapshot;
    ++writes_;
}

void MemorySnapshotStore::remove(const std::string& id) {
    std::lock_guard lock(mutex_);
    snapshots_.erase(id);
}

size_t MemorySnapshotStore::writeCount() const {
    std::lock_guard lock(mutex_);
    return writes_;
}

std::optional<std::string> MemoryKeyValueStore::get(const std::string& key) const {
    std::lock_guard lock(mutex_);
    const auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

void MemoryKeyValueStore::set(const std::string& key, const std::string& value) {
    std::lock_guard lock(mutex_);
    values_[key] = value;
}

void MemoryKeyValueStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    values_.erase(key);
}

}
