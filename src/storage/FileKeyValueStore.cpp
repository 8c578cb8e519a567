#include "storage/FileKeyValueStore.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace cuisine::logging;

namespace cuisine::storage {

static bool isValidKey(const std::string& key) {
    if (key.empty() || key.front() == '.') return false;
    for (const char c : key) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
                        || c == '.' || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

FileKeyValueStore::FileKeyValueStore(std::filesystem::path root) : root_(std::move(root)) {
    std::filesystem::create_directories(root_);
}

std::filesystem::path FileKeyValueStore::pathFor(const std::string& key) const {
    if (!isValidKey(key)) throw std::invalid_argument("Invalid preference key: " + key);
    return root_ / key;
}

std::optional<std::string> FileKeyValueStore::get(const std::string& key) const {
    const auto path = pathFor(key);
    std::lock_guard lock(mutex_);
    if (!std::filesystem::exists(path)) return std::nullopt;
    return util::readFileToString(path);
}

void FileKeyValueStore::set(const std::string& key, const std::string& value) {
    const auto path = pathFor(key);
    std::lock_guard lock(mutex_);
    util::writeFileAtomic(path, value);
    LogRegistry::storage()->trace("[FileKeyValueStore::set] Wrote {} bytes to {}", value.size(), path.string());
}

void FileKeyValueStore::remove(const std::string& key) {
    const auto path = pathFor(key);
    std::lock_guard lock(mutex_);
    if (std::filesystem::remove(path))
        LogRegistry::storage()->debug("[FileKeyValueStore::remove] Removed {}", path.string());
}

}
