#pragma once

#include "storage/KeyValueStore.hpp"

#include <filesystem>
#include <mutex>

namespace cuisine::storage {

// One file per key under root. Keys are limited to [A-Za-z0-9._-] and may not start with '.'.
class FileKeyValueStore final : public KeyValueStore {
public:
    explicit FileKeyValueStore(std::filesystem::path root);

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    mutable std::mutex mutex_;

    [[nodiscard]] std::filesystem::path pathFor(const std::string& key) const;
};

}
