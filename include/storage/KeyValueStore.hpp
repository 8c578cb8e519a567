#pragma once

#include <optional>
#include <string>

namespace cuisine::storage {

// Small string preferences (backup markers, legacy snapshot).
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) const = 0;

    virtual void set(const std::string& key, const std::string& value) = 0;

    virtual void remove(const std::string& key) = 0;
};

}
