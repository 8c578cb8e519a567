#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace cuisine::config {

class ConfigRegistry {
public:
    // Loads the YAML file once; later calls are ignored.
    static void init(const std::filesystem::path& path);

    // Installs an already-built configuration once; used by embedders and tests.
    static void init(Config cfg);

    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace cuisine::config
