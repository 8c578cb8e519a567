#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <stdexcept>
#include <utility>
#include <vector>

namespace cuisine::logging {

void LogRegistry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;
    main_log_path_  = log_dir_ / "cuisine.log";
    audit_log_path_ = log_dir_ / "audit.log";
    std::filesystem::create_directories(log_dir_);

    const auto& levels = config::ConfigRegistry::get().logging.levels;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(levels.console_log_level);
    console_sink_->set_pattern(LOG_FORMAT);

    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    const auto& sub = levels.subsystem_levels;
    const std::vector<std::pair<std::string, spdlog::level::level_enum>> subsystems = {
        {"cuisine", sub.cuisine},
        {"backup",  sub.backup},
        {"crypto",  sub.crypto},
        {"storage", sub.storage},
        {"db",      sub.db},
        {"types",   sub.types}
    };

    for (const auto& [name, level] : subsystems) {
        const auto logger = std::make_shared<spdlog::logger>(name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }

    // restores and auto-backups, appended and never rotated
    audit_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(audit_log_path_.string(), false);
    audit_file_sink_->set_pattern(LOG_FORMAT);
    const auto audit = std::make_shared<spdlog::logger>("audit", audit_file_sink_);
    audit->set_level(spdlog::level::info);
    audit->flush_on(spdlog::level::info);
    spdlog::register_logger(audit);

    initialized_ = true;
    spdlog::get("cuisine")->info("[LogRegistry] Initialized, writing to {}", log_dir_.string());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    if (auto logger = spdlog::get(name)) return logger;
    if (!initialized_) throw std::runtime_error("[LogRegistry] Not initialized, cannot get logger: " + name);
    throw std::runtime_error("[LogRegistry] Unknown logger: " + name);
}

bool LogRegistry::isInitialized() { return initialized_; }

}
