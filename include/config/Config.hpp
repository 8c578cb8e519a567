#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace cuisine::config {

struct BackupConfig {
    std::filesystem::path export_dir = "/var/lib/cuisine/exports";
    std::string filename_prefix = "cuisine-backup";
    std::string auto_backup_prefix = "cuisine-auto-backup";
    unsigned int auto_backup_interval_days = 7;
    unsigned int auto_backup_check_minutes = 60;
};

struct StorageConfig {
    std::string backend = "memory";                               // memory | postgres
    std::filesystem::path state_dir = "/var/lib/cuisine/state";   // preference markers
    std::filesystem::path legacy_dir = "/var/lib/cuisine/legacy"; // pre-database snapshot location
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "cuisine";
    std::string user = "cuisine";
    std::string password;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum cuisine = spdlog::level::info;   // Startup, shutdown, service lifecycle
    spdlog::level::level_enum backup  = spdlog::level::info;   // Export, import, auto-backup decisions
    spdlog::level::level_enum crypto  = spdlog::level::warn;   // Rare; surface failure to encrypt/decrypt
    spdlog::level::level_enum storage = spdlog::level::warn;   // Underlying I/O issues
    spdlog::level::level_enum db      = spdlog::level::err;    // Only if DB is unreachable, failed tx
    spdlog::level::level_enum types   = spdlog::level::err;    // Violations of invariants or schema errors
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/cuisine";
    LogLevelsConfig levels;
};

struct Config {
    BackupConfig backup;
    StorageConfig storage;
    DatabaseConfig database;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);
void saveConfig(const Config& cfg, const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const BackupConfig& c);
void from_json(const nlohmann::json& j, BackupConfig& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void from_json(const nlohmann::json& j, StorageConfig& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void from_json(const nlohmann::json& j, DatabaseConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

} // namespace cuisine::config
