#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace cuisine::config;

template<>
struct convert<BackupConfig> {
    static Node encode(const BackupConfig& rhs) {
        Node node;
        node["export_dir"] = rhs.export_dir.string();
        node["filename_prefix"] = rhs.filename_prefix;
        node["auto_backup_prefix"] = rhs.auto_backup_prefix;
        node["auto_backup_interval_days"] = rhs.auto_backup_interval_days;
        node["auto_backup_check_minutes"] = rhs.auto_backup_check_minutes;
        return node;
    }

    static bool decode(const Node& node, BackupConfig& rhs) {
        if (!node.IsMap()) return false;
        const BackupConfig def;
        rhs.export_dir = node["export_dir"].as<std::string>(def.export_dir.string());
        rhs.filename_prefix = node["filename_prefix"].as<std::string>(def.filename_prefix);
        rhs.auto_backup_prefix = node["auto_backup_prefix"].as<std::string>(def.auto_backup_prefix);
        rhs.auto_backup_interval_days = node["auto_backup_interval_days"].as<unsigned int>(def.auto_backup_interval_days);
        rhs.auto_backup_check_minutes = node["auto_backup_check_minutes"].as<unsigned int>(def.auto_backup_check_minutes);
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["backend"] = rhs.backend;
        node["state_dir"] = rhs.state_dir.string();
        node["legacy_dir"] = rhs.legacy_dir.string();
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        const StorageConfig def;
        rhs.backend = node["backend"].as<std::string>(def.backend);
        rhs.state_dir = node["state_dir"].as<std::string>(def.state_dir.string());
        rhs.legacy_dir = node["legacy_dir"].as<std::string>(def.legacy_dir.string());
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["password"] = rhs.password;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("cuisine");
        rhs.user = node["user"].as<std::string>("cuisine");
        rhs.password = node["password"].as<std::string>("");
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["cuisine"] = to_std_string(spdlog::level::to_string_view(rhs.cuisine));
        node["backup"]  = to_std_string(spdlog::level::to_string_view(rhs.backup));
        node["crypto"]  = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["storage"] = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["db"]      = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["types"]   = to_std_string(spdlog::level::to_string_view(rhs.types));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.cuisine = spdlog::level::from_str(node["cuisine"].as<std::string>("info"));
        rhs.backup = spdlog::level::from_str(node["backup"].as<std::string>("info"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warning"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warning"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("error"));
        rhs.types = spdlog::level::from_str(node["types"].as<std::string>("error"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warning"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/cuisine");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
