#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace cuisine::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["backup"]) YAML::convert<BackupConfig>::decode(node, cfg.backup);
    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

void saveConfig(const Config& cfg, const std::filesystem::path& path) {
    YAML::Node root;
    root["backup"] = cfg.backup;
    root["storage"] = cfg.storage;
    root["database"] = cfg.database;
    root["logging"] = cfg.logging;

    YAML::Emitter out;
    out << root;

    std::ofstream file(path);
    if (!file.is_open()) throw std::runtime_error("Failed to write config file: " + path.string());
    file << out.c_str() << '\n';
}

static std::string level_to_string(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

static spdlog::level::level_enum level_from_json(const nlohmann::json& j, const char* key,
                                                 const spdlog::level::level_enum def) {
    if (!j.contains(key)) return def;
    return spdlog::level::from_str(j.at(key).get<std::string>());
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"backup", c.backup},
        {"storage", c.storage},
        {"database", c.database},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("backup")) j.at("backup").get_to(c.backup);
    if (j.contains("storage")) j.at("storage").get_to(c.storage);
    if (j.contains("database")) j.at("database").get_to(c.database);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const BackupConfig& c) {
    j = {
        {"export_dir", c.export_dir.string()},
        {"filename_prefix", c.filename_prefix},
        {"auto_backup_prefix", c.auto_backup_prefix},
        {"auto_backup_interval_days", c.auto_backup_interval_days},
        {"auto_backup_check_minutes", c.auto_backup_check_minutes}
    };
}

void from_json(const nlohmann::json& j, BackupConfig& c) {
    const BackupConfig def;
    c.export_dir = j.value("export_dir", def.export_dir.string());
    c.filename_prefix = j.value("filename_prefix", def.filename_prefix);
    c.auto_backup_prefix = j.value("auto_backup_prefix", def.auto_backup_prefix);
    c.auto_backup_interval_days = j.value("auto_backup_interval_days", def.auto_backup_interval_days);
    c.auto_backup_check_minutes = j.value("auto_backup_check_minutes", def.auto_backup_check_minutes);
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"backend", c.backend},
        {"state_dir", c.state_dir.string()},
        {"legacy_dir", c.legacy_dir.string()}
    };
}

void from_json(const nlohmann::json& j, StorageConfig& c) {
    const StorageConfig def;
    c.backend = j.value("backend", def.backend);
    c.state_dir = j.value("state_dir", def.state_dir.string());
    c.legacy_dir = j.value("legacy_dir", def.legacy_dir.string());
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    // password never leaves the YAML file
    j = {
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user}
    };
}

void from_json(const nlohmann::json& j, DatabaseConfig& c) {
    c.host = j.value("host", "localhost");
    c.port = j.value("port", static_cast<uint16_t>(5432));
    c.name = j.value("name", "cuisine");
    c.user = j.value("user", "cuisine");
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"cuisine", level_to_string(c.cuisine)},
        {"backup", level_to_string(c.backup)},
        {"crypto", level_to_string(c.crypto)},
        {"storage", level_to_string(c.storage)},
        {"db", level_to_string(c.db)},
        {"types", level_to_string(c.types)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.cuisine = level_from_json(j, "cuisine", spdlog::level::info);
    c.backup = level_from_json(j, "backup", spdlog::level::info);
    c.crypto = level_from_json(j, "crypto", spdlog::level::warn);
    c.storage = level_from_json(j, "storage", spdlog::level::warn);
    c.db = level_from_json(j, "db", spdlog::level::err);
    c.types = level_from_json(j, "types", spdlog::level::err);
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", level_to_string(c.console_log_level)},
        {"file_log_level", level_to_string(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = level_from_json(j, "console_log_level", spdlog::level::info);
    c.file_log_level = level_from_json(j, "file_log_level", spdlog::level::warn);
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", std::string("/var/log/cuisine"));
    if (j.contains("levels")) j.at("levels").get_to(c.levels);
}

} // namespace cuisine::config
