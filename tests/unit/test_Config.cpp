#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

using namespace cuisine::config;
using cuisine::test::TempDir;
using cuisine::util::writeFile;

TEST(ConfigTest, DefaultsMatchTheDeployedLayout) {
    const Config cfg;
    EXPECT_EQ(cfg.backup.filename_prefix, "cuisine-backup");
    EXPECT_EQ(cfg.backup.auto_backup_prefix, "cuisine-auto-backup");
    EXPECT_EQ(cfg.backup.auto_backup_interval_days, 7u);
    EXPECT_EQ(cfg.storage.backend, "memory");
    EXPECT_EQ(cfg.database.port, 5432);
}

TEST(ConfigTest, PartialYamlKeepsDefaults) {
    TempDir dir;
    const auto path = dir.path() / "config.yaml";
    writeFile(path, std::string_view(
        "backup:\n"
        "  export_dir: /srv/exports\n"
        "  auto_backup_interval_days: 3\n"
        "storage:\n"
        "  backend: postgres\n"
        "database:\n"
        "  password: hunter2\n"));

    const auto cfg = loadConfig(path);
    EXPECT_EQ(cfg.backup.export_dir.string(), "/srv/exports");
    EXPECT_EQ(cfg.backup.auto_backup_interval_days, 3u);
    EXPECT_EQ(cfg.backup.filename_prefix, "cuisine-backup");
    EXPECT_EQ(cfg.storage.backend, "postgres");
    EXPECT_EQ(cfg.database.password, "hunter2");
    EXPECT_EQ(cfg.database.host, "localhost");
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.crypto, spdlog::level::warn);
}

TEST(ConfigTest, SaveThenLoadPreservesEverything) {
    TempDir dir;
    const auto path = dir.path() / "config.yaml";

    Config cfg;
    cfg.backup.export_dir = dir.path() / "exports";
    cfg.backup.auto_backup_check_minutes = 15;
    cfg.storage.state_dir = dir.path() / "state";
    cfg.database.user = "chef";
    cfg.database.password = "s3cret";
    cfg.logging.levels.file_log_level = spdlog::level::debug;
    cfg.logging.levels.subsystem_levels.db = spdlog::level::trace;
    saveConfig(cfg, path);

    const auto loaded = loadConfig(path);
    EXPECT_EQ(loaded.backup.export_dir.string(), cfg.backup.export_dir.string());
    EXPECT_EQ(loaded.backup.auto_backup_check_minutes, 15u);
    EXPECT_EQ(loaded.storage.state_dir.string(), cfg.storage.state_dir.string());
    EXPECT_EQ(loaded.database.user, "chef");
    EXPECT_EQ(loaded.database.password, "s3cret");
    EXPECT_EQ(loaded.logging.levels.file_log_level, spdlog::level::debug);
    EXPECT_EQ(loaded.logging.levels.subsystem_levels.db, spdlog::level::trace);
}

TEST(ConfigTest, JsonNeverCarriesTheDatabasePassword) {
    Config cfg;
    cfg.database.password = "s3cret";
    const nlohmann::json j = cfg;

    EXPECT_FALSE(j.at("database").contains("password"));
    EXPECT_EQ(j.dump().find("s3cret"), std::string::npos);
    EXPECT_EQ(j.at("logging").at("levels").at("subsystem_levels").at("crypto").get<std::string>(), "warning");
}

TEST(ConfigTest, JsonRoundTripKeepsNonSecretFields) {
    Config cfg;
    cfg.backup.filename_prefix = "bistro";
    cfg.storage.backend = "postgres";
    cfg.logging.levels.console_log_level = spdlog::level::err;

    Config copy;
    nlohmann::json(cfg).get_to(copy);
    EXPECT_EQ(copy.backup.filename_prefix, "bistro");
    EXPECT_EQ(copy.storage.backend, "postgres");
    EXPECT_EQ(copy.logging.levels.console_log_level, spdlog::level::err);
}

TEST(ConfigTest, MissingFileThrows) {
    TempDir dir;
    EXPECT_ANY_THROW(loadConfig(dir.path() / "absent.yaml"));
}

TEST(ConfigRegistryTest, TestEnvironmentIsInstalled) {
    ASSERT_TRUE(ConfigRegistry::isInitialized());
    EXPECT_EQ(ConfigRegistry::get().logging.levels.console_log_level, spdlog::level::off);
}
