#pragma once

#include "backup/AutoBackupScheduler.hpp"
#include "backup/BackupState.hpp"
#include "backup/PayloadBuilder.hpp"
#include "config/Config.hpp"
#include "storage/DataStore.hpp"
#include "storage/KeyValueStore.hpp"
#include "storage/SnapshotStore.hpp"
#include "types/BackupPayload.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace cuisine::backup {

enum class ImportStatus { Applied, InvalidBackup, PasswordRequired, DecryptionFailed, Failed };

std::string to_string(ImportStatus status);

struct ExportResult {
    bool ok{false};
    std::filesystem::path path;
    std::string msg;
};

struct ImportResult {
    ImportStatus status{ImportStatus::Failed};
    std::string msg;
    size_t records{0};

    [[nodiscard]] bool ok() const { return status == ImportStatus::Applied; }
};

// Entry point for settings screens: export, restore and the weekly auto-backup.
// None of the operations below let an exception escape; failures come back as results.
class BackupService {
public:
    struct Deps {
        std::shared_ptr<storage::DataStore> data;
        std::shared_ptr<storage::SnapshotStore> snapshots;
        std::shared_ptr<storage::KeyValueStore> prefs;
        std::shared_ptr<storage::KeyValueStore> legacy;
        util::Clock clock = util::systemClock;
    };

    BackupService(Deps deps, config::BackupConfig cfg);

    // Builds stores from the storage section: memory or postgres collections, file-backed
    // preferences under state_dir and the legacy snapshot under legacy_dir.
    static std::shared_ptr<BackupService> fromConfig(const config::Config& cfg);

    [[nodiscard]] types::BackupPayload buildBackupPayload() const;

    // Writes <prefix>-<YYYY-MM-DD>.json, or .enc when a password is given.
    ExportResult exportBackup(const std::optional<std::string>& password = std::nullopt);

    // Full restore: detect encryption, decrypt, parse, validate, then replace every collection at once.
    ImportResult importBackup(std::span<const uint8_t> bytes, const std::optional<std::string>& password = std::nullopt);

    ImportResult importBackupFile(const std::filesystem::path& path,
                                  const std::optional<std::string>& password = std::nullopt);

    AutoBackupResult runWeeklyAutoBackup();

    // Writes the stored snapshot verbatim to <auto_prefix>-<YYYY-MM-DD>.json. False when none is stored.
    bool exportStoredAutoBackup();

    [[nodiscard]] bool isAutoBackupEnabled() const;
    void setAutoBackupEnabled(bool enabled);

    [[nodiscard]] std::optional<util::Timestamp> lastBackupAt() const;

    void setOnBackupUpdated(BackupState::Listener listener);

    [[nodiscard]] const config::BackupConfig& config() const { return cfg_; }

private:
    Deps deps_;
    config::BackupConfig cfg_;
    std::shared_ptr<BackupState> state_;
    std::shared_ptr<PayloadBuilder> builder_;
    std::unique_ptr<AutoBackupScheduler> scheduler_;

    [[nodiscard]] std::filesystem::path exportPath(const std::string& prefix, const char* extension) const;
};

}
