#include "backup/BackupService.hpp"
#include "backup/PayloadValidator.hpp"
#include "crypto/BackupCipher.hpp"
#include "database/PgStores.hpp"
#include "database/Transactions.hpp"
#include "storage/FileKeyValueStore.hpp"
#include "storage/MemoryStores.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace cuisine::types;
using namespace cuisine::storage;
using namespace cuisine::logging;

namespace cuisine::backup {

std::string to_string(const ImportStatus status) {
    switch (status) {
        case ImportStatus::Applied: return "applied";
        case ImportStatus::InvalidBackup: return "invalid_backup";
        case ImportStatus::PasswordRequired: return "password_required";
        case ImportStatus::DecryptionFailed: return "decryption_failed";
        case ImportStatus::Failed: return "failed";
        default: throw std::invalid_argument("Unknown ImportStatus enum value");
    }
}

BackupService::BackupService(Deps deps, config::BackupConfig cfg) : deps_(std::move(deps)), cfg_(std::move(cfg)) {
    if (!deps_.data || !deps_.snapshots || !deps_.prefs || !deps_.legacy)
        throw std::invalid_argument("BackupService: missing store");
    if (cfg_.auto_backup_interval_days == 0)
        throw std::invalid_argument("BackupService: auto_backup_interval_days must be positive");

    state_ = std::make_shared<BackupState>(deps_.prefs);
    builder_ = std::make_shared<PayloadBuilder>(deps_.data, deps_.clock);
    scheduler_ = std::make_unique<AutoBackupScheduler>(AutoBackupScheduler::Deps{
        .builder = builder_,
        .snapshots = deps_.snapshots,
        .state = state_,
        .legacy = deps_.legacy,
        .clock = deps_.clock,
        .interval = std::chrono::days{cfg_.auto_backup_interval_days}
    });
}

std::shared_ptr<BackupService> BackupService::fromConfig(const config::Config& cfg) {
    Deps deps;

    if (cfg.storage.backend == "memory") {
        deps.data = std::make_shared<MemoryDataStore>();
        deps.snapshots = std::make_shared<MemorySnapshotStore>();
    } else if (cfg.storage.backend == "postgres") {
        if (!database::Transactions::isInitialized()) database::Transactions::init(cfg.database);
        deps.data = std::make_shared<database::PgDataStore>();
        deps.snapshots = std::make_shared<database::PgSnapshotStore>();
    } else {
        throw std::invalid_argument("Unknown storage backend: " + cfg.storage.backend);
    }

    deps.prefs = std::make_shared<FileKeyValueStore>(cfg.storage.state_dir);
    deps.legacy = std::make_shared<FileKeyValueStore>(cfg.storage.legacy_dir);

    LogRegistry::backup()->info("[BackupService::fromConfig] Using {} storage backend", cfg.storage.backend);
    return std::make_shared<BackupService>(std::move(deps), cfg.backup);
}

BackupPayload BackupService::buildBackupPayload() const { return builder_->build(); }

std::filesystem::path BackupService::exportPath(const std::string& prefix, const char* extension) const {
    return cfg_.export_dir / (prefix + "-" + util::dateString(deps_.clock()) + extension);
}

ExportResult BackupService::exportBackup(const std::optional<std::string>& password) {
    try {
        if (password && password->empty()) return {false, {}, "Backup password must not be empty"};

        const auto json = serialize(builder_->build(), true);
        std::filesystem::create_directories(cfg_.export_dir);

        std::filesystem::path path;
        if (password) {
            const auto blob = crypto::encryptBackup(json, *password);
            path = exportPath(cfg_.filename_prefix, ".enc");
            util::writeFileAtomic(path, {reinterpret_cast<const char*>(blob.data()), blob.size()});
        } else {
            path = exportPath(cfg_.filename_prefix, ".json");
            util::writeFileAtomic(path, json);
        }

        state_->markBackup(deps_.clock());

        LogRegistry::backup()->info("[BackupService::exportBackup] Backup written to {}", path.string());
        LogRegistry::audit()->info("[BackupService] Exported {} backup to {}", password ? "encrypted" : "plaintext",
                                   path.string());
        return {true, path, "Backup exported"};
    } catch (const std::exception& e) {
        LogRegistry::backup()->error("[BackupService::exportBackup] Export failed: {}", e.what());
        return {false, {}, "Backup failed"};
    }
}

ImportResult BackupService::importBackup(const std::span<const uint8_t> bytes, const std::optional<std::string>& password) {
    try {
        std::string text;
        if (crypto::isEncryptedBackup(bytes)) {
            if (!password || password->empty()) return {ImportStatus::PasswordRequired, "This backup is encrypted", 0};
            try {
                text = crypto::decryptBackup(bytes, *password);
            } catch (const crypto::DecryptionError&) {
                LogRegistry::backup()->warn("[BackupService::importBackup] Could not decrypt backup");
                return {ImportStatus::DecryptionFailed, "Restore failed: wrong password or corrupted file", 0};
            }
        } else {
            text.assign(bytes.begin(), bytes.end());
        }

        const auto payload = validateBackupImportText(text);
        if (!payload) {
            LogRegistry::backup()->warn("[BackupService::importBackup] Rejected invalid backup document");
            return {ImportStatus::InvalidBackup, "The file is not a valid backup", 0};
        }

        deps_.data->bulkReplace(payload->data);

        const auto records = payload->data.totalRecords();
        LogRegistry::backup()->info("[BackupService::importBackup] Restored {} records (exported at {})", records,
                                    util::timestampToIso(payload->exported_at));
        LogRegistry::audit()->info("[BackupService] Backup from {} applied ({} records)",
                                   util::timestampToIso(payload->exported_at), records);
        return {ImportStatus::Applied, "Backup restored", records};
    } catch (const std::exception& e) {
        LogRegistry::backup()->error("[BackupService::importBackup] Restore failed: {}", e.what());
        return {ImportStatus::Failed, "Restore failed", 0};
    }
}

ImportResult BackupService::importBackupFile(const std::filesystem::path& path, const std::optional<std::string>& password) {
    std::vector<uint8_t> bytes;
    try {
        bytes = util::readFileToVector(path);
    } catch (const std::exception& e) {
        LogRegistry::backup()->error("[BackupService::importBackupFile] {}", e.what());
        return {ImportStatus::Failed, "Restore failed", 0};
    }
    return importBackup(bytes, password);
}

AutoBackupResult BackupService::runWeeklyAutoBackup() {
    try {
        return scheduler_->runWeekly();
    } catch (const std::exception& e) {
        LogRegistry::backup()->error("[BackupService::runWeeklyAutoBackup] Auto-backup failed: {}", e.what());
        return AutoBackupResult::Failed;
    }
}

bool BackupService::exportStoredAutoBackup() {
    try {
        const auto raw = scheduler_->readStoredSnapshot();
        if (!raw) {
            LogRegistry::backup()->info("[BackupService::exportStoredAutoBackup] No auto-backup snapshot stored");
            return false;
        }

        std::filesystem::create_directories(cfg_.export_dir);
        const auto path = exportPath(cfg_.auto_backup_prefix, ".json");
        util::writeFileAtomic(path, *raw);
        state_->markBackup(deps_.clock());

        LogRegistry::audit()->info("[BackupService] Exported stored auto-backup to {}", path.string());
        return true;
    } catch (const std::exception& e) {
        LogRegistry::backup()->error("[BackupService::exportStoredAutoBackup] Export failed: {}", e.what());
        return false;
    }
}

bool BackupService::isAutoBackupEnabled() const {
    try {
        return state_->isAutoBackupEnabled();
    } catch (const std::exception& e) {
        LogRegistry::backup()->error("[BackupService::isAutoBackupEnabled] {}", e.what());
        return true;
    }
}

void BackupService::setAutoBackupEnabled(const bool enabled) {
    try {
        state_->setAutoBackupEnabled(enabled);
    } catch (const std::exception& e) {
        LogRegistry::backup()->error("[BackupService::setAutoBackupEnabled] {}", e.what());
    }
}

std::optional<util::Timestamp> BackupService::lastBackupAt() const {
    try {
        return state_->lastBackupAt();
    } catch (const std::exception& e) {
        LogRegistry::backup()->error("[BackupService::lastBackupAt] {}", e.what());
        return std::nullopt;
    }
}

void BackupService::setOnBackupUpdated(BackupState::Listener listener) { state_->setListener(std::move(listener)); }

}
