#include "backup/BackupState.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace cuisine::logging;

namespace cuisine::backup {

BackupState::BackupState(std::shared_ptr<storage::KeyValueStore> prefs) : prefs_(std::move(prefs)) {
    if (!prefs_) throw std::invalid_argument("BackupState requires a preference store");
}

bool BackupState::isAutoBackupEnabled() const {
    const auto value = prefs_->get(AUTO_BACKUP_ENABLED_KEY);
    return !value || *value != "0";
}

void BackupState::setAutoBackupEnabled(const bool enabled) const {
    prefs_->set(AUTO_BACKUP_ENABLED_KEY, enabled ? "1" : "0");
    LogRegistry::backup()->info("[BackupState] Auto-backup {}", enabled ? "enabled" : "disabled");
}

std::optional<util::Timestamp> BackupState::readTimestamp(const char* key) const {
    const auto raw = prefs_->get(key);
    if (!raw) return std::nullopt;

    const auto ts = util::parseIsoTimestamp(*raw);
    if (!ts) LogRegistry::backup()->warn("[BackupState] Ignoring unreadable marker {}: '{}'", key, *raw);
    return ts;
}

std::optional<util::Timestamp> BackupState::lastBackupAt() const { return readTimestamp(LAST_BACKUP_KEY); }

std::optional<util::Timestamp> BackupState::lastAutoBackupAt() const { return readTimestamp(LAST_AUTO_BACKUP_KEY); }

void BackupState::markBackup(const util::Timestamp at) const {
    prefs_->set(LAST_BACKUP_KEY, util::timestampToIso(at));

    Listener listener;
    {
        std::lock_guard lock(listenerMutex_);
        listener = listener_;
    }
    if (!listener) return;

    try {
        listener(at);
    } catch (const std::exception& e) {
        LogRegistry::backup()->warn("[BackupState] Backup listener failed: {}", e.what());
    }
}

void BackupState::markAutoBackup(const util::Timestamp at) const {
    prefs_->set(LAST_AUTO_BACKUP_KEY, util::timestampToIso(at));
}

void BackupState::setListener(Listener listener) {
    std::lock_guard lock(listenerMutex_);
    listener_ = std::move(listener);
}

}
