#pragma once

#include "storage/KeyValueStore.hpp"
#include "util/timestamp.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cuisine::backup {

// Preference keys, shared with earlier releases of the app.
inline constexpr const char* LAST_BACKUP_KEY = "cuisine_backup_last_at";
inline constexpr const char* AUTO_BACKUP_ENABLED_KEY = "cuisine_backup_auto_enabled";
inline constexpr const char* LAST_AUTO_BACKUP_KEY = "cuisine_backup_last_auto_at";
inline constexpr const char* LEGACY_SNAPSHOT_KEY = "cuisine_auto_backup_snapshot";

// Persistent backup markers kept in the preference store.
class BackupState {
public:
    using Listener = std::function<void(util::Timestamp)>;

    explicit BackupState(std::shared_ptr<storage::KeyValueStore> prefs);

    // Enabled unless explicitly stored as "0".
    [[nodiscard]] bool isAutoBackupEnabled() const;
    void setAutoBackupEnabled(bool enabled) const;

    // nullopt when never written or unreadable.
    [[nodiscard]] std::optional<util::Timestamp> lastBackupAt() const;
    [[nodiscard]] std::optional<util::Timestamp> lastAutoBackupAt() const;

    // Records a manual or automatic backup and notifies the listener.
    void markBackup(util::Timestamp at) const;
    void markAutoBackup(util::Timestamp at) const;

    void setListener(Listener listener);

private:
    std::shared_ptr<storage::KeyValueStore> prefs_;
    mutable std::mutex listenerMutex_;
    Listener listener_;

    [[nodiscard]] std::optional<util::Timestamp> readTimestamp(const char* key) const;
};

}
