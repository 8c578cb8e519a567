#pragma once

#include "backup/BackupState.hpp"
#include "backup/PayloadBuilder.hpp"
#include "storage/KeyValueStore.hpp"
#include "storage/SnapshotStore.hpp"
#include "util/timestamp.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cuisine::backup {

inline constexpr const char* AUTO_BACKUP_SNAPSHOT_ID = "weekly";

// Failed is only reported by callers that catch storage errors around runWeekly().
enum class AutoBackupResult { Done, Skipped, Failed };

std::string to_string(AutoBackupResult result);

// Keeps one rolling snapshot in the snapshot store, refreshed at most once per interval.
class AutoBackupScheduler {
public:
    struct Deps {
        std::shared_ptr<PayloadBuilder> builder;
        std::shared_ptr<storage::SnapshotStore> snapshots;
        std::shared_ptr<BackupState> state;
        std::shared_ptr<storage::KeyValueStore> legacy;   // pre-snapshot-store location
        util::Clock clock = util::systemClock;
        std::chrono::milliseconds interval = std::chrono::days{7};
    };

    explicit AutoBackupScheduler(Deps deps);

    // Safe to call on every start: disabled or not yet due -> Skipped.
    // Storage failures propagate to the caller.
    AutoBackupResult runWeekly();

    // Stored snapshot, migrating a legacy copy into the snapshot store on first read.
    [[nodiscard]] std::optional<std::string> readStoredSnapshot();

    [[nodiscard]] std::chrono::milliseconds interval() const { return deps_.interval; }

private:
    Deps deps_;
    std::mutex mutex_;
};

}
