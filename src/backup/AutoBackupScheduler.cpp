#include "backup/AutoBackupScheduler.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace cuisine::logging;
using namespace cuisine::storage;

namespace cuisine::backup {

std::string to_string(const AutoBackupResult result) {
    switch (result) {
        case AutoBackupResult::Done: return "done";
        case AutoBackupResult::Skipped: return "skipped";
        case AutoBackupResult::Failed: return "failed";
        default: throw std::invalid_argument("Unknown AutoBackupResult enum value");
    }
}

AutoBackupScheduler::AutoBackupScheduler(Deps deps) : deps_(std::move(deps)) {
    if (!deps_.builder || !deps_.snapshots || !deps_.state || !deps_.legacy)
        throw std::invalid_argument("AutoBackupScheduler: missing dependency");
    if (!deps_.clock) throw std::invalid_argument("AutoBackupScheduler: missing clock");
    if (deps_.interval.count() <= 0) throw std::invalid_argument("AutoBackupScheduler: interval must be positive");
}

AutoBackupResult AutoBackupScheduler::runWeekly() {
    std::lock_guard lock(mutex_);

    if (!deps_.state->isAutoBackupEnabled()) {
        LogRegistry::backup()->debug("[AutoBackupScheduler::runWeekly] Auto-backup disabled, skipping");
        return AutoBackupResult::Skipped;
    }

    const auto now = deps_.clock();
    if (const auto last = deps_.state->lastAutoBackupAt(); last && now - *last < deps_.interval) {
        LogRegistry::backup()->debug("[AutoBackupScheduler::runWeekly] Last auto-backup at {} is recent, skipping",
                                     util::timestampToIso(*last));
        return AutoBackupResult::Skipped;
    }

    const auto payload = deps_.builder->build();
    deps_.snapshots->put({
        .id = AUTO_BACKUP_SNAPSHOT_ID,
        .payload = types::serialize(payload, false),
        .created_at = now
    });

    deps_.state->markAutoBackup(now);
    deps_.state->markBackup(now);

    LogRegistry::backup()->info("[AutoBackupScheduler::runWeekly] Auto-backup snapshot written ({} records)",
                                payload.data.totalRecords());
    LogRegistry::audit()->info("[AutoBackupScheduler] Weekly snapshot refreshed at {}", util::timestampToIso(now));
    return AutoBackupResult::Done;
}

std::optional<std::string> AutoBackupScheduler::readStoredSnapshot() {
    std::lock_guard lock(mutex_);

    if (const auto stored = deps_.snapshots->get(AUTO_BACKUP_SNAPSHOT_ID); stored && !stored->payload.empty())
        return stored->payload;

    const auto legacy = deps_.legacy->get(LEGACY_SNAPSHOT_KEY);
    if (!legacy || legacy->empty()) return std::nullopt;

    deps_.snapshots->put({
        .id = AUTO_BACKUP_SNAPSHOT_ID,
        .payload = *legacy,
        .created_at = deps_.clock()
    });
    deps_.legacy->remove(LEGACY_SNAPSHOT_KEY);

    LogRegistry::audit()->info("[AutoBackupScheduler] Migrated legacy auto-backup snapshot ({} bytes)", legacy->size());
    return legacy;
}

}
