#include "services/AutoBackupService.hpp"
#include "backup/BackupService.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace cuisine::services;
using namespace cuisine::backup;
using namespace cuisine::logging;

AutoBackupService::AutoBackupService(std::shared_ptr<BackupService> backups, const std::chrono::minutes checkInterval)
    : AsyncService("AutoBackupService"), backups_(std::move(backups)), check_interval_(checkInterval) {
    if (!backups_) throw std::invalid_argument("AutoBackupService requires a BackupService");
    if (check_interval_.count() <= 0) throw std::invalid_argument("AutoBackupService: check interval must be positive");
}

AutoBackupService::~AutoBackupService() { stop(); }

void AutoBackupService::runLoop() {
    while (!shouldStop()) {
        const auto result = backups_->runWeeklyAutoBackup();
        if (result == AutoBackupResult::Failed)
            LogRegistry::backup()->warn("[AutoBackupService] Auto-backup check failed, retrying in {} min",
                                        check_interval_.count());
        ++checks_;

        lazySleep(check_interval_);
    }
}
