#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <memory>

namespace cuisine::backup { class BackupService; }

namespace cuisine::services {

// Runs the weekly auto-backup check at start and then every check interval.
class AutoBackupService final : public concurrency::AsyncService {
public:
    AutoBackupService(std::shared_ptr<backup::BackupService> backups, std::chrono::minutes checkInterval);
    ~AutoBackupService() override;

    // Number of completed checks, whatever their outcome.
    [[nodiscard]] unsigned int checks() const { return checks_.load(); }

protected:
    void runLoop() override;

private:
    std::shared_ptr<backup::BackupService> backups_;
    std::chrono::minutes check_interval_;
    std::atomic<unsigned int> checks_{0};
};

}
