#include "backup/BackupService.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "services/AutoBackupService.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace cuisine::config;
using namespace cuisine::backup;
using namespace cuisine::services;
using namespace cuisine::logging;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int) { shouldExit = true; }
}

int main(const int argc, char** argv) {
    const std::filesystem::path configPath = argc > 1 ? argv[1] : "/etc/cuisine/config.yaml";

    try {
        ConfigRegistry::init(configPath);
        LogRegistry::init(ConfigRegistry::get().logging.log_dir);

        LogRegistry::cuisine()->info("[*] Initializing backup service from {}", configPath.string());
        const auto& cfg = ConfigRegistry::get();
        const auto backups = BackupService::fromConfig(cfg);

        AutoBackupService autoBackup(backups, std::chrono::minutes(cfg.backup.auto_backup_check_minutes));
        autoBackup.start();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        LogRegistry::cuisine()->info("[✓] Cuisine backup daemon running");
        while (!shouldExit) std::this_thread::sleep_for(std::chrono::seconds(1));

        LogRegistry::cuisine()->info("[!] Shutdown requested, stopping services...");
        autoBackup.stop();
        LogRegistry::cuisine()->info("[✓] Shutdown complete.");
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::cuisine()->error("[-] Fatal: {}", e.what());
        else std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
