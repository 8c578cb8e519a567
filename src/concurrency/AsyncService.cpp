#include "concurrency/AsyncService.hpp"
#include "logging/LogRegistry.hpp"

using namespace cuisine::concurrency;
using namespace cuisine::logging;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();   // previous run ended on its own

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            LogRegistry::cuisine()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    LogRegistry::cuisine()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    {
        std::lock_guard lock(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
        LogRegistry::cuisine()->info("[{}] Service stopped.", serviceName_);
    }

    running_.store(false, std::memory_order_release);
}

void AsyncService::restart() {
    LogRegistry::cuisine()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}
