#include "database/DBPool.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace cuisine::logging;

namespace cuisine::database {

DBPool::Lease::Lease(DBPool& pool, std::unique_ptr<DBConnection> conn)
    : pool_(&pool), conn_(std::move(conn)) {}

DBPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)) {}

DBPool::Lease::~Lease() {
    if (conn_) pool_->release(std::move(conn_));
}

DBPool::DBPool(const config::DatabaseConfig& cfg, const size_t size) {
    if (size == 0) throw std::invalid_argument("DBPool needs at least one connection");

    for (size_t i = 0; i < size; ++i) {
        auto conn = std::make_unique<DBConnection>(cfg);
        if (i == 0) conn->initSchema();
        conn->initPrepared();
        idle_.push(std::move(conn));
    }

    LogRegistry::db()->info("[DBPool] Opened {} connections to {}:{}/{}", size, cfg.host, cfg.port, cfg.name);
}

DBPool::Lease DBPool::acquire() {
    std::unique_lock lock(mtx_);
    cv_.wait(lock, [this] { return !idle_.empty(); });
    auto conn = std::move(idle_.front());
    idle_.pop();
    return {*this, std::move(conn)};
}

size_t DBPool::idle() const {
    std::lock_guard lock(mtx_);
    return idle_.size();
}

void DBPool::release(std::unique_ptr<DBConnection> conn) {
    {
        std::lock_guard lock(mtx_);
        idle_.push(std::move(conn));
    }
    cv_.notify_one();
}

} // namespace cuisine::database
