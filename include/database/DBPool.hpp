#pragma once

#include "database/DBConnection.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>

namespace cuisine::database {

// Fixed set of prepared connections. The first one also creates the schema.
class DBPool {
  public:
    // Hands its connection back to the pool when destroyed.
    class Lease {
      public:
        Lease(DBPool& pool, std::unique_ptr<DBConnection> conn);
        Lease(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;
        ~Lease();

        DBConnection* operator->() const { return conn_.get(); }
        DBConnection& operator*() const { return *conn_; }

      private:
        DBPool* pool_;
        std::unique_ptr<DBConnection> conn_;
    };

    explicit DBPool(const config::DatabaseConfig& cfg, size_t size = 4);

    // Blocks until a connection is free.
    [[nodiscard]] Lease acquire();

    [[nodiscard]] size_t idle() const;

  private:
    void release(std::unique_ptr<DBConnection> conn);

    std::queue<std::unique_ptr<DBConnection>> idle_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace cuisine::database
