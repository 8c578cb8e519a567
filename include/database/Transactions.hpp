#pragma once

#include "database/DBPool.hpp"
#include "logging/LogRegistry.hpp"

#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <type_traits>
#include <utility>

namespace cuisine::database {

class Transactions {
  public:
    static inline std::shared_ptr<DBPool> dbPool_;

    static void init(const config::DatabaseConfig& cfg) { dbPool_ = std::make_shared<DBPool>(cfg); }

    [[nodiscard]] static bool isInitialized() { return dbPool_ != nullptr; }

    // Runs func inside one pqxx::work; commits on return, rolls back if func throws.
    template <typename Func>
    static auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        using Result = decltype(func(std::declval<pqxx::work&>()));
        if (!dbPool_) throw std::runtime_error("Transactions not initialized!");

        logging::LogRegistry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        const auto conn = dbPool_->acquire();

        try {
            pqxx::work txn(conn->get());
            if constexpr (std::is_void_v<Result>) {
                func(txn);
                txn.commit();
                logging::LogRegistry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
            } else {
                auto result = func(txn);
                txn.commit();
                logging::LogRegistry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                return result;
            }
        } catch (const std::exception& e) {
            logging::LogRegistry::db()->error("[Transactions::exec] '{}' rolled back: {}", ctx, e.what());
            throw;
        }
    }
};

} // namespace cuisine::database
