#include "database/PgStores.hpp"
#include "database/RecordRows.hpp"
#include "database/Transactions.hpp"

#include <vector>

using namespace cuisine::types;
using namespace cuisine::storage;
using namespace cuisine::logging;

namespace cuisine::database {

Dataset PgDataStore::getAll() const {
    return Transactions::exec("PgDataStore::getAll", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"get_all_records"}, pqxx::params{});

        std::vector<RecordRow> rows;
        rows.reserve(res.size());
        for (const auto& row : res) {
            rows.push_back({
                .collection = row["collection"].as<std::string>(),
                .id = row["id"].as<std::string>(),
                .position = row["position"].as<int64_t>(),
                .doc = row["doc"].as<std::string>()
            });
        }
        return fromRecordRows(std::move(rows));
    });
}

void PgDataStore::bulkReplace(const Dataset& data) {
    const auto rows = toRecordRows(data);

    Transactions::exec("PgDataStore::bulkReplace", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"delete_all_records"}, pqxx::params{});
        for (const auto& row : rows) {
            pqxx::params p{row.collection, row.id, row.position, row.doc};
            txn.exec(pqxx::prepped{"insert_record"}, p);
        }
    });

    LogRegistry::db()->debug("[PgDataStore::bulkReplace] Replaced dataset ({} records)", rows.size());
}

void PgDataStore::clear() {
    Transactions::exec("PgDataStore::clear", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"delete_all_records"}, pqxx::params{});
    });
}

std::optional<BackupSnapshot> PgSnapshotStore::get(const std::string& id) const {
    return Transactions::exec("PgSnapshotStore::get", [&](pqxx::work& txn) -> std::optional<BackupSnapshot> {
        const auto res = txn.exec(pqxx::prepped{"get_backup_snapshot"}, pqxx::params{id});
        if (res.empty()) return std::nullopt;

        const auto row = res[0];
        return BackupSnapshot{
            .id = row["id"].as<std::string>(),
            .payload = row["payload"].as<std::string>(),
            .created_at = util::fromEpochMs(row["created_at"].as<int64_t>())
        };
    });
}

void PgSnapshotStore::put(const BackupSnapshot& snapshot) {
    Transactions::exec("PgSnapshotStore::put", [&](pqxx::work& txn) {
        pqxx::params p{snapshot.id, snapshot.payload, util::toEpochMs(snapshot.created_at)};
        txn.exec(pqxx::prepped{"upsert_backup_snapshot"}, p);
    });
}

void PgSnapshotStore::remove(const std::string& id) {
    Transactions::exec("PgSnapshotStore::remove", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"delete_backup_snapshot"}, pqxx::params{id});
    });
}

}
