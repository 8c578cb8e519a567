#include "database/DBConnection.hpp"
#include "logging/LogRegistry.hpp"

#include <cctype>
#include <fmt/format.h>
#include <pqxx/pqxx>
#include <stdexcept>

using namespace cuisine::logging;

namespace cuisine::database {

static std::string escape_uri_component(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (const unsigned char c : input) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') out += static_cast<char>(c);
        else out += fmt::format("%{:02X}", c);
    }
    return out;
}

std::string connectionString(const config::DatabaseConfig& cfg) {
    std::string auth = escape_uri_component(cfg.user);
    if (!cfg.password.empty()) auth += ":" + escape_uri_component(cfg.password);
    return "postgresql://" + auth + "@" + cfg.host + ":" + std::to_string(cfg.port) + "/" + cfg.name;
}

DBConnection::DBConnection(const config::DatabaseConfig& cfg)
    : conn_(std::make_unique<pqxx::connection>(connectionString(cfg))) {
    LogRegistry::db()->debug("[DBConnection] Connected to {}:{}/{}", cfg.host, cfg.port, cfg.name);
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::initSchema() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    pqxx::work txn(*conn_);
    txn.exec("CREATE TABLE IF NOT EXISTS cuisine_records ("
             "    collection TEXT NOT NULL,"
             "    id TEXT NOT NULL,"
             "    position BIGINT NOT NULL,"
             "    doc JSONB NOT NULL,"
             "    PRIMARY KEY (collection, id))");
    txn.exec("CREATE TABLE IF NOT EXISTS cuisine_backup_snapshots ("
             "    id TEXT PRIMARY KEY,"
             "    payload TEXT NOT NULL,"
             "    created_at BIGINT NOT NULL)");
    txn.commit();

    LogRegistry::db()->debug("[DBConnection::initSchema] Schema ready");
}

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedRecords();
    initPreparedSnapshots();
}

void DBConnection::initPreparedRecords() const {
    conn_->prepare("insert_record",
                   "INSERT INTO cuisine_records (collection, id, position, doc) "
                   "VALUES ($1, $2, $3, $4::jsonb)");

    conn_->prepare("get_all_records",
                   "SELECT collection, id, position, doc::text AS doc FROM cuisine_records "
                   "ORDER BY collection, position");

    conn_->prepare("delete_all_records", "DELETE FROM cuisine_records");
}

void DBConnection::initPreparedSnapshots() const {
    conn_->prepare("upsert_backup_snapshot",
                   "INSERT INTO cuisine_backup_snapshots (id, payload, created_at) VALUES ($1, $2, $3) "
                   "ON CONFLICT (id) DO UPDATE SET payload = EXCLUDED.payload, created_at = EXCLUDED.created_at");

    conn_->prepare("get_backup_snapshot", "SELECT id, payload, created_at FROM cuisine_backup_snapshots WHERE id = $1");

    conn_->prepare("delete_backup_snapshot", "DELETE FROM cuisine_backup_snapshots WHERE id = $1");
}

} // namespace cuisine::database
