#include "database/usage_factor_store.h"
#include "utils/logger.h"
#include <sqlite3.h>
#include <cmath>
#include <mutex>

namespace bazaar {
namespace database {

static const char* SCHEMA =
    "CREATE TABLE IF NOT EXISTS computing_node ("
    "node_id TEXT PRIMARY KEY,"
    "name TEXT NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS usage_factor ("
    "provider_node TEXT PRIMARY KEY REFERENCES computing_node(node_id) ON DELETE CASCADE,"
    "usage_factor REAL NOT NULL DEFAULT 1.0"
    ");";

struct UsageFactorStore::Impl {
    sqlite3* db = nullptr;
    std::string path;
    mutable std::mutex mtx;

    Error sqlError(const std::string& what) const;
    Result<void> exec(const char* sql);
    Result<void> ensureNode(const std::string& nodeId, const std::string& name, bool overwriteName);
    Result<void> writeFactor(const std::string& providerId, double factor);
};

Error UsageFactorStore::Impl::sqlError(const std::string& what) const {
    std::string detail = db ? sqlite3_errmsg(db) : "database closed";
    return makeError(ErrorCode::DATABASE_ERROR, what + ": " + detail, path);
}

Result<void> UsageFactorStore::Impl::exec(const char* sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : "unknown sqlite error";
        sqlite3_free(errMsg);
        return makeError(ErrorCode::DATABASE_ERROR, msg, path);
    }
    return Result<void>();
}

Result<void> UsageFactorStore::Impl::ensureNode(const std::string& nodeId, const std::string& name,
                                                bool overwriteName) {
    const char* sql = overwriteName
        ? "INSERT INTO computing_node (node_id, name) VALUES (?, ?) "
          "ON CONFLICT(node_id) DO UPDATE SET name = excluded.name;"
        : "INSERT OR IGNORE INTO computing_node (node_id, name) VALUES (?, ?);";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlError("prepare computing_node insert");
    }
    sqlite3_bind_text(stmt, 1, nodeId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) return sqlError("insert computing_node");
    return Result<void>();
}

Result<void> UsageFactorStore::Impl::writeFactor(const std::string& providerId, double factor) {
    if (providerId.empty()) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "empty provider id");
    }
    if (!std::isfinite(factor) || factor <= 0.0) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "usage factor must be positive", providerId);
    }

    auto node = ensureNode(providerId, providerId, false);
    if (node.failed()) return node;

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "INSERT OR REPLACE INTO usage_factor (provider_node, usage_factor) VALUES (?, ?);";
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlError("prepare usage_factor insert");
    }
    sqlite3_bind_text(stmt, 1, providerId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 2, factor);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) return sqlError("insert usage_factor");
    return Result<void>();
}

UsageFactorStore::UsageFactorStore() : impl_(std::make_unique<Impl>()) {}

UsageFactorStore::~UsageFactorStore() { close(); }

Result<void> UsageFactorStore::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) {
        return makeError(ErrorCode::INVALID_STATE, "usage factor store already open", impl_->path);
    }

    impl_->path = path;
    int rc = sqlite3_open(path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        Error err = impl_->sqlError("open");
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return err;
    }

    auto schema = impl_->exec(SCHEMA);
    if (schema.failed()) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return schema;
    }

    auto fk = impl_->exec("PRAGMA foreign_keys=ON;");
    if (fk.failed()) {
        LOG_WARN("Could not enable foreign keys: " + describe(fk.error()));
    }
    auto wal = impl_->exec("PRAGMA journal_mode=WAL;");
    if (wal.failed()) {
        LOG_WARN("Could not enable WAL journal: " + describe(wal.error()));
    }

    LOG_INFO("Usage factor store opened: " + path);
    return Result<void>();
}

void UsageFactorStore::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool UsageFactorStore::isOpen() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->db != nullptr;
}

std::string UsageFactorStore::getPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->path;
}

Result<void> UsageFactorStore::upsertNode(const std::string& nodeId, const std::string& name) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return makeError(ErrorCode::NOT_OPEN, "usage factor store is closed");
    if (nodeId.empty()) return makeError(ErrorCode::INVALID_ARGUMENT, "empty node id");
    return impl_->ensureNode(nodeId, name, true);
}

Result<void> UsageFactorStore::save(const std::string& providerId, double factor) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return makeError(ErrorCode::NOT_OPEN, "usage factor store is closed");
    return impl_->writeFactor(providerId, factor);
}

Result<void> UsageFactorStore::saveAll(const std::map<std::string, double>& factors) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return makeError(ErrorCode::NOT_OPEN, "usage factor store is closed");
    if (factors.empty()) return Result<void>();

    auto begin = impl_->exec("BEGIN TRANSACTION;");
    if (begin.failed()) return begin;

    for (const auto& [providerId, factor] : factors) {
        auto written = impl_->writeFactor(providerId, factor);
        if (written.failed()) {
            auto rollback = impl_->exec("ROLLBACK;");
            if (rollback.failed()) {
                LOG_ERROR("Rollback failed: " + describe(rollback.error()));
            }
            return written;
        }
    }
    return impl_->exec("COMMIT;");
}

Result<std::optional<double>> UsageFactorStore::load(const std::string& providerId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return makeError(ErrorCode::NOT_OPEN, "usage factor store is closed");

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT usage_factor FROM usage_factor WHERE provider_node = ?;";
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return impl_->sqlError("prepare usage_factor select");
    }
    sqlite3_bind_text(stmt, 1, providerId.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<double> factor;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        factor = sqlite3_column_double(stmt, 0);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return impl_->sqlError("select usage_factor");
    }
    return factor;
}

Result<std::map<std::string, double>> UsageFactorStore::loadAll() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return makeError(ErrorCode::NOT_OPEN, "usage factor store is closed");

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT provider_node, usage_factor FROM usage_factor ORDER BY provider_node;";
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return impl_->sqlError("prepare usage_factor scan");
    }

    std::map<std::string, double> factors;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const unsigned char* id = sqlite3_column_text(stmt, 0);
        if (!id) continue;
        factors[reinterpret_cast<const char*>(id)] = sqlite3_column_double(stmt, 1);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return impl_->sqlError("scan usage_factor");
    }
    return factors;
}

Result<void> UsageFactorStore::remove(const std::string& providerId) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return makeError(ErrorCode::NOT_OPEN, "usage factor store is closed");

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "DELETE FROM usage_factor WHERE provider_node = ?;";
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return impl_->sqlError("prepare usage_factor delete");
    }
    sqlite3_bind_text(stmt, 1, providerId.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) return impl_->sqlError("delete usage_factor");
    return Result<void>();
}

size_t UsageFactorStore::count() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, "SELECT COUNT(*) FROM usage_factor;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    size_t cnt = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        cnt = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return cnt;
}

Result<void> UsageFactorStore::clear() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return makeError(ErrorCode::NOT_OPEN, "usage factor store is closed");
    return impl_->exec("DELETE FROM usage_factor; DELETE FROM computing_node;");
}

}
}
