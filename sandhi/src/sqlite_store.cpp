// SQLite-backed KVStore

#include <sandhi/sqlite_store.hpp>
#include <sqlite3.h>
#include <iostream>

namespace sandhi {

namespace {

// Finalizes a prepared statement on scope exit
struct StmtGuard {
    sqlite3_stmt* stmt;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

} // namespace

SqliteStore::SqliteStore(Clock clock) : clock_(std::move(clock)) {}

SqliteStore::~SqliteStore() {
    close();
}

bool SqliteStore::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) return true;

    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        last_error_ = db_ ? sqlite3_errmsg(db_) : "sqlite3_open failed";
        std::cerr << "[SqliteStore] Cannot open " << path << ": " << last_error_ << "\n";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }
    path_ = path;

    try {
        exec("PRAGMA journal_mode=WAL");
        exec("CREATE TABLE IF NOT EXISTS kv ("
             "key TEXT PRIMARY KEY, "
             "value TEXT NOT NULL, "
             "expires_at INTEGER NOT NULL DEFAULT 0)");
    } catch (const StoreError& e) {
        std::cerr << "[SqliteStore] Schema setup failed: " << e.what() << "\n";
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    return true;
}

void SqliteStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::optional<std::string> SqliteStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g{prepare("SELECT value, expires_at FROM kv WHERE key = ?")};
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) fail("get " + key);

    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(g.stmt, 0));
    int64_t expires_at = sqlite3_column_int64(g.stmt, 1);
    std::string value = text ? text : "";

    if (expires_at != 0 && clock_() > expires_at) {
        StmtGuard d{prepare("DELETE FROM kv WHERE key = ?")};
        sqlite3_bind_text(d.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(d.stmt) != SQLITE_DONE) fail("evict " + key);
        return std::nullopt;
    }
    return value;
}

void SqliteStore::set(const std::string& key, const std::string& value,
                      int64_t ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    int64_t expires_at = ttl_seconds > 0 ? clock_() + seconds_to_ms(ttl_seconds) : 0;
    StmtGuard g{prepare("INSERT INTO kv (key, value, expires_at) VALUES (?, ?, ?) "
                        "ON CONFLICT(key) DO UPDATE SET "
                        "value = excluded.value, expires_at = excluded.expires_at")};
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 3, expires_at);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) fail("set " + key);
}

bool SqliteStore::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g{prepare("DELETE FROM kv WHERE key = ?")};
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) fail("del " + key);
    return sqlite3_changes(db_) > 0;
}

size_t SqliteStore::delete_by_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    // Byte-wise prefix match; LIKE would treat the '%' of escaped keys as a wildcard
    StmtGuard g{prepare("DELETE FROM kv WHERE substr(CAST(key AS BLOB), 1, ?) = ?")};
    sqlite3_bind_int(g.stmt, 1, static_cast<int>(prefix.size()));
    sqlite3_bind_blob(g.stmt, 2, prefix.data(), static_cast<int>(prefix.size()), SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) fail("delete_by_prefix " + prefix);
    return static_cast<size_t>(sqlite3_changes(db_));
}

std::vector<std::string> SqliteStore::keys_with_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g{prepare("SELECT key FROM kv WHERE substr(CAST(key AS BLOB), 1, ?) = ? "
                        "AND (expires_at = 0 OR expires_at >= ?) ORDER BY key")};
    sqlite3_bind_int(g.stmt, 1, static_cast<int>(prefix.size()));
    sqlite3_bind_blob(g.stmt, 2, prefix.data(), static_cast<int>(prefix.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 3, clock_());

    std::vector<std::string> keys;
    int rc;
    while ((rc = sqlite3_step(g.stmt)) == SQLITE_ROW) {
        const char* k = reinterpret_cast<const char*>(sqlite3_column_text(g.stmt, 0));
        if (k) keys.emplace_back(k);
    }
    if (rc != SQLITE_DONE) fail("keys_with_prefix " + prefix);
    return keys;
}

size_t SqliteStore::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g{prepare("DELETE FROM kv WHERE expires_at != 0 AND expires_at < ?")};
    sqlite3_bind_int64(g.stmt, 1, clock_());
    if (sqlite3_step(g.stmt) != SQLITE_DONE) fail("purge_expired");
    return static_cast<size_t>(sqlite3_changes(db_));
}

void SqliteStore::require_open() const {
    if (!db_) throw StoreError("SqliteStore: database not open");
}

void SqliteStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        last_error_ = msg;
        throw StoreError(std::string("SqliteStore: ") + msg);
    }
}

sqlite3_stmt* SqliteStore::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail(std::string("prepare: ") + sql);
    }
    return stmt;
}

void SqliteStore::fail(const std::string& what) {
    last_error_ = sqlite3_errmsg(db_);
    throw StoreError("SqliteStore: " + what + ": " + last_error_);
}

} // namespace sandhi
