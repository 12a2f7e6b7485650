#pragma once
// SQLite Store: durable KVStore on a single table
//
//   kv(key TEXT PRIMARY KEY, value TEXT NOT NULL, expires_at INTEGER)
//
// Expired rows are invisible to reads and removed lazily. One connection,
// serialized by a mutex; WAL journal so readers in other processes are not
// blocked by the CLI.

#include "store.hpp"
#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace sandhi {

class SqliteStore : public KVStore {
public:
    explicit SqliteStore(Clock clock = system_clock());
    ~SqliteStore() override;

    // Non-copyable, non-movable (owns connection)
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    // Open or create the database file (":memory:" works too)
    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    const std::string& path() const { return path_; }
    const std::string& last_error() const { return last_error_; }

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value,
             int64_t ttl_seconds = 0) override;
    bool del(const std::string& key) override;
    size_t delete_by_prefix(const std::string& prefix) override;
    std::vector<std::string> keys_with_prefix(const std::string& prefix) override;

    // Drop every expired row, returns count
    size_t purge_expired();

private:
    void require_open() const;
    void exec(const char* sql);
    sqlite3_stmt* prepare(const char* sql);
    [[noreturn]] void fail(const std::string& what);

    Clock clock_;
    sqlite3* db_ = nullptr;
    std::string path_;
    std::string last_error_;
    std::mutex mutex_;
};

} // namespace sandhi
