#include "sqlite_store.hpp"
#include "../errors.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace callgate {

namespace {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

} // anonymous namespace

SqliteCacheStore::SqliteCacheStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteCacheStore: failed to open database: " + err);
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 2000);

    init_schema();
}

SqliteCacheStore::~SqliteCacheStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteCacheStore::init_schema() {
    const char* create_table =
        "CREATE TABLE IF NOT EXISTS response_cache ("
        "  fingerprint TEXT PRIMARY KEY,"
        "  payload     TEXT NOT NULL,"
        "  stored_at   INTEGER NOT NULL"
        ");";
    char* err = nullptr;
    if (sqlite3_exec(db_, create_table, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("SqliteCacheStore: failed to create schema: " + msg);
    }
    sqlite3_exec(db_,
        "CREATE INDEX IF NOT EXISTS idx_response_cache_stored_at"
        " ON response_cache(stored_at);",
        nullptr, nullptr, nullptr);
}

std::optional<CacheEntry> SqliteCacheStore::load(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql =
        "SELECT payload, stored_at FROM response_cache WHERE fingerprint = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("cache lookup failed: ") + sqlite3_errmsg(db_));
    sqlite3_bind_text(g.stmt, 1, fingerprint.c_str(), -1, SQLITE_STATIC);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW)
        throw std::runtime_error(std::string("cache lookup failed: ") + sqlite3_errmsg(db_));

    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(g.stmt, 0));
    nlohmann::json payload = nlohmann::json::parse(text ? text : "", nullptr, false);
    if (payload.is_discarded())
        throw std::runtime_error("corrupt cache row for " + fingerprint);

    CacheEntry entry;
    entry.fingerprint = fingerprint;
    entry.payload = std::move(payload);
    entry.stored_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 1));
    return entry;
}

void SqliteCacheStore::store(const CacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string payload = entry.payload.dump();

    StmtGuard g;
    const char* sql =
        "INSERT OR REPLACE INTO response_cache (fingerprint, payload, stored_at)"
        " VALUES (?, ?, ?);";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK)
        throw CacheWriteError(std::string("cache write failed: ") + sqlite3_errmsg(db_));
    sqlite3_bind_text(g.stmt, 1, entry.fingerprint.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, payload.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 3, static_cast<sqlite3_int64>(entry.stored_at));

    if (sqlite3_step(g.stmt) != SQLITE_DONE)
        throw CacheWriteError(std::string("cache write failed: ") + sqlite3_errmsg(db_));
}

bool SqliteCacheStore::erase(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql = "DELETE FROM response_cache WHERE fingerprint = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK)
        throw CacheWriteError(std::string("cache delete failed: ") + sqlite3_errmsg(db_));
    sqlite3_bind_text(g.stmt, 1, fingerprint.c_str(), -1, SQLITE_STATIC);

    if (sqlite3_step(g.stmt) != SQLITE_DONE)
        throw CacheWriteError(std::string("cache delete failed: ") + sqlite3_errmsg(db_));
    return sqlite3_changes(db_) > 0;
}

uint32_t SqliteCacheStore::erase_older_than(uint64_t cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql = "DELETE FROM response_cache WHERE stored_at < ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK)
        throw CacheWriteError(std::string("cache purge failed: ") + sqlite3_errmsg(db_));
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(cutoff));

    if (sqlite3_step(g.stmt) != SQLITE_DONE)
        throw CacheWriteError(std::string("cache purge failed: ") + sqlite3_errmsg(db_));
    return static_cast<uint32_t>(sqlite3_changes(db_));
}

uint32_t SqliteCacheStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql = "SELECT COUNT(*) FROM response_cache;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("cache count failed: ") + sqlite3_errmsg(db_));
    if (sqlite3_step(g.stmt) != SQLITE_ROW)
        throw std::runtime_error(std::string("cache count failed: ") + sqlite3_errmsg(db_));
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

void SqliteCacheStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    char* err = nullptr;
    if (sqlite3_exec(db_, "DELETE FROM response_cache;", nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw CacheWriteError("cache clear failed: " + msg);
    }
}

} // namespace callgate
