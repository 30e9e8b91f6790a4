#include "../include/kv_cache.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include <sqlite3.h>
#include <functional>

namespace ragcore {

static long long now_epoch_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

MemoryKeyValueCache::MemoryKeyValueCache(std::size_t shards) {
    if (shards == 0) shards = 1;
    shards_.reserve(shards);
    for (std::size_t i = 0; i < shards; ++i) shards_.push_back(std::make_unique<Shard>());
}

MemoryKeyValueCache::Shard& MemoryKeyValueCache::shard_for(const std::string& key) {
    return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

std::optional<std::string> MemoryKeyValueCache::get(const std::string& key) {
    Shard& s = shard_for(key);
    std::lock_guard<std::mutex> lock(s.mtx);
    auto it = s.entries.find(key);
    if (it == s.entries.end()) return std::nullopt;
    if (it->second.expiring && std::chrono::steady_clock::now() >= it->second.expires) {
        s.entries.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void MemoryKeyValueCache::set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
    Entry e;
    e.value = value;
    e.expiring = ttl.count() > 0;
    if (e.expiring) e.expires = std::chrono::steady_clock::now() + ttl;
    Shard& s = shard_for(key);
    std::lock_guard<std::mutex> lock(s.mtx);
    s.entries[key] = std::move(e);
}

std::size_t MemoryKeyValueCache::clear(const std::string& prefix) {
    std::size_t removed = 0;
    for (auto& s : shards_) {
        std::lock_guard<std::mutex> lock(s->mtx);
        for (auto it = s->entries.begin(); it != s->entries.end();) {
            if (it->first.compare(0, prefix.size(), prefix) == 0) {
                it = s->entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

std::size_t MemoryKeyValueCache::size() {
    std::size_t n = 0;
    for (auto& s : shards_) {
        std::lock_guard<std::mutex> lock(s->mtx);
        n += s->entries.size();
    }
    return n;
}

SqliteKeyValueCache::SqliteKeyValueCache(const std::string& db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw RetrievalError("Failed to open SQLite cache: " + db_path + ": " + msg);
    }
    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("CREATE TABLE IF NOT EXISTS kv_cache (\n"
             "  key TEXT PRIMARY KEY,\n"
             "  value BLOB,\n"
             "  expires_at INTEGER\n"
             ");");
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteKeyValueCache::~SqliteKeyValueCache() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SqliteKeyValueCache::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw RetrievalError("SQLite error: " + msg);
    }
}

void SqliteKeyValueCache::prepare_statements() {
    const char* get = "SELECT value, expires_at FROM kv_cache WHERE key = ?;";
    if (sqlite3_prepare_v2(db_, get, -1, &get_stmt_, nullptr) != SQLITE_OK) {
        throw RetrievalError("prepare cache select failed");
    }
    const char* set = "INSERT OR REPLACE INTO kv_cache (key, value, expires_at) VALUES (?, ?, ?);";
    if (sqlite3_prepare_v2(db_, set, -1, &set_stmt_, nullptr) != SQLITE_OK) {
        throw RetrievalError("prepare cache insert failed");
    }
}

void SqliteKeyValueCache::close_statements() {
    if (get_stmt_) { sqlite3_finalize(get_stmt_); get_stmt_ = nullptr; }
    if (set_stmt_) { sqlite3_finalize(set_stmt_); set_stmt_ = nullptr; }
}

std::optional<std::string> SqliteKeyValueCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(get_stmt_);
    sqlite3_bind_text(get_stmt_, 1, key.c_str(), (int)key.size(), SQLITE_TRANSIENT);
    std::optional<std::string> out;
    int rc = sqlite3_step(get_stmt_);
    if (rc == SQLITE_ROW) {
        long long expires = sqlite3_column_int64(get_stmt_, 1);
        if (expires == 0 || expires > now_epoch_ms()) {
            const void* blob = sqlite3_column_blob(get_stmt_, 0);
            int bytes = sqlite3_column_bytes(get_stmt_, 0);
            out = std::string(static_cast<const char*>(blob), (size_t)bytes);
        }
    } else if (rc != SQLITE_DONE) {
        sqlite3_reset(get_stmt_);
        throw RetrievalError(std::string("cache lookup failed: ") + sqlite3_errmsg(db_));
    }
    sqlite3_reset(get_stmt_);
    return out;
}

void SqliteKeyValueCache::set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
    long long expires = ttl.count() > 0 ? now_epoch_ms() + ttl.count() : 0;
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(set_stmt_);
    sqlite3_clear_bindings(set_stmt_);
    sqlite3_bind_text(set_stmt_, 1, key.c_str(), (int)key.size(), SQLITE_TRANSIENT);
    sqlite3_bind_blob(set_stmt_, 2, value.data(), (int)value.size(), SQLITE_TRANSIENT);
    sqlite3_bind_int64(set_stmt_, 3, expires);
    int rc = sqlite3_step(set_stmt_);
    sqlite3_reset(set_stmt_);
    if (rc != SQLITE_DONE) {
        throw RetrievalError(std::string("cache insert failed: ") + sqlite3_errmsg(db_));
    }
}

std::size_t SqliteKeyValueCache::clear(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM kv_cache WHERE substr(key, 1, ?) = ?;", -1, &st, nullptr) != SQLITE_OK) {
        throw RetrievalError("prepare cache delete failed");
    }
    sqlite3_bind_int(st, 1, (int)prefix.size());
    sqlite3_bind_text(st, 2, prefix.c_str(), (int)prefix.size(), SQLITE_TRANSIENT);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) throw RetrievalError(std::string("cache delete failed: ") + sqlite3_errmsg(db_));
    return (std::size_t)sqlite3_changes(db_);
}

std::size_t SqliteKeyValueCache::purge_expired() {
    std::lock_guard<std::mutex> lock(mtx_);
    exec("DELETE FROM kv_cache WHERE expires_at != 0 AND expires_at <= " + std::to_string(now_epoch_ms()) + ";");
    return (std::size_t)sqlite3_changes(db_);
}

std::unique_ptr<KeyValueCache> make_cache(const CacheConfig& config) {
    if (config.kind == "memory") return std::make_unique<MemoryKeyValueCache>(config.shards);
    if (config.kind == "sqlite") {
        auto cache = std::make_unique<SqliteKeyValueCache>(config.sqlite_path);
        std::size_t purged = cache->purge_expired();
        if (purged) log_info("purged " + std::to_string(purged) + " expired cache entries");
        return cache;
    }
    throw ConfigError("unknown cache kind: " + config.kind);
}

} // namespace ragcore
