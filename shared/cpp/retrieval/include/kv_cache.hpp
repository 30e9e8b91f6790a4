#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace ragcore {

// Byte-oriented cache with per-entry TTL. A ttl <= 0 never expires.
class KeyValueCache {
public:
    virtual ~KeyValueCache() = default;
    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) = 0;
    // Removes every key starting with prefix and returns how many were removed.
    virtual std::size_t clear(const std::string& prefix) = 0;
};

struct CacheConfig {
    std::string kind{"memory"}; // memory | sqlite
    std::string sqlite_path{"./data/embedding_cache.db"};
    std::size_t shards{16};
};

class MemoryKeyValueCache : public KeyValueCache {
public:
    explicit MemoryKeyValueCache(std::size_t shards = 16);

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
    std::size_t clear(const std::string& prefix) override;
    std::size_t size();

private:
    struct Entry {
        std::string value;
        std::chrono::steady_clock::time_point expires;
        bool expiring{false};
    };
    struct Shard {
        std::mutex mtx;
        std::unordered_map<std::string, Entry> entries;
    };

    Shard& shard_for(const std::string& key);

    std::vector<std::unique_ptr<Shard>> shards_;
};

class SqliteKeyValueCache : public KeyValueCache {
public:
    explicit SqliteKeyValueCache(const std::string& db_path);
    ~SqliteKeyValueCache() override;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
    std::size_t clear(const std::string& prefix) override;
    std::size_t purge_expired();

private:
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();

    std::mutex mtx_;
    sqlite3* db_ {nullptr};
    sqlite3_stmt* get_stmt_ {nullptr};
    sqlite3_stmt* set_stmt_ {nullptr};
};

std::unique_ptr<KeyValueCache> make_cache(const CacheConfig& config);

} // namespace ragcore
