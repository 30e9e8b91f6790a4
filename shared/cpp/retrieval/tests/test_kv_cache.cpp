#include <catch2/catch.hpp>
#include "../include/errors.hpp"
#include "../include/kv_cache.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace ragcore;
using namespace std::chrono_literals;

namespace {

void exercise_basic(KeyValueCache& cache) {
    CHECK_FALSE(cache.get("missing"));
    cache.set("emb:a", std::string("\x00\x01\x02", 3), 0ms);
    auto v = cache.get("emb:a");
    REQUIRE(v);
    CHECK(*v == std::string("\x00\x01\x02", 3));
    cache.set("emb:a", "replaced", 0ms);
    CHECK(*cache.get("emb:a") == "replaced");
}

void exercise_ttl(KeyValueCache& cache) {
    cache.set("short", "x", 1ms);
    cache.set("forever", "y", 0ms);
    std::this_thread::sleep_for(20ms);
    CHECK_FALSE(cache.get("short"));
    REQUIRE(cache.get("forever"));
    CHECK(*cache.get("forever") == "y");
}

void exercise_clear(KeyValueCache& cache) {
    cache.set("emb:m1:a", "1", 0ms);
    cache.set("emb:m1:b", "2", 0ms);
    cache.set("emb:m2:a", "3", 0ms);
    CHECK(cache.clear("emb:m1:") == 2);
    CHECK_FALSE(cache.get("emb:m1:a"));
    CHECK(cache.get("emb:m2:a"));
}

}

TEST_CASE("memory cache stores and replaces values", "[cache]") {
    MemoryKeyValueCache cache;
    exercise_basic(cache);
    CHECK(cache.size() == 1);
}

TEST_CASE("memory cache expires entries", "[cache]") {
    MemoryKeyValueCache cache;
    exercise_ttl(cache);
}

TEST_CASE("memory cache clears by prefix", "[cache]") {
    MemoryKeyValueCache cache(4);
    exercise_clear(cache);
}

TEST_CASE("memory cache tolerates concurrent writers", "[cache]") {
    MemoryKeyValueCache cache;
    std::atomic<int> wrong{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, &wrong, t] {
            for (int i = 0; i < 200; ++i) {
                std::string key = "k" + std::to_string(i);
                cache.set(key, std::to_string(i), 0ms);
                auto v = cache.get(key);
                if (v && *v != std::to_string(i)) ++wrong;
                if (t == 0 && i % 50 == 0) cache.clear("k1");
            }
        });
    }
    for (auto& th : threads) th.join();
    CHECK(wrong == 0);
    CHECK(cache.size() <= 200);
}

TEST_CASE("sqlite cache stores and replaces values", "[cache]") {
    SqliteKeyValueCache cache(":memory:");
    exercise_basic(cache);
}

TEST_CASE("sqlite cache expires entries", "[cache]") {
    SqliteKeyValueCache cache(":memory:");
    exercise_ttl(cache);
    cache.set("gone", "z", 1ms);
    std::this_thread::sleep_for(20ms);
    CHECK(cache.purge_expired() >= 1);
}

TEST_CASE("sqlite cache clears by prefix", "[cache]") {
    SqliteKeyValueCache cache(":memory:");
    exercise_clear(cache);
}

TEST_CASE("sqlite cache refuses a file that is not a database", "[cache]") {
    auto path = std::filesystem::temp_directory_path() / "ragcore_not_a_cache.db";
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << std::string(4096, 'x');
    }
    CHECK_THROWS_AS(SqliteKeyValueCache(path.string()), RetrievalError);
    // The failed open released its handle, so the file can be reused.
    std::filesystem::remove(path);
    SqliteKeyValueCache cache(path.string());
    cache.set("k", "v", 0ms);
    CHECK(cache.get("k") == std::string("v"));
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
}

TEST_CASE("cache factory", "[cache]") {
    CacheConfig cfg;
    cfg.kind = "memory";
    CHECK(make_cache(cfg) != nullptr);
    cfg.kind = "sqlite";
    cfg.sqlite_path = ":memory:";
    CHECK(make_cache(cfg) != nullptr);
    cfg.kind = "redis";
    CHECK_THROWS_AS(make_cache(cfg), ConfigError);
}
