#include <catch2/catch.hpp>
#include "fakes.hpp"
#include "../include/embedding.hpp"
#include "../include/errors.hpp"
#include "../include/kv_cache.hpp"
#include <cmath>
#include <cstring>
#include <thread>

using namespace ragcore;
using ragcore::testing::FakeProvider;

namespace {

EmbeddingConfig fast_config(std::size_t dim = 4) {
    EmbeddingConfig c;
    c.provider = "fake";
    c.model = "text-embedding-3-small";
    c.dim = dim;
    c.batch_size = 100;
    c.requests_per_second = 0.0;
    c.max_retries = 0;
    return c;
}

bool bit_identical(const std::vector<float>& a, const std::vector<float>& b) {
    return a.size() == b.size() && std::memcmp(a.data(), b.data(), a.size() * sizeof(float)) == 0;
}

class BrokenCache : public KeyValueCache {
public:
    std::optional<std::string> get(const std::string&) override { throw RetrievalError("cache down"); }
    void set(const std::string&, const std::string&, std::chrono::milliseconds) override {
        throw RetrievalError("cache down");
    }
    std::size_t clear(const std::string&) override { return 0; }
};

}

TEST_CASE("cached embeddings are bit-identical", "[embedding]") {
    FakeProvider provider;
    ProviderEmbeddingClient direct(provider, fast_config());
    MemoryKeyValueCache cache;
    CachingEmbeddingClient client(direct, cache, std::chrono::hours(1));

    auto first = client.embed("the same text");
    auto second = client.embed("the same text");
    CHECK_FALSE(first.from_cache);
    CHECK(second.from_cache);
    CHECK(bit_identical(first.vector, second.vector));
    CHECK(provider.calls == 1);

    auto stats = client.stats();
    CHECK(stats.cache_hits == 1);
    CHECK(stats.cache_misses == 1);
    CHECK(stats.cache_hit_rate() == Approx(0.5));
}

TEST_CASE("batch calls only embed what the cache is missing", "[embedding]") {
    FakeProvider provider;
    ProviderEmbeddingClient direct(provider, fast_config());
    MemoryKeyValueCache cache;
    CachingEmbeddingClient client(direct, cache, std::chrono::hours(1));

    client.embed_batch({"a", "b"});
    provider.batches.clear();

    auto results = client.embed_batch({"a", "c", "a", "d", "c"});
    REQUIRE(results.size() == 5);
    REQUIRE(provider.batches.size() == 1);
    CHECK(provider.batches[0] == std::vector<std::string>{"c", "d"});
    CHECK(results[0].from_cache);
    CHECK_FALSE(results[1].from_cache);
    CHECK(results[2].from_cache);
    CHECK_FALSE(results[3].from_cache);
    CHECK(results[1].text == "c");
    CHECK(bit_identical(results[1].vector, results[4].vector));
    CHECK(bit_identical(results[0].vector, results[2].vector));
}

TEST_CASE("cache keys depend on model and text", "[embedding]") {
    FakeProvider provider;
    auto cfg = fast_config();
    ProviderEmbeddingClient direct(provider, cfg);
    MemoryKeyValueCache cache;
    CachingEmbeddingClient client(direct, cache, std::chrono::hours(1));
    auto key = client.cache_key("hello");
    CHECK(key.rfind("emb:text-embedding-3-small:", 0) == 0);
    CHECK(key != client.cache_key("hello "));

    cfg.model = "other-model";
    ProviderEmbeddingClient other(provider, cfg);
    CachingEmbeddingClient other_client(other, cache, std::chrono::hours(1));
    CHECK(other_client.cache_key("hello") != key);

    client.embed("hello");
    CHECK(client.clear_cache() == 1);
    CHECK_FALSE(client.embed("hello").from_cache);
}

TEST_CASE("provider batches are bounded by batch size", "[embedding]") {
    FakeProvider provider;
    auto cfg = fast_config();
    cfg.batch_size = 2;
    ProviderEmbeddingClient client(provider, cfg);
    auto results = client.embed_batch({"1", "2", "3", "4", "5"});
    REQUIRE(results.size() == 5);
    REQUIRE(provider.batches.size() == 3);
    CHECK(provider.batches[0].size() == 2);
    CHECK(provider.batches[1].size() == 2);
    CHECK(provider.batches[2].size() == 1);
    CHECK(client.stats().provider_calls == 3);
    for (std::size_t i = 0; i < results.size(); ++i) CHECK(results[i].text == std::to_string(i + 1));
}

TEST_CASE("partial provider responses fail the whole batch", "[embedding]") {
    FakeProvider provider;
    ProviderEmbeddingClient client(provider, fast_config());

    provider.drop_last = true;
    CHECK_THROWS_AS(client.embed_batch({"x", "y"}), ProviderUnavailable);

    provider.drop_last = false;
    provider.empty_first = true;
    CHECK_THROWS_AS(client.embed_batch({"x", "y"}), ProviderUnavailable);
}

TEST_CASE("transient provider outages are retried", "[embedding]") {
    FakeProvider provider;
    auto cfg = fast_config();
    cfg.max_retries = 2;
    ProviderEmbeddingClient client(provider, cfg);

    provider.fail_times = 1;
    auto r = client.embed("retry me");
    CHECK(r.vector.size() == 4);
    CHECK(provider.calls == 2);

    provider.fail_times = 5;
    CHECK_THROWS_AS(client.embed("still down"), ProviderUnavailable);
}

TEST_CASE("wrong vector size is a dimension mismatch", "[embedding]") {
    FakeProvider provider(3);
    ProviderEmbeddingClient client(provider, fast_config(4));
    try {
        client.embed("x");
        FAIL("expected DimensionMismatch");
    } catch (const DimensionMismatch& e) {
        CHECK(e.expected() == 4);
        CHECK(e.actual() == 3);
    }
    CHECK(provider.calls == 1);
}

TEST_CASE("cost follows the price table", "[embedding]") {
    FakeProvider provider;
    provider.reported_usage = 1000;
    ProviderEmbeddingClient client(provider, fast_config());
    client.embed_batch({"one", "two"});
    auto stats = client.stats();
    CHECK(stats.total_tokens == 1000);
    CHECK(stats.total_cost == Approx(1000 * 0.02 / 1e6));
    CHECK(stats.requests == 2);

    CHECK(price_per_million_tokens("text-embedding-3-large") == Approx(0.13));
    CHECK(price_per_million_tokens("bge-m3") == 0.0);
}

TEST_CASE("cache failures degrade to provider calls", "[embedding]") {
    FakeProvider provider;
    ProviderEmbeddingClient direct(provider, fast_config());
    BrokenCache cache;
    CachingEmbeddingClient client(direct, cache, std::chrono::hours(1));
    auto r1 = client.embed("text");
    auto r2 = client.embed("text");
    CHECK_FALSE(r2.from_cache);
    CHECK(bit_identical(r1.vector, r2.vector));
    CHECK(provider.calls == 2);
}

TEST_CASE("concurrent callers see identical vectors", "[embedding]") {
    FakeProvider provider;
    ProviderEmbeddingClient direct(provider, fast_config());
    MemoryKeyValueCache cache;
    CachingEmbeddingClient client(direct, cache, std::chrono::hours(1));
    auto reference = direct.embed("shared text").vector;

    std::vector<std::thread> threads;
    std::vector<std::vector<float>> seen(8);
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 20; ++i) seen[t] = client.embed_batch({"shared text", "other"}).front().vector;
        });
    }
    for (auto& th : threads) th.join();
    for (auto& v : seen) CHECK(bit_identical(v, reference));
}

TEST_CASE("hashing provider is deterministic and normalized", "[embedding]") {
    HashingEmbeddingProvider provider(64);
    auto a = provider.embed("m", {"Retrieval ranks chunks", "retrieval, ranks chunks!"});
    REQUIRE(a.vectors.size() == 2);
    CHECK(a.vectors[0].size() == 64);
    CHECK(bit_identical(a.vectors[0], a.vectors[1]));
    double norm = 0.0;
    for (float x : a.vectors[0]) norm += double(x) * x;
    CHECK(std::sqrt(norm) == Approx(1.0).epsilon(1e-5));
    CHECK(a.token_usage > 0);
    CHECK_THROWS_AS(HashingEmbeddingProvider(0), ConfigError);
}

TEST_CASE("malformed cached bytes decode to nothing", "[embedding]") {
    CHECK(decode_vector(std::string(7, 'x')).empty());
    std::vector<float> v = {1.5f, -2.25f};
    CHECK(bit_identical(decode_vector(encode_vector(v)), v));
}

TEST_CASE("provider factory", "[embedding]") {
    EmbeddingConfig cfg;
    cfg.provider = "hashing";
    cfg.dim = 32;
    auto p = make_embedding_provider(cfg);
    CHECK(p->name() == "hashing");
    CHECK(p->embed("m", {"x"}).vectors.front().size() == 32);
    cfg.provider = "ollama";
    CHECK(make_embedding_provider(cfg)->name() == "ollama");
    cfg.provider = "nope";
    CHECK_THROWS_AS(make_embedding_provider(cfg), ConfigError);
}
