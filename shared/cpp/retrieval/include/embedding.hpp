#pragma once
#include "kv_cache.hpp"
#include "rate_limiter.hpp"
#include "tokenizer.hpp"
#include "types.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ragcore {

struct EmbeddingConfig {
    std::string provider{"ollama"}; // ollama | openai | hashing
    std::string url{"http://localhost:11434"};
    std::string model{"bge-m3"};
    std::string api_key;
    std::size_t dim{1024}; // 0 accepts whatever the provider returns
    std::size_t batch_size{100};
    long timeout_ms{120000};
    double requests_per_second{3.0};
    int max_retries{3};
    long long cache_ttl_seconds{2592000};
    bool use_cache{true};
};

struct ProviderResponse {
    std::vector<std::vector<float>> vectors;
    std::size_t token_usage{0};
};

// External embedding service. Must be deterministic for identical (model, texts).
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;
    virtual ProviderResponse embed(const std::string& model, const std::vector<std::string>& texts) = 0;
    virtual std::string name() const = 0;
};

class OllamaEmbeddingProvider : public EmbeddingProvider {
public:
    OllamaEmbeddingProvider(std::string url, long timeout_ms);
    ProviderResponse embed(const std::string& model, const std::vector<std::string>& texts) override;
    std::string name() const override { return "ollama"; }

private:
    std::string url_;
    long timeout_ms_{0};
};

class OpenAiEmbeddingProvider : public EmbeddingProvider {
public:
    OpenAiEmbeddingProvider(std::string url, std::string api_key, long timeout_ms);
    ProviderResponse embed(const std::string& model, const std::vector<std::string>& texts) override;
    std::string name() const override { return "openai"; }

private:
    std::string url_;
    std::string api_key_;
    long timeout_ms_{0};
};

// Offline hashing-trick bag of words, L2-normalized.
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(std::size_t dim = 384);
    ProviderResponse embed(const std::string& model, const std::vector<std::string>& texts) override;
    std::string name() const override { return "hashing"; }

private:
    std::size_t dim_{384};
    ApproxTokenizer tokenizer_;
};

std::unique_ptr<EmbeddingProvider> make_embedding_provider(const EmbeddingConfig& config);

// USD per million tokens; 0 for models not in the table.
double price_per_million_tokens(const std::string& model);

struct EmbeddingStats {
    std::size_t requests{0};
    std::size_t cache_hits{0};
    std::size_t cache_misses{0};
    std::size_t provider_calls{0};
    std::size_t total_tokens{0};
    double total_cost{0.0};

    double cache_hit_rate() const;
};

class EmbeddingClient {
public:
    virtual ~EmbeddingClient() = default;
    virtual EmbeddingResult embed(const std::string& text) = 0;
    // All or nothing: either one result per input, in order, or an exception.
    virtual std::vector<EmbeddingResult> embed_batch(const std::vector<std::string>& texts) = 0;
    virtual const std::string& model() const = 0;
    virtual EmbeddingStats stats() const = 0;
};

// Calls the provider directly: sub-batching, rate limiting, retry, response
// validation and cost accounting.
class ProviderEmbeddingClient : public EmbeddingClient {
public:
    ProviderEmbeddingClient(EmbeddingProvider& provider, EmbeddingConfig config,
                            std::shared_ptr<const Tokenizer> tokenizer = nullptr);

    EmbeddingResult embed(const std::string& text) override;
    std::vector<EmbeddingResult> embed_batch(const std::vector<std::string>& texts) override;
    const std::string& model() const override { return config_.model; }
    EmbeddingStats stats() const override;

private:
    std::vector<EmbeddingResult> call_provider(const std::vector<std::string>& batch);
    void validate(const ProviderResponse& resp, std::size_t expected) const;

    EmbeddingProvider& provider_;
    EmbeddingConfig config_;
    std::shared_ptr<const Tokenizer> tokenizer_;
    RateLimiter limiter_;
    mutable std::mutex stats_mtx_;
    EmbeddingStats stats_;
};

// Content-addressed cache in front of any EmbeddingClient. Cached vectors are
// stored as raw float bytes, so a hit returns a bit-identical vector.
class CachingEmbeddingClient : public EmbeddingClient {
public:
    CachingEmbeddingClient(EmbeddingClient& inner, KeyValueCache& cache, std::chrono::milliseconds ttl,
                           std::shared_ptr<const Tokenizer> tokenizer = nullptr);

    EmbeddingResult embed(const std::string& text) override;
    std::vector<EmbeddingResult> embed_batch(const std::vector<std::string>& texts) override;
    const std::string& model() const override { return inner_.model(); }
    EmbeddingStats stats() const override;

    std::string cache_key(const std::string& text) const;
    std::size_t clear_cache();

private:
    std::optional<std::vector<float>> lookup(const std::string& key);
    void store(const std::string& key, const std::vector<float>& vector);

    EmbeddingClient& inner_;
    KeyValueCache& cache_;
    std::chrono::milliseconds ttl_;
    std::shared_ptr<const Tokenizer> tokenizer_;
    mutable std::mutex stats_mtx_;
    std::size_t requests_{0};
    std::size_t hits_{0};
    std::size_t misses_{0};
};

std::string encode_vector(const std::vector<float>& vector);
std::vector<float> decode_vector(const std::string& bytes);

} // namespace ragcore
