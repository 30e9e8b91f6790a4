#include "../include/embedding.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/log.hpp"
#include "../include/retry.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <unordered_map>

using json = nlohmann::json;

namespace ragcore {

namespace {
// 429 and 5xx are worth retrying; other failures are the caller's fault.
void check_status(const HttpResponse& r, const std::string& what) {
    if (r.ok()) return;
    std::string msg = what + " failed: status " + std::to_string(r.status);
    if (r.status == 429 || r.status >= 500) throw ProviderUnavailable(msg);
    throw RetrievalError(msg + ": " + r.body.substr(0, 200));
}

std::vector<float> to_floats(const json& arr) {
    std::vector<float> v;
    v.reserve(arr.size());
    for (auto& x : arr) v.push_back(x.get<float>());
    return v;
}

std::uint64_t fnv1a(const std::string& s) {
    std::uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}
}

OllamaEmbeddingProvider::OllamaEmbeddingProvider(std::string url, long timeout_ms)
    : url_(std::move(url)), timeout_ms_(timeout_ms) {}

ProviderResponse OllamaEmbeddingProvider::embed(const std::string& model, const std::vector<std::string>& texts) {
    json body = {
        {"model", model},
        {"input", texts}
    };
    auto r = http_post_json(url_ + "/api/embed", body.dump(), timeout_ms_);
    check_status(r, "ollama embedding");
    ProviderResponse out;
    try {
        auto data = json::parse(r.body);
        for (auto& e : data.at("embeddings")) out.vectors.push_back(to_floats(e));
        out.token_usage = data.value("prompt_eval_count", 0);
    } catch (const json::exception& e) {
        throw ProviderUnavailable(std::string("ollama embedding: malformed response: ") + e.what());
    }
    return out;
}

OpenAiEmbeddingProvider::OpenAiEmbeddingProvider(std::string url, std::string api_key, long timeout_ms)
    : url_(std::move(url)), api_key_(std::move(api_key)), timeout_ms_(timeout_ms) {}

ProviderResponse OpenAiEmbeddingProvider::embed(const std::string& model, const std::vector<std::string>& texts) {
    json body = {
        {"model", model},
        {"input", texts}
    };
    std::vector<std::string> headers;
    if (!api_key_.empty()) headers.push_back("Authorization: Bearer " + api_key_);
    auto r = http_post_json(url_ + "/v1/embeddings", body.dump(), timeout_ms_, headers);
    check_status(r, "openai embedding");
    ProviderResponse out;
    try {
        auto data = json::parse(r.body);
        auto& items = data.at("data");
        out.vectors.resize(items.size());
        for (auto& item : items) {
            std::size_t idx = item.value("index", std::size_t(0));
            if (idx >= out.vectors.size()) {
                throw ProviderUnavailable("openai embedding: index out of range");
            }
            out.vectors[idx] = to_floats(item.at("embedding"));
        }
        if (data.contains("usage")) out.token_usage = data["usage"].value("total_tokens", 0);
    } catch (const json::exception& e) {
        throw ProviderUnavailable(std::string("openai embedding: malformed response: ") + e.what());
    }
    return out;
}

HashingEmbeddingProvider::HashingEmbeddingProvider(std::size_t dim) : dim_(dim) {
    if (dim_ == 0) throw ConfigError("hashing embedding dim must be > 0");
}

ProviderResponse HashingEmbeddingProvider::embed(const std::string&, const std::vector<std::string>& texts) {
    ProviderResponse out;
    out.vectors.reserve(texts.size());
    for (auto& t : texts) {
        std::vector<float> v(dim_, 0.0f);
        for (auto& term : default_lexical_tokens(t)) {
            std::uint64_t h = fnv1a(term);
            float sign = (h >> 63) ? -1.0f : 1.0f;
            v[h % dim_] += sign;
        }
        double norm = 0.0;
        for (float x : v) norm += double(x) * x;
        if (norm > 0.0) {
            float inv = float(1.0 / std::sqrt(norm));
            for (auto& x : v) x *= inv;
        }
        out.vectors.push_back(std::move(v));
        out.token_usage += tokenizer_.count(t);
    }
    return out;
}

std::unique_ptr<EmbeddingProvider> make_embedding_provider(const EmbeddingConfig& config) {
    if (config.provider == "ollama") {
        return std::make_unique<OllamaEmbeddingProvider>(config.url, config.timeout_ms);
    }
    if (config.provider == "openai") {
        return std::make_unique<OpenAiEmbeddingProvider>(config.url, config.api_key, config.timeout_ms);
    }
    if (config.provider == "hashing") {
        return std::make_unique<HashingEmbeddingProvider>(config.dim ? config.dim : 384);
    }
    throw ConfigError("unknown embedding provider: " + config.provider);
}

double price_per_million_tokens(const std::string& model) {
    static const std::unordered_map<std::string, double> prices = {
        {"text-embedding-3-large", 0.13},
        {"text-embedding-3-small", 0.02},
        {"text-embedding-ada-002", 0.10},
    };
    auto it = prices.find(model);
    return it == prices.end() ? 0.0 : it->second;
}

double EmbeddingStats::cache_hit_rate() const {
    std::size_t lookups = cache_hits + cache_misses;
    return lookups ? double(cache_hits) / double(lookups) : 0.0;
}

std::string encode_vector(const std::vector<float>& vector) {
    std::string bytes(vector.size() * sizeof(float), '\0');
    if (!vector.empty()) std::memcpy(&bytes[0], vector.data(), bytes.size());
    return bytes;
}

std::vector<float> decode_vector(const std::string& bytes) {
    if (bytes.size() % sizeof(float) != 0) return {};
    std::vector<float> v(bytes.size() / sizeof(float));
    if (!v.empty()) std::memcpy(v.data(), bytes.data(), bytes.size());
    return v;
}

ProviderEmbeddingClient::ProviderEmbeddingClient(EmbeddingProvider& provider, EmbeddingConfig config,
                                                 std::shared_ptr<const Tokenizer> tokenizer)
    : provider_(provider),
      config_(std::move(config)),
      tokenizer_(tokenizer ? std::move(tokenizer) : std::make_shared<ApproxTokenizer>()),
      limiter_(config_.requests_per_second) {
    if (config_.batch_size == 0) throw ConfigError("embedding batch_size must be > 0");
}

EmbeddingResult ProviderEmbeddingClient::embed(const std::string& text) {
    auto results = embed_batch({text});
    return std::move(results.front());
}

std::vector<EmbeddingResult> ProviderEmbeddingClient::embed_batch(const std::vector<std::string>& texts) {
    std::vector<EmbeddingResult> out;
    out.reserve(texts.size());
    for (std::size_t i = 0; i < texts.size(); i += config_.batch_size) {
        std::size_t end = std::min(texts.size(), i + config_.batch_size);
        std::vector<std::string> batch(texts.begin() + i, texts.begin() + end);
        auto results = call_provider(batch);
        for (auto& r : results) out.push_back(std::move(r));
    }
    std::lock_guard<std::mutex> lock(stats_mtx_);
    stats_.requests += texts.size();
    return out;
}

void ProviderEmbeddingClient::validate(const ProviderResponse& resp, std::size_t expected) const {
    if (resp.vectors.size() != expected) {
        throw ProviderUnavailable(provider_.name() + " returned " + std::to_string(resp.vectors.size()) +
                                  " vectors for " + std::to_string(expected) + " texts");
    }
    for (auto& v : resp.vectors) {
        if (v.empty()) throw ProviderUnavailable(provider_.name() + " returned an empty vector");
        if (config_.dim > 0 && v.size() != config_.dim) {
            throw DimensionMismatch(config_.dim, v.size(), provider_.name() + " embedding");
        }
    }
}

std::vector<EmbeddingResult> ProviderEmbeddingClient::call_provider(const std::vector<std::string>& batch) {
    RetryPolicy policy;
    policy.max_retries = config_.max_retries;
    auto resp = with_retry(policy, provider_.name() + " embedding", [&] {
        limiter_.acquire();
        auto r = provider_.embed(config_.model, batch);
        validate(r, batch.size());
        return r;
    });

    std::vector<std::size_t> counts;
    counts.reserve(batch.size());
    std::size_t counted = 0;
    for (auto& t : batch) {
        counts.push_back(count_tokens_or_estimate(*tokenizer_, t));
        counted += counts.back();
    }
    std::size_t usage = resp.token_usage ? resp.token_usage : counted;
    double price = price_per_million_tokens(config_.model) / 1e6;

    std::vector<EmbeddingResult> out;
    out.reserve(batch.size());
    for (std::size_t j = 0; j < batch.size(); ++j) {
        EmbeddingResult r;
        r.text = batch[j];
        r.vector = std::move(resp.vectors[j]);
        r.model = config_.model;
        r.token_count = counts[j];
        r.cost = double(counts[j]) * price;
        out.push_back(std::move(r));
    }

    {
        std::lock_guard<std::mutex> lock(stats_mtx_);
        stats_.provider_calls += 1;
        stats_.total_tokens += usage;
        stats_.total_cost += double(usage) * price;
    }
    log_debug("embedded batch of " + std::to_string(batch.size()) + " texts via " + provider_.name() +
              " (" + std::to_string(usage) + " tokens)");
    return out;
}

EmbeddingStats ProviderEmbeddingClient::stats() const {
    std::lock_guard<std::mutex> lock(stats_mtx_);
    return stats_;
}

CachingEmbeddingClient::CachingEmbeddingClient(EmbeddingClient& inner, KeyValueCache& cache,
                                               std::chrono::milliseconds ttl,
                                               std::shared_ptr<const Tokenizer> tokenizer)
    : inner_(inner),
      cache_(cache),
      ttl_(ttl),
      tokenizer_(tokenizer ? std::move(tokenizer) : std::make_shared<ApproxTokenizer>()) {}

std::string CachingEmbeddingClient::cache_key(const std::string& text) const {
    return "emb:" + inner_.model() + ":" + sha256_hex(text);
}

std::optional<std::vector<float>> CachingEmbeddingClient::lookup(const std::string& key) {
    try {
        auto bytes = cache_.get(key);
        if (!bytes) return std::nullopt;
        auto v = decode_vector(*bytes);
        if (v.empty()) {
            log_warn("discarding malformed cache entry " + key);
            return std::nullopt;
        }
        return v;
    } catch (const std::exception& e) {
        log_warn(std::string("embedding cache read failed, treating as miss: ") + e.what());
        return std::nullopt;
    }
}

void CachingEmbeddingClient::store(const std::string& key, const std::vector<float>& vector) {
    try {
        cache_.set(key, encode_vector(vector), ttl_);
    } catch (const std::exception& e) {
        log_warn(std::string("embedding cache write failed: ") + e.what());
    }
}

EmbeddingResult CachingEmbeddingClient::embed(const std::string& text) {
    auto results = embed_batch({text});
    return std::move(results.front());
}

std::vector<EmbeddingResult> CachingEmbeddingClient::embed_batch(const std::vector<std::string>& texts) {
    std::vector<std::optional<EmbeddingResult>> slots(texts.size());
    std::vector<std::string> missing;
    std::unordered_map<std::string, std::vector<std::size_t>> waiting;
    std::size_t hits = 0, misses = 0;

    for (std::size_t i = 0; i < texts.size(); ++i) {
        auto pending = waiting.find(texts[i]);
        if (pending != waiting.end()) {
            pending->second.push_back(i);
            continue;
        }
        auto cached = lookup(cache_key(texts[i]));
        if (cached) {
            EmbeddingResult r;
            r.text = texts[i];
            r.vector = std::move(*cached);
            r.model = inner_.model();
            r.token_count = count_tokens_or_estimate(*tokenizer_, texts[i]);
            r.from_cache = true;
            slots[i] = std::move(r);
            ++hits;
        } else {
            missing.push_back(texts[i]);
            waiting[texts[i]].push_back(i);
            ++misses;
        }
    }

    if (!missing.empty()) {
        auto fresh = inner_.embed_batch(missing);
        if (fresh.size() != missing.size()) {
            throw ProviderUnavailable("embedding client returned " + std::to_string(fresh.size()) +
                                      " results for " + std::to_string(missing.size()) + " texts");
        }
        for (std::size_t j = 0; j < missing.size(); ++j) {
            store(cache_key(missing[j]), fresh[j].vector);
            auto& idxs = waiting[missing[j]];
            for (std::size_t n = 0; n < idxs.size(); ++n) {
                EmbeddingResult r = fresh[j];
                if (n > 0) r.cost = 0.0;
                slots[idxs[n]] = std::move(r);
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(stats_mtx_);
        requests_ += texts.size();
        hits_ += hits;
        misses_ += misses;
    }

    std::vector<EmbeddingResult> out;
    out.reserve(texts.size());
    for (auto& s : slots) out.push_back(std::move(*s));
    return out;
}

EmbeddingStats CachingEmbeddingClient::stats() const {
    EmbeddingStats s = inner_.stats();
    std::lock_guard<std::mutex> lock(stats_mtx_);
    s.requests = requests_;
    s.cache_hits = hits_;
    s.cache_misses = misses_;
    return s;
}

std::size_t CachingEmbeddingClient::clear_cache() {
    std::size_t removed = cache_.clear("emb:" + inner_.model() + ":");
    log_info("cleared " + std::to_string(removed) + " cached embeddings");
    return removed;
}

} // namespace ragcore
