#pragma once
#include "rate_limiter.hpp"
#include "retry.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace ragcore {

struct RerankHit {
    std::size_t index{0};
    float relevance_score{0.0f};
};

class Reranker {
public:
    virtual ~Reranker() = default;
    // Hits reference positions in texts, best first, at most top_n of them.
    virtual std::vector<RerankHit> rerank(const std::string& query, const std::vector<std::string>& texts,
                                          std::size_t top_n) = 0;
};

struct RerankConfig {
    std::string provider{"none"}; // none | cohere
    std::string url{"https://api.cohere.ai"};
    std::string model{"rerank-english-v3.0"};
    std::string api_key;
    long timeout_ms{10000};
    double requests_per_second{5.0};
    int max_retries{2};
};

// Cohere-compatible POST /v1/rerank.
class HttpReranker : public Reranker {
public:
    explicit HttpReranker(RerankConfig config);
    std::vector<RerankHit> rerank(const std::string& query, const std::vector<std::string>& texts,
                                  std::size_t top_n) override;

private:
    RerankConfig config_;
    RateLimiter limiter_;
    RetryPolicy retry_;
};

// Accepts results[].relevance_score or results[].score. Indices outside
// [0, candidates) make the whole response unusable.
std::vector<RerankHit> parse_rerank_response(const std::string& body, std::size_t candidates);

// nullptr when reranking is disabled.
std::unique_ptr<Reranker> make_reranker(const RerankConfig& config);

} // namespace ragcore
