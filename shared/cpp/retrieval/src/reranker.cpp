#include "../include/reranker.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

namespace ragcore {

std::vector<RerankHit> parse_rerank_response(const std::string& body, std::size_t candidates) {
    std::vector<RerankHit> hits;
    try {
        auto data = json::parse(body);
        for (auto& r : data.at("results")) {
            long long idx = r.at("index").get<long long>();
            if (idx < 0 || (std::size_t)idx >= candidates) {
                throw ProviderUnavailable("reranker returned index " + std::to_string(idx) + " for " +
                                          std::to_string(candidates) + " candidates");
            }
            RerankHit h;
            h.index = (std::size_t)idx;
            if (r.contains("relevance_score")) h.relevance_score = r["relevance_score"].get<float>();
            else h.relevance_score = r.at("score").get<float>();
            hits.push_back(h);
        }
    } catch (const json::exception& e) {
        throw ProviderUnavailable(std::string("reranker: malformed response: ") + e.what());
    }
    std::stable_sort(hits.begin(), hits.end(),
                     [](const RerankHit& a, const RerankHit& b) { return a.relevance_score > b.relevance_score; });
    return hits;
}

HttpReranker::HttpReranker(RerankConfig config)
    : config_(std::move(config)), limiter_(config_.requests_per_second) {
    retry_.max_retries = config_.max_retries;
}

std::vector<RerankHit> HttpReranker::rerank(const std::string& query, const std::vector<std::string>& texts,
                                            std::size_t top_n) {
    if (texts.empty() || top_n == 0) return {};
    json body = {
        {"model", config_.model},
        {"query", query},
        {"documents", texts},
        {"top_n", std::min(top_n, texts.size())}
    };
    std::vector<std::string> headers;
    if (!config_.api_key.empty()) headers.push_back("Authorization: Bearer " + config_.api_key);
    auto hits = with_retry(retry_, "rerank", [&] {
        limiter_.acquire();
        auto r = http_post_json(config_.url + "/v1/rerank", body.dump(), config_.timeout_ms, headers);
        if (!r.ok()) throw ProviderUnavailable("rerank failed: status " + std::to_string(r.status));
        return parse_rerank_response(r.body, texts.size());
    });
    if (hits.size() > top_n) hits.resize(top_n);
    return hits;
}

std::unique_ptr<Reranker> make_reranker(const RerankConfig& config) {
    if (config.provider == "none" || config.provider.empty()) return nullptr;
    if (config.provider == "cohere" || config.provider == "http") return std::make_unique<HttpReranker>(config);
    throw ConfigError("unknown rerank provider: " + config.provider);
}

} // namespace ragcore
