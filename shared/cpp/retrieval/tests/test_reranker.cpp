#include <catch2/catch.hpp>
#include "../include/errors.hpp"
#include "../include/reranker.hpp"

using namespace ragcore;

TEST_CASE("rerank responses are parsed best first", "[reranker]") {
    auto hits = parse_rerank_response(
        R"({"results":[{"index":2,"relevance_score":0.1},{"index":0,"relevance_score":0.9},{"index":1,"score":0.5}]})",
        3);
    REQUIRE(hits.size() == 3);
    CHECK(hits[0].index == 0);
    CHECK(hits[0].relevance_score == Approx(0.9f));
    CHECK(hits[1].index == 1);
    CHECK(hits[2].index == 2);
}

TEST_CASE("equal rerank scores keep response order", "[reranker]") {
    auto hits = parse_rerank_response(R"({"results":[{"index":1,"score":0.5},{"index":0,"score":0.5}]})", 2);
    REQUIRE(hits.size() == 2);
    CHECK(hits[0].index == 1);
    CHECK(hits[1].index == 0);
}

TEST_CASE("unusable rerank responses are rejected", "[reranker]") {
    CHECK_THROWS_AS(parse_rerank_response(R"({"results":[{"index":3,"score":0.5}]})", 3), ProviderUnavailable);
    CHECK_THROWS_AS(parse_rerank_response(R"({"results":[{"index":-1,"score":0.5}]})", 3), ProviderUnavailable);
    CHECK_THROWS_AS(parse_rerank_response("not json", 3), ProviderUnavailable);
    CHECK_THROWS_AS(parse_rerank_response(R"({"data":[]})", 3), ProviderUnavailable);
    CHECK_THROWS_AS(parse_rerank_response(R"({"results":[{"index":0}]})", 3), ProviderUnavailable);
    CHECK(parse_rerank_response(R"({"results":[]})", 3).empty());
}

TEST_CASE("reranker factory", "[reranker]") {
    RerankConfig cfg;
    CHECK(make_reranker(cfg) == nullptr);
    cfg.provider = "cohere";
    CHECK(make_reranker(cfg) != nullptr);
    cfg.provider = "magic";
    CHECK_THROWS_AS(make_reranker(cfg), ConfigError);
}

TEST_CASE("an unreachable reranker reports unavailability", "[reranker]") {
    RerankConfig cfg;
    cfg.provider = "cohere";
    cfg.url = "http://127.0.0.1:1";
    cfg.timeout_ms = 1000;
    cfg.max_retries = 0;
    cfg.requests_per_second = 0.0;
    HttpReranker reranker(cfg);
    CHECK_THROWS_AS(reranker.rerank("q", {"a", "b"}, 2), ProviderUnavailable);
    CHECK(reranker.rerank("q", {}, 2).empty());
}
