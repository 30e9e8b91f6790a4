#include <catch2/catch.hpp>
#include "../include/errors.hpp"
#include "../include/fusion.hpp"

using namespace ragcore;

namespace {

ScoredChunk scored(const std::string& id, float score) {
    ScoredChunk c;
    c.id = id;
    c.text = id + " text";
    c.score = score;
    return c;
}

const ScoredChunk* find(const std::vector<ScoredChunk>& list, const std::string& id) {
    for (auto& c : list) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

}

TEST_CASE("normalization divides by the maximum", "[fusion]") {
    CHECK(normalize_scores({}).empty());
    auto n = normalize_scores({2.0f, 1.0f, 0.5f});
    CHECK(n[0] == Approx(1.0f));
    CHECK(n[1] == Approx(0.5f));
    CHECK(n[2] == Approx(0.25f));

    auto clamped = normalize_scores({-1.0f, 4.0f});
    CHECK(clamped[0] == 0.0f);
    CHECK(clamped[1] == Approx(1.0f));

    CHECK(normalize_scores({0.0f, 0.0f}) == std::vector<float>{0.0f, 0.0f});
    CHECK(normalize_scores({-3.0f}) == std::vector<float>{0.0f});
}

TEST_CASE("fusion covers the union of both lists", "[fusion]") {
    std::vector<ScoredChunk> lexical = {scored("a", 8.0f), scored("b", 4.0f)};
    std::vector<ScoredChunk> vector = {scored("b", 0.9f), scored("c", 0.45f)};
    auto fused = fuse_scores(lexical, vector, 0.5f);
    REQUIRE(fused.size() == 3);

    auto b = find(fused, "b");
    REQUIRE(b);
    CHECK(b->lexical_score == Approx(0.5f));
    CHECK(b->vector_score == Approx(1.0f));
    CHECK(b->score == Approx(0.75f));
    CHECK(b->text == "b text");

    auto c = find(fused, "c");
    REQUIRE(c);
    CHECK(c->lexical_score == 0.0f);
    CHECK(c->score == Approx(0.25f));

    CHECK(fused[0].id == "b");
    CHECK(fused[1].id == "a");
    CHECK(fused[2].id == "c");
}

TEST_CASE("alpha selects the contributing side", "[fusion]") {
    std::vector<ScoredChunk> lexical = {scored("lex", 3.0f), scored("vec", 1.0f)};
    std::vector<ScoredChunk> vector = {scored("vec", 0.8f), scored("lex", 0.2f)};

    auto all_lexical = fuse_scores(lexical, vector, 1.0f);
    CHECK(all_lexical.front().id == "lex");
    CHECK(all_lexical.front().score == Approx(1.0f));

    auto all_vector = fuse_scores(lexical, vector, 0.0f);
    CHECK(all_vector.front().id == "vec");
    CHECK(all_vector.front().score == Approx(1.0f));
}

TEST_CASE("raising alpha never helps a vector-only candidate", "[fusion]") {
    std::vector<ScoredChunk> lexical = {scored("lex", 3.0f), scored("both", 2.0f)};
    std::vector<ScoredChunk> vector = {scored("vec", 0.9f), scored("both", 0.6f)};
    float previous = 2.0f;
    for (int step = 0; step <= 10; ++step) {
        float alpha = step / 10.0f;
        auto fused = fuse_scores(lexical, vector, alpha);
        auto v = find(fused, "vec");
        REQUIRE(v);
        CHECK(v->score <= previous);
        previous = v->score;
    }
}

TEST_CASE("equal fused scores are ordered by id", "[fusion]") {
    auto fused = fuse_scores({scored("y", 1.0f)}, {scored("x", 1.0f)}, 0.5f);
    REQUIRE(fused.size() == 2);
    CHECK(fused[0].id == "x");
    CHECK(fused[1].id == "y");
}

TEST_CASE("empty sides fuse to the other side", "[fusion]") {
    CHECK(fuse_scores({}, {}, 0.5f).empty());
    auto only_vector = fuse_scores({}, {scored("v", 0.4f)}, 0.3f);
    REQUIRE(only_vector.size() == 1);
    CHECK(only_vector[0].score == Approx(0.7f));
}

TEST_CASE("alpha outside the unit interval is rejected", "[fusion]") {
    CHECK_THROWS_AS(fuse_scores({}, {}, -0.1f), RetrievalError);
    CHECK_THROWS_AS(fuse_scores({}, {}, 1.5f), RetrievalError);
}
