#include <catch2/catch.hpp>
#include "../include/errors.hpp"
#include "../include/lexical_index.hpp"

using namespace ragcore;

namespace {

LexicalIndex corpus() {
    std::vector<LexicalEntry> entries = {
        {"d", "lexical search uses exact terms", {{"kind", "lexical"}}},
        {"a", "the quick brown fox", {{"kind", "animal"}}},
        {"b", "retrieval augmented generation combines search and generation", {{"kind", "rag"}}},
        {"c", "vector search finds neighbours", {{"kind", "vector"}}},
    };
    return LexicalIndex(std::move(entries));
}

}

TEST_CASE("documents sharing no terms with the query are excluded", "[lexical]") {
    auto index = corpus();
    auto hits = index.search("retrieval augmented generation", 10);
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].id == "b");
    CHECK(hits[0].score > 0.0f);
    CHECK(hits[0].metadata["kind"] == "rag");
}

TEST_CASE("a verbatim passage ranks first", "[lexical]") {
    auto index = corpus();
    auto hits = index.search("lexical search uses exact terms", 10);
    REQUIRE(hits.size() == 3);
    CHECK(hits[0].id == "d");
    CHECK(hits[0].score > hits[1].score);
}

TEST_CASE("query terms are normalized like the corpus", "[lexical]") {
    auto index = corpus();
    auto hits = index.search("RETRIEVAL!", 10);
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].id == "b");
    CHECK(index.search("...", 10).empty());
}

TEST_CASE("k limits the hits", "[lexical]") {
    auto index = corpus();
    CHECK(index.search("search", 10).size() == 3);
    CHECK(index.search("search", 2).size() == 2);
    CHECK(index.search("search", 0).empty());
}

TEST_CASE("lexical: equal scores are ordered by id", "[lexical]") {
    std::vector<LexicalEntry> entries = {{"z", "same words here"}, {"m", "same words here"}, {"q", "other text"}};
    LexicalIndex index(std::move(entries));
    auto hits = index.search("words", 10);
    REQUIRE(hits.size() == 2);
    CHECK(hits[0].id == "m");
    CHECK(hits[1].id == "z");
    CHECK(hits[0].score == hits[1].score);
}

TEST_CASE("filters restrict lexical hits", "[lexical]") {
    auto index = corpus();
    auto hits = index.search("search", 10, Filter{{"kind", "vector"}});
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].id == "c");
    CHECK_THROWS_AS(index.search("search", 10, Filter::array({"x"})), RetrievalError);
}

TEST_CASE("an empty index finds nothing", "[lexical]") {
    LexicalIndex index;
    CHECK(index.empty());
    CHECK(index.search("anything", 5).empty());
}

TEST_CASE("rarer terms weigh more", "[lexical]") {
    auto index = corpus();
    CHECK(index.size() == 4);
    CHECK(index.idf("search") > 0.0);
    CHECK(index.idf("fox") > index.idf("search"));
    CHECK(index.idf("absent") > index.idf("fox"));
}

TEST_CASE("shorter documents win on equal term frequency", "[lexical]") {
    std::vector<LexicalEntry> entries = {{"long", "cache one two three four five six seven eight"},
                                         {"short", "cache hit"}};
    LexicalIndex index(std::move(entries));
    auto hits = index.search("cache", 2);
    REQUIRE(hits.size() == 2);
    CHECK(hits[0].id == "short");
}
