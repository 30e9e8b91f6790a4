#include <catch2/catch.hpp>
#include "../include/chunker.hpp"
#include "../include/errors.hpp"
#include <stdexcept>

using namespace ragcore;

namespace {

Document make_doc(const std::string& id, const std::string& text) {
    Document d;
    d.id = id;
    d.text = text;
    d.metadata = {{"source", "unit"}};
    return d;
}

// Stitches chunks back together, dropping the part of each chunk that the
// previous one already covered.
std::string rebuild(const std::string& source, const std::vector<Chunk>& chunks) {
    std::string out;
    std::size_t covered = 0;
    for (auto& c : chunks) {
        REQUIRE(c.start_offset < c.end_offset);
        REQUIRE(c.start_offset <= covered);
        REQUIRE(c.end_offset > covered);
        REQUIRE(c.text == source.substr(c.start_offset, c.end_offset - c.start_offset));
        out += c.text.substr(covered - c.start_offset);
        covered = c.end_offset;
    }
    return out;
}

std::vector<std::string> token_strings(const Tokenizer& tok, const std::string& text) {
    std::vector<std::string> out;
    for (auto& s : tok.tokenize(text)) out.push_back(text.substr(s.begin, s.end - s.begin));
    return out;
}

std::string plain_text() {
    std::string s;
    for (int p = 0; p < 6; ++p) {
        for (int i = 0; i < 7; ++i) {
            s += "Sentence " + std::to_string(i) + " of paragraph " + std::to_string(p) +
                 " talks about retrieval, ranking and chunk boundaries. ";
        }
        s += "\n\n";
    }
    return s;
}

std::string markdown_text() {
    std::string s = "# Guide\n\nIntro text that explains the overall idea of the guide in a few words.\n";
    for (int h = 0; h < 5; ++h) {
        s += "\n## Section " + std::to_string(h) + "\n\n";
        for (int i = 0; i < 6; ++i) s += "Line " + std::to_string(i) + " with some details about section content.\n";
    }
    return s;
}

std::string code_text() {
    std::string s = "#include <vector>\n\n";
    for (int f = 0; f < 5; ++f) {
        s += "struct Widget" + std::to_string(f) + " {\n";
        for (int i = 0; i < 6; ++i) s += "    int field_" + std::to_string(i) + " = " + std::to_string(i * f) + ";\n";
        s += "};\n\n";
    }
    return s;
}

class ThrowingTokenizer : public Tokenizer {
public:
    std::vector<TokenSpan> tokenize(const std::string&) const override { throw std::runtime_error("bad encoding"); }
    std::size_t count(const std::string&) const override { throw std::runtime_error("bad encoding"); }
};

}

TEST_CASE("blank documents produce no chunks", "[chunker]") {
    Chunker chunker;
    CHECK(chunker.chunk(make_doc("d", "")).empty());
    CHECK(chunker.chunk(make_doc("d", "   \n\t  \n")).empty());
}

TEST_CASE("a document within the target is a single chunk", "[chunker]") {
    Chunker chunker(ChunkerConfig{50, 5, 0});
    auto doc = make_doc("short", "Just one small paragraph.");
    auto chunks = chunker.chunk(doc);
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0].text == doc.text);
    CHECK(chunks[0].start_offset == 0);
    CHECK(chunks[0].end_offset == doc.text.size());
    CHECK(chunks[0].total_in_document == 1);
    CHECK(chunks[0].document_id == "short");
}

TEST_CASE("chunks reconstruct the source and respect the token target", "[chunker]") {
    ApproxTokenizer tok;
    std::vector<std::string> texts = {plain_text(), markdown_text(), code_text(),
                                      std::string(300, 'x') + " tail words here " + std::string(40, '!')};
    std::vector<ChunkStrategy> strategies = {ChunkStrategy::recursive, ChunkStrategy::token_window,
                                             ChunkStrategy::paragraph, ChunkStrategy::sentence};
    std::vector<std::pair<std::size_t, std::size_t>> shapes = {{8, 0}, {16, 3}, {40, 10}, {100, 99}};

    Chunker chunker;
    for (auto& text : texts) {
        auto doc = make_doc("doc", text);
        for (auto strategy : strategies) {
            for (auto& shape : shapes) {
                auto chunks = chunker.chunk(doc, shape.first, shape.second, strategy);
                REQUIRE_FALSE(chunks.empty());
                CHECK(chunks.front().start_offset == 0);
                CHECK(chunks.back().end_offset == text.size());
                CHECK(rebuild(text, chunks) == text);
                for (auto& c : chunks) {
                    CHECK(c.token_count <= shape.first);
                    CHECK(c.token_count == tok.count(c.text));
                }
            }
        }
    }
}

TEST_CASE("token window carries exactly the overlap tokens", "[chunker]") {
    Chunker chunker;
    ApproxTokenizer tok;
    auto doc = make_doc("three", "The quick brown fox jumps over the lazy dog. A second sentence follows here. "
                                 "Finally the third one ends.");
    auto chunks = chunker.chunk(doc, 8, 2, ChunkStrategy::token_window);
    REQUIRE(chunks.size() >= 2);
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        CHECK(chunks[i].token_count <= 8);
        if (i + 1 == chunks.size()) break;
        auto a = token_strings(tok, chunks[i].text);
        auto b = token_strings(tok, chunks[i + 1].text);
        REQUIRE(a.size() >= 2);
        REQUIRE(b.size() >= 2);
        CHECK(a[a.size() - 2] == b[0]);
        CHECK(a[a.size() - 1] == b[1]);
    }
}

TEST_CASE("chunk ids are derived from document id and index", "[chunker]") {
    Chunker chunker(ChunkerConfig{20, 4, 0});
    auto doc = make_doc("doc-1", plain_text());
    auto first = chunker.chunk(doc);
    auto second = chunker.chunk(doc);
    REQUIRE(first.size() == second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        CHECK(first[i].id == second[i].id);
        CHECK(first[i].id == make_chunk_id("doc-1", first[i].index));
        CHECK(first[i].id.size() == 16);
        CHECK(first[i].total_in_document == (int)first.size());
    }
    auto other = chunker.chunk(make_doc("doc-2", plain_text()));
    CHECK(other.front().id != first.front().id);
}

TEST_CASE("chunk metadata extends the document metadata", "[chunker]") {
    Chunker chunker(ChunkerConfig{20, 4, 0});
    auto chunks = chunker.chunk(make_doc("m", markdown_text()));
    REQUIRE(chunks.size() > 1);
    auto& md = chunks[1].metadata;
    CHECK(md["source"] == "unit");
    CHECK(md["document_id"] == "m");
    CHECK(md["content_type"] == "markdown");
    CHECK(md["strategy"] == "recursive");
    CHECK(md["chunk_index"] == 1);
    CHECK(md["total_chunks"] == (int)chunks.size());
}

TEST_CASE("content type detection", "[chunker]") {
    CHECK(detect_content_type("def handler(event):\n    return event\n") == ContentType::code);
    CHECK(detect_content_type("int main() { return 0; }") == ContentType::code);
    CHECK(detect_content_type(code_text()) == ContentType::code);
    CHECK(detect_content_type("# Title\n\nSome words.") == ContentType::markdown);
    CHECK(detect_content_type("Plain words. More plain words.") == ContentType::plain);
    CHECK(detect_content_type("#hashtag is not a heading") == ContentType::plain);
}

TEST_CASE("separator tables follow content type", "[chunker]") {
    auto code = separators_for(ContentType::code, ChunkStrategy::recursive);
    CHECK(code.front() == "\n\nclass ");
    CHECK(code.back().empty());
    auto md = separators_for(ContentType::markdown, ChunkStrategy::recursive);
    CHECK(md.front() == "\n# ");
    auto plain = separators_for(ContentType::plain, ChunkStrategy::recursive);
    CHECK(plain.front() == "\n\n\n");
    CHECK(separators_for(ContentType::code, ChunkStrategy::paragraph).front() == "\n\n\n");
}

TEST_CASE("small chunks merge into the earliest one", "[chunker]") {
    Chunker chunker;
    std::string source = "aa bb cc dd ee ff gg hh";
    auto doc = make_doc("small", source);
    auto chunks = chunker.chunk(doc, 2, 0, ChunkStrategy::token_window);
    REQUIRE(chunks.size() == 4);

    auto merged = chunker.merge_small_chunks(source, chunks, 3);
    REQUIRE(merged.size() == 2);
    CHECK(merged[0].id == chunks[0].id);
    CHECK(merged[0].start_offset == chunks[0].start_offset);
    CHECK(merged[0].end_offset == chunks[1].end_offset);
    CHECK(merged[0].text == source.substr(0, chunks[1].end_offset));
    CHECK(merged[1].id == chunks[2].id);
    CHECK(merged[1].total_in_document == 2);
    CHECK(rebuild(source, merged) == source);
}

TEST_CASE("configured minimum merges during chunking", "[chunker]") {
    Chunker chunker(ChunkerConfig{2, 0, 3});
    std::string source = "aa bb cc dd ee ff gg hh";
    auto chunks = chunker.chunk(make_doc("small", source), ChunkStrategy::token_window);
    CHECK(chunks.size() == 2);
    CHECK(rebuild(source, chunks) == source);
}

TEST_CASE("overlap is clamped and a zero target is rejected", "[chunker]") {
    Chunker chunker;
    auto doc = make_doc("c", plain_text());
    auto chunks = chunker.chunk(doc, 10, 50, ChunkStrategy::token_window);
    REQUIRE(chunks.size() > 1);
    CHECK(rebuild(doc.text, chunks) == doc.text);
    CHECK_THROWS_AS(chunker.chunk(doc, 0, 0, ChunkStrategy::recursive), ConfigError);
    CHECK_THROWS_AS(Chunker(ChunkerConfig{0, 0, 0}), ConfigError);
}

TEST_CASE("a failing tokenizer falls back to the byte estimate", "[chunker]") {
    Chunker chunker(ChunkerConfig{10, 2, 0}, std::make_shared<ThrowingTokenizer>());
    auto doc = make_doc("f", plain_text());
    for (auto strategy : {ChunkStrategy::recursive, ChunkStrategy::token_window}) {
        auto chunks = chunker.chunk(doc, strategy);
        REQUIRE(chunks.size() > 1);
        CHECK(rebuild(doc.text, chunks) == doc.text);
        for (auto& c : chunks) CHECK(c.token_count == estimate_tokens(c.text.size()));
    }
}

TEST_CASE("conversations chunk by message window", "[chunker]") {
    Chunker chunker;
    std::vector<ConversationMessage> messages = {
        {"user", "hi"}, {"assistant", "hello"}, {"user", "what is bm25"}, {"assistant", "a ranking function"},
        {"user", "thanks"}};
    auto chunks = chunker.chunk_conversation("conv-1", messages, 2);
    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0].text == "user: hi\n\nassistant: hello");
    CHECK(chunks[2].text == "user: thanks");
    CHECK(chunks[0].metadata["type"] == "conversation");
    CHECK(chunks[0].metadata["message_count"] == 2);
    CHECK(chunks[2].metadata["start_index"] == 4);
    CHECK(chunks[1].metadata["document_id"] == "conv-1");
    CHECK(chunks[1].id == make_chunk_id("conv-1", 1));
    CHECK(chunker.chunk_conversation("empty", {}, 2).empty());
}

TEST_CASE("chunk statistics", "[chunker]") {
    Chunker chunker;
    auto chunks = chunker.chunk(make_doc("s", plain_text()), 20, 0, ChunkStrategy::token_window);
    auto stats = chunk_stats(chunks);
    CHECK(stats.total_chunks == chunks.size());
    CHECK(stats.max_tokens <= 20);
    CHECK(stats.min_tokens >= 1);
    CHECK(stats.avg_tokens == Approx(double(stats.total_tokens) / double(chunks.size())));
    CHECK(chunk_stats({}).total_chunks == 0);
}

TEST_CASE("strategy names parse with a recursive fallback", "[chunker]") {
    CHECK(parse_chunk_strategy("token_window") == ChunkStrategy::token_window);
    CHECK(parse_chunk_strategy("paragraph") == ChunkStrategy::paragraph);
    CHECK(parse_chunk_strategy("sentence") == ChunkStrategy::sentence);
    CHECK(parse_chunk_strategy("no-such-strategy") == ChunkStrategy::recursive);
    CHECK(to_string(ChunkStrategy::token_window) == "token_window");
}
