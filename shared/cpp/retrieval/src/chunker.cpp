#include "../include/chunker.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cctype>
#include <deque>
#include <sstream>

namespace ragcore {

std::string to_string(ContentType type) {
    switch (type) {
        case ContentType::plain: return "text";
        case ContentType::markdown: return "markdown";
        case ContentType::code: return "code";
    }
    return "text";
}

std::string to_string(ChunkStrategy strategy) {
    switch (strategy) {
        case ChunkStrategy::recursive: return "recursive";
        case ChunkStrategy::token_window: return "token_window";
        case ChunkStrategy::paragraph: return "paragraph";
        case ChunkStrategy::sentence: return "sentence";
    }
    return "recursive";
}

ChunkStrategy parse_chunk_strategy(const std::string& name) {
    if (name == "recursive") return ChunkStrategy::recursive;
    if (name == "token_window" || name == "sliding_window") return ChunkStrategy::token_window;
    if (name == "paragraph") return ChunkStrategy::paragraph;
    if (name == "sentence") return ChunkStrategy::sentence;
    log_warn("unknown chunking strategy '" + name + "', using recursive");
    return ChunkStrategy::recursive;
}

static bool starts_with(const std::string& s, size_t pos, const char* prefix) {
    return s.compare(pos, std::char_traits<char>::length(prefix), prefix) == 0;
}

ContentType detect_content_type(const std::string& text) {
    static const char* code_prefixes[] = {
        "def ", "class ", "import ", "from ", "function ", "const ", "let ", "var ", "#include"
    };
    bool markdown = false;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        size_t p = line.find_first_not_of(" \t");
        if (p != std::string::npos) {
            for (auto* prefix : code_prefixes) {
                if (starts_with(line, p, prefix)) return ContentType::code;
            }
        }
        size_t hashes = 0;
        while (hashes < line.size() && line[hashes] == '#') ++hashes;
        if (hashes >= 1 && hashes <= 6 && hashes < line.size() &&
            std::isspace(static_cast<unsigned char>(line[hashes]))) {
            markdown = true;
        }
    }
    auto open = text.find('{');
    if (open != std::string::npos && text.find('}', open + 1) != std::string::npos) return ContentType::code;
    return markdown ? ContentType::markdown : ContentType::plain;
}

std::vector<std::string> separators_for(ContentType type, ChunkStrategy strategy) {
    static const std::vector<std::string> plain = {
        "\n\n\n", "\n\n", "\n", ". ", "! ", "? ", "; ", ", ", " ", ""
    };
    if (strategy == ChunkStrategy::paragraph) return {"\n\n\n", "\n\n", ""};
    if (strategy == ChunkStrategy::sentence) return {". ", "! ", "? ", "\n", " ", ""};
    if (strategy == ChunkStrategy::recursive && type == ContentType::code) {
        return {"\n\nclass ", "\n\ndef ", "\n\nasync def ", "\n\nfunction ", "\n\nstruct ",
                "\n\n", "\n", " ", ""};
    }
    if (strategy == ChunkStrategy::recursive && type == ContentType::markdown) {
        std::vector<std::string> out = {"\n# ", "\n## ", "\n### ", "\n#### ", "\n##### ", "\n###### "};
        out.insert(out.end(), plain.begin(), plain.end());
        return out;
    }
    return plain;
}

std::string make_chunk_id(const std::string& document_id, int index) {
    return sha256_hex(document_id + ":" + std::to_string(index)).substr(0, 16);
}

ChunkStats chunk_stats(const std::vector<Chunk>& chunks) {
    ChunkStats s;
    if (chunks.empty()) return s;
    s.total_chunks = chunks.size();
    s.min_tokens = chunks.front().token_count;
    for (auto& c : chunks) {
        s.total_tokens += c.token_count;
        s.min_tokens = std::min(s.min_tokens, c.token_count);
        s.max_tokens = std::max(s.max_tokens, c.token_count);
    }
    s.avg_tokens = (double)s.total_tokens / (double)s.total_chunks;
    return s;
}

static bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c){ return std::isspace(c) != 0; });
}

// Moves pos back onto a UTF-8 lead byte, never below lo.
static size_t utf8_floor(const std::string& text, size_t pos, size_t lo) {
    while (pos > lo && pos < text.size() && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) --pos;
    return pos;
}

static std::vector<std::pair<size_t, size_t>> split_bytes(const std::string& text, size_t begin, size_t end,
                                                          size_t window, size_t overlap) {
    std::vector<std::pair<size_t, size_t>> out;
    window = std::max<size_t>(1, window);
    size_t pos = begin;
    while (pos < end) {
        size_t stop = std::min(end, pos + window);
        if (stop < end) {
            size_t adj = utf8_floor(text, stop, pos + 1);
            if (adj > pos) stop = adj;
        }
        out.emplace_back(pos, stop);
        if (stop == end) break;
        size_t next = stop > overlap ? utf8_floor(text, stop - overlap, pos + 1) : stop;
        pos = next > pos ? next : stop;
    }
    return out;
}

static std::vector<std::pair<size_t, size_t>> split_at(const std::string& text, size_t begin, size_t end,
                                                       const std::string& sep) {
    std::vector<std::pair<size_t, size_t>> pieces;
    size_t piece_start = begin;
    size_t cursor = begin;
    while (true) {
        size_t pos = text.find(sep, cursor);
        if (pos == std::string::npos || pos + sep.size() > end) break;
        if (pos > piece_start) {
            pieces.emplace_back(piece_start, pos);
            piece_start = pos;
        }
        cursor = pos + sep.size();
    }
    pieces.emplace_back(piece_start, end);
    return pieces;
}

Chunker::Chunker(ChunkerConfig config, std::shared_ptr<const Tokenizer> tokenizer)
    : config_(config), tokenizer_(std::move(tokenizer)) {
    if (!tokenizer_) tokenizer_ = std::make_shared<ApproxTokenizer>();
    if (config_.chunk_tokens == 0) throw ConfigError("chunk_tokens must be positive");
}

std::size_t Chunker::count_tokens(const std::string& text) const {
    return count_tokens_or_estimate(*tokenizer_, text);
}

std::size_t Chunker::count_span(const std::string& text, const Span& span) const {
    return count_tokens(text.substr(span.first, span.second - span.first));
}

std::vector<Chunker::Span> Chunker::split_tokens(const std::string& text, const Span& span, std::size_t target,
                                                 std::size_t overlap) const {
    std::string sub = text.substr(span.first, span.second - span.first);
    std::vector<TokenSpan> spans;
    try {
        spans = tokenizer_->tokenize(sub);
    } catch (const std::exception& e) {
        log_debug(std::string("tokenizer failed, splitting by byte estimate: ") + e.what());
        return split_bytes(text, span.first, span.second, target * kBytesPerTokenEstimate,
                           overlap * kBytesPerTokenEstimate);
    }
    std::vector<Span> out;
    if (spans.empty()) return out;
    size_t step = target > overlap ? target - overlap : 1;
    for (size_t i = 0; i < spans.size(); i += step) {
        size_t j = std::min(spans.size(), i + target);
        out.emplace_back(span.first + spans[i].begin, span.first + spans[j - 1].end);
        if (j == spans.size()) break;
    }
    return out;
}

void Chunker::merge_pieces(const std::vector<Span>& pieces, const std::vector<std::size_t>& tokens,
                           std::size_t target, std::size_t overlap, std::vector<Span>& out) const {
    std::deque<size_t> current;
    size_t total = 0;
    for (size_t i = 0; i < pieces.size(); ++i) {
        size_t t = tokens[i];
        if (total + t > target && !current.empty()) {
            out.emplace_back(pieces[current.front()].first, pieces[current.back()].second);
            // Keep trailing pieces worth at most `overlap` tokens as the head of the next chunk.
            while (!current.empty() && (total > overlap || (total + t > target && total > 0))) {
                total -= tokens[current.front()];
                current.pop_front();
            }
        }
        current.push_back(i);
        total += t;
    }
    if (!current.empty()) out.emplace_back(pieces[current.front()].first, pieces[current.back()].second);
}

std::vector<Chunker::Span> Chunker::split_recursive(const std::string& text, const Span& span,
                                                    const std::vector<std::string>& separators,
                                                    std::size_t sep_index, std::size_t target,
                                                    std::size_t overlap) const {
    size_t chosen = separators.size();
    for (size_t i = sep_index; i < separators.size(); ++i) {
        const auto& sep = separators[i];
        if (sep.empty()) { chosen = i; break; }
        size_t pos = text.find(sep, span.first + 1);
        if (pos != std::string::npos && pos + sep.size() <= span.second) { chosen = i; break; }
    }
    if (chosen == separators.size() || separators[chosen].empty()) {
        return split_tokens(text, span, target, 0);
    }

    auto pieces = split_at(text, span.first, span.second, separators[chosen]);
    if (pieces.size() == 1) return split_recursive(text, span, separators, chosen + 1, target, overlap);

    std::vector<Span> out;
    std::vector<Span> good;
    std::vector<size_t> good_tokens;
    for (auto& p : pieces) {
        size_t t = count_span(text, p);
        if (t <= target) {
            good.push_back(p);
            good_tokens.push_back(t);
            continue;
        }
        if (!good.empty()) {
            merge_pieces(good, good_tokens, target, overlap, out);
            good.clear();
            good_tokens.clear();
        }
        auto sub = split_recursive(text, p, separators, chosen + 1, target, overlap);
        out.insert(out.end(), sub.begin(), sub.end());
    }
    if (!good.empty()) merge_pieces(good, good_tokens, target, overlap, out);
    return out;
}

std::vector<Chunk> Chunker::chunk(const Document& document, ChunkStrategy strategy) const {
    return chunk(document, config_.chunk_tokens, config_.overlap_tokens, strategy);
}

std::vector<Chunk> Chunker::chunk(const Document& document, std::size_t target_tokens, std::size_t overlap_tokens,
                                  ChunkStrategy strategy) const {
    if (target_tokens == 0) throw ConfigError("target_chunk_tokens must be positive");
    if (overlap_tokens >= target_tokens) overlap_tokens = target_tokens - 1;

    const std::string& text = document.text;
    std::vector<Chunk> chunks;
    if (is_blank(text)) return chunks;

    ContentType type = detect_content_type(text);
    Span whole{0, text.size()};
    std::vector<Span> spans;
    if (count_span(text, whole) <= target_tokens) {
        spans.push_back(whole);
    } else if (strategy == ChunkStrategy::token_window) {
        spans = split_tokens(text, whole, target_tokens, overlap_tokens);
    } else {
        spans = split_recursive(text, whole, separators_for(type, strategy), 0, target_tokens, overlap_tokens);
    }

    chunks.reserve(spans.size());
    for (size_t i = 0; i < spans.size(); ++i) {
        Chunk c;
        c.id = make_chunk_id(document.id, (int)i);
        c.document_id = document.id;
        c.start_offset = spans[i].first;
        c.end_offset = spans[i].second;
        c.text = text.substr(c.start_offset, c.end_offset - c.start_offset);
        c.index = (int)i;
        c.total_in_document = (int)spans.size();
        c.token_count = count_tokens(c.text);
        c.metadata = document.metadata.is_object() ? document.metadata : Metadata::object();
        c.metadata["document_id"] = document.id;
        c.metadata["content_type"] = to_string(type);
        c.metadata["strategy"] = to_string(strategy);
        c.metadata["chunk_index"] = c.index;
        c.metadata["total_chunks"] = c.total_in_document;
        c.metadata["token_count"] = c.token_count;
        chunks.push_back(std::move(c));
    }

    if (config_.min_chunk_tokens > 0) {
        chunks = merge_small_chunks(text, std::move(chunks), config_.min_chunk_tokens);
    }
    log_debug("chunked " + document.id + ": " + std::to_string(chunks.size()) + " chunks (strategy=" +
              to_string(strategy) + ", type=" + to_string(type) + ")");
    return chunks;
}

std::vector<Chunk> Chunker::merge_small_chunks(const std::string& source, std::vector<Chunk> chunks,
                                               std::size_t min_tokens) const {
    if (chunks.empty() || min_tokens == 0) return chunks;
    std::vector<Chunk> merged;
    merged.reserve(chunks.size());
    for (auto& c : chunks) {
        if (merged.empty() || merged.back().token_count >= min_tokens) {
            merged.push_back(std::move(c));
            continue;
        }
        Chunk& cur = merged.back();
        cur.end_offset = std::max(cur.end_offset, c.end_offset);
        cur.text = source.substr(cur.start_offset, cur.end_offset - cur.start_offset);
        cur.token_count = count_tokens(cur.text);
    }
    for (auto& c : merged) {
        c.total_in_document = (int)merged.size();
        c.metadata["total_chunks"] = c.total_in_document;
        c.metadata["token_count"] = c.token_count;
    }
    if (merged.size() != chunks.size()) {
        log_debug("merged chunks: " + std::to_string(chunks.size()) + " -> " + std::to_string(merged.size()));
    }
    return merged;
}

std::vector<Chunk> Chunker::chunk_conversation(const std::string& conversation_id,
                                               const std::vector<ConversationMessage>& messages,
                                               std::size_t max_messages_per_chunk) const {
    std::vector<Chunk> chunks;
    size_t per = std::max<size_t>(1, max_messages_per_chunk);
    size_t n = messages.size();
    int total = (int)((n + per - 1) / per);
    for (size_t i = 0; i < n; i += per) {
        size_t end = std::min(n, i + per);
        std::string text;
        for (size_t j = i; j < end; ++j) {
            if (j > i) text += "\n\n";
            text += messages[j].role + ": " + messages[j].content;
        }
        Chunk c;
        c.index = (int)(i / per);
        c.id = make_chunk_id(conversation_id, c.index);
        c.document_id = conversation_id;
        c.text = std::move(text);
        c.start_offset = i;
        c.end_offset = end;
        c.total_in_document = total;
        c.token_count = count_tokens(c.text);
        c.metadata = {
            {"type", "conversation"},
            {"document_id", conversation_id},
            {"message_count", end - i},
            {"start_index", i},
            {"end_index", end},
            {"chunk_index", c.index},
            {"total_chunks", total},
            {"token_count", c.token_count}
        };
        chunks.push_back(std::move(c));
    }
    log_debug("chunked conversation " + conversation_id + ": " + std::to_string(chunks.size()) + " chunks from " +
              std::to_string(n) + " messages");
    return chunks;
}

} // namespace ragcore
