#pragma once
#include "tokenizer.hpp"
#include "types.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ragcore {

enum class ContentType { plain, markdown, code };
enum class ChunkStrategy { recursive, token_window, paragraph, sentence };

std::string to_string(ContentType type);
std::string to_string(ChunkStrategy strategy);
// Unknown names fall back to recursive.
ChunkStrategy parse_chunk_strategy(const std::string& name);

struct ChunkerConfig {
    std::size_t chunk_tokens{1000};
    std::size_t overlap_tokens{200};
    std::size_t min_chunk_tokens{0}; // 0 disables merging of small chunks
};

struct ConversationMessage {
    std::string role;
    std::string content;
};

struct ChunkStats {
    std::size_t total_chunks{0};
    double avg_tokens{0.0};
    std::size_t min_tokens{0};
    std::size_t max_tokens{0};
    std::size_t total_tokens{0};
};

ContentType detect_content_type(const std::string& text);

// Separators in priority order. A split happens at the start of each
// occurrence, so the separator leads the following piece. The empty
// separator means "split by tokens".
std::vector<std::string> separators_for(ContentType type, ChunkStrategy strategy);

// First 16 hex chars of sha256("<document_id>:<index>").
std::string make_chunk_id(const std::string& document_id, int index);

ChunkStats chunk_stats(const std::vector<Chunk>& chunks);

class Chunker {
public:
    explicit Chunker(ChunkerConfig config = {}, std::shared_ptr<const Tokenizer> tokenizer = nullptr);

    std::vector<Chunk> chunk(const Document& document, ChunkStrategy strategy = ChunkStrategy::recursive) const;

    // Chunk text is always document.text.substr(start_offset, end_offset - start_offset).
    std::vector<Chunk> chunk(const Document& document, std::size_t target_tokens, std::size_t overlap_tokens,
                             ChunkStrategy strategy) const;

    std::vector<Chunk> chunk_conversation(const std::string& conversation_id,
                                          const std::vector<ConversationMessage>& messages,
                                          std::size_t max_messages_per_chunk = 10) const;

    // Folds every chunk below min_tokens into its successor. The survivor keeps
    // the earliest id and index; its span becomes the union.
    std::vector<Chunk> merge_small_chunks(const std::string& source, std::vector<Chunk> chunks,
                                          std::size_t min_tokens) const;

    std::size_t count_tokens(const std::string& text) const;
    const ChunkerConfig& config() const { return config_; }
    const Tokenizer& tokenizer() const { return *tokenizer_; }

private:
    using Span = std::pair<std::size_t, std::size_t>;

    std::size_t count_span(const std::string& text, const Span& span) const;
    std::vector<Span> split_recursive(const std::string& text, const Span& span,
                                      const std::vector<std::string>& separators, std::size_t sep_index,
                                      std::size_t target, std::size_t overlap) const;
    void merge_pieces(const std::vector<Span>& pieces, const std::vector<std::size_t>& tokens,
                      std::size_t target, std::size_t overlap, std::vector<Span>& out) const;
    std::vector<Span> split_tokens(const std::string& text, const Span& span, std::size_t target,
                                   std::size_t overlap) const;

    ChunkerConfig config_;
    std::shared_ptr<const Tokenizer> tokenizer_;
};

} // namespace ragcore
