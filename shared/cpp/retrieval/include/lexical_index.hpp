#pragma once
#include "tokenizer.hpp"
#include "types.hpp"
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace ragcore {

struct LexicalEntry {
    std::string id;
    std::string text;
    Metadata metadata = Metadata::object();
};

struct LexicalHit {
    std::string id;
    std::string text;
    Metadata metadata = Metadata::object();
    float score{0.0f};
};

struct Bm25Params {
    double k1{1.5};
    double b{0.75};
};

// Immutable BM25 index over a corpus snapshot. Built once, then shared
// read-only between any number of concurrent queries.
class LexicalIndex {
public:
    LexicalIndex() = default;
    LexicalIndex(std::vector<LexicalEntry> entries, LexicalTokenizer tokenizer = default_lexical_tokens,
                 Bm25Params params = {});

    // Top k by BM25, documents with zero score excluded, ties broken by id.
    std::vector<LexicalHit> search(const std::string& query, std::size_t k, const Filter& filter = nullptr) const;

    double idf(const std::string& term) const;
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    struct Posting {
        std::size_t doc{0};
        std::size_t tf{0};
    };

    std::vector<LexicalEntry> entries_;
    std::vector<std::size_t> lengths_;
    std::unordered_map<std::string, std::vector<Posting>> postings_;
    double avg_length_{0.0};
    LexicalTokenizer tokenizer_{default_lexical_tokens};
    Bm25Params params_;
};

} // namespace ragcore
