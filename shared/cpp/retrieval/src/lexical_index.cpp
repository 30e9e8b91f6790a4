#include "../include/lexical_index.hpp"
#include "../include/vector_index.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace ragcore {

LexicalIndex::LexicalIndex(std::vector<LexicalEntry> entries, LexicalTokenizer tokenizer, Bm25Params params)
    : entries_(std::move(entries)), tokenizer_(std::move(tokenizer)), params_(params) {
    if (!tokenizer_) tokenizer_ = default_lexical_tokens;
    std::sort(entries_.begin(), entries_.end(),
              [](const LexicalEntry& a, const LexicalEntry& b) { return a.id < b.id; });
    lengths_.reserve(entries_.size());
    std::size_t total = 0;
    for (std::size_t d = 0; d < entries_.size(); ++d) {
        auto terms = tokenizer_(entries_[d].text);
        lengths_.push_back(terms.size());
        total += terms.size();
        std::unordered_map<std::string, std::size_t> tf;
        for (auto& t : terms) ++tf[t];
        for (auto& kv : tf) postings_[kv.first].push_back({d, kv.second});
    }
    avg_length_ = entries_.empty() ? 0.0 : double(total) / double(entries_.size());
}

double LexicalIndex::idf(const std::string& term) const {
    auto it = postings_.find(term);
    double n = it == postings_.end() ? 0.0 : double(it->second.size());
    double N = double(entries_.size());
    return std::log(1.0 + (N - n + 0.5) / (n + 0.5));
}

std::vector<LexicalHit> LexicalIndex::search(const std::string& query, std::size_t k, const Filter& filter) const {
    std::vector<LexicalHit> out;
    if (k == 0 || entries_.empty()) return out;

    auto terms = tokenizer_(query);
    std::unordered_set<std::string> seen;
    std::vector<double> scores(entries_.size(), 0.0);
    for (auto& t : terms) {
        if (!seen.insert(t).second) continue;
        auto it = postings_.find(t);
        if (it == postings_.end()) continue;
        double w = idf(t);
        for (auto& p : it->second) {
            double len_norm = avg_length_ > 0.0 ? double(lengths_[p.doc]) / avg_length_ : 0.0;
            double tf = double(p.tf);
            double denom = tf + params_.k1 * (1.0 - params_.b + params_.b * len_norm);
            scores[p.doc] += w * tf * (params_.k1 + 1.0) / denom;
        }
    }

    for (std::size_t d = 0; d < entries_.size(); ++d) {
        if (scores[d] <= 0.0) continue;
        if (!matches_filter(entries_[d].metadata, filter)) continue;
        out.push_back({entries_[d].id, entries_[d].text, entries_[d].metadata, float(scores[d])});
    }
    auto by_score = [](const LexicalHit& a, const LexicalHit& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.id < b.id;
    };
    std::size_t n = std::min(k, out.size());
    std::partial_sort(out.begin(), out.begin() + n, out.end(), by_score);
    out.resize(n);
    return out;
}

} // namespace ragcore
