#include "../include/fusion.hpp"
#include "../include/errors.hpp"
#include <algorithm>
#include <map>

namespace ragcore {

std::vector<float> normalize_scores(const std::vector<float>& scores) {
    float max = 0.0f;
    for (float s : scores) max = std::max(max, s);
    std::vector<float> out(scores.size(), 0.0f);
    if (max <= 0.0f) return out;
    for (size_t i = 0; i < scores.size(); ++i) out[i] = std::max(0.0f, scores[i]) / max;
    return out;
}

std::vector<ScoredChunk> fuse_scores(const std::vector<ScoredChunk>& lexical, const std::vector<ScoredChunk>& vector,
                                     float alpha) {
    if (alpha < 0.0f || alpha > 1.0f) throw RetrievalError("alpha must be within [0, 1]");

    auto scores_of = [](const std::vector<ScoredChunk>& list) {
        std::vector<float> s;
        s.reserve(list.size());
        for (auto& c : list) s.push_back(c.score);
        return normalize_scores(s);
    };
    auto lex_norm = scores_of(lexical);
    auto vec_norm = scores_of(vector);

    std::map<std::string, ScoredChunk> merged;
    for (size_t i = 0; i < vector.size(); ++i) {
        auto ins = merged.emplace(vector[i].id, vector[i]);
        auto& c = ins.first->second;
        if (ins.second) {
            c.vector_score = vec_norm[i];
            c.lexical_score = 0.0f;
        } else {
            c.vector_score = std::max(c.vector_score, vec_norm[i]);
        }
    }
    for (size_t i = 0; i < lexical.size(); ++i) {
        auto it = merged.find(lexical[i].id);
        if (it == merged.end()) {
            it = merged.emplace(lexical[i].id, lexical[i]).first;
            it->second.vector_score = 0.0f;
            it->second.lexical_score = 0.0f;
        }
        it->second.lexical_score = std::max(it->second.lexical_score, lex_norm[i]);
    }

    std::vector<ScoredChunk> out;
    out.reserve(merged.size());
    for (auto& kv : merged) {
        ScoredChunk c = std::move(kv.second);
        c.score = alpha * c.lexical_score + (1.0f - alpha) * c.vector_score;
        out.push_back(std::move(c));
    }
    std::sort(out.begin(), out.end(), [](const ScoredChunk& a, const ScoredChunk& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.id < b.id;
    });
    return out;
}

} // namespace ragcore
