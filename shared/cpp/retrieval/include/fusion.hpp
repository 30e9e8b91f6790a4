#pragma once
#include "types.hpp"
#include <string>
#include <vector>

namespace ragcore {

// Divides by the list's maximum. Negative scores clamp to 0; a list whose
// maximum is not positive maps to all zeros.
std::vector<float> normalize_scores(const std::vector<float>& scores);

// hybrid = alpha * lexical_norm + (1 - alpha) * vector_norm over the union of
// ids, sorted descending with ties broken by id. lexical_score/vector_score on
// the result carry the normalized per-side values.
std::vector<ScoredChunk> fuse_scores(const std::vector<ScoredChunk>& lexical, const std::vector<ScoredChunk>& vector,
                                     float alpha);

} // namespace ragcore
