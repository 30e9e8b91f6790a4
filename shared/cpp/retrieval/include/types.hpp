#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ragcore {

// Free-form metadata attached to documents, chunks and points. Always a JSON object.
using Metadata = nlohmann::json;

// Exact-match conjunction over top-level metadata keys. Null or empty matches everything.
using Filter = nlohmann::json;

struct Document {
    std::string id;
    std::string text;
    Metadata metadata = Metadata::object();
};

struct Chunk {
    std::string id;
    std::string document_id;
    std::string text;
    std::size_t start_offset{0};
    std::size_t end_offset{0};
    int index{0};
    int total_in_document{0};
    std::size_t token_count{0};
    Metadata metadata = Metadata::object();
};

enum class DistanceMetric { cosine, dot, euclidean };

std::string to_string(DistanceMetric metric);
DistanceMetric parse_distance_metric(const std::string& name);

struct CollectionConfig {
    std::string name;
    std::size_t dim{0};
    DistanceMetric distance{DistanceMetric::cosine};
};

struct CollectionStats {
    std::string name;
    std::size_t dim{0};
    DistanceMetric distance{DistanceMetric::cosine};
    std::size_t point_count{0};
};

struct IndexedVector {
    std::string id;
    std::vector<float> vector;
    std::string text;
    Metadata metadata = Metadata::object();
    std::optional<float> score;
};

struct EmbeddingResult {
    std::string text;
    std::vector<float> vector;
    std::string model;
    std::size_t token_count{0};
    bool from_cache{false};
    double cost{0.0};
};

struct ScoredChunk {
    std::string id;
    std::string document_id;
    std::string text;
    Metadata metadata = Metadata::object();
    float score{0.0f};
    float lexical_score{0.0f}; // normalized, 0 when absent from the lexical list
    float vector_score{0.0f};  // normalized, 0 when absent from the vector list
};

enum class Strategy { vector, lexical, hybrid };

struct RetrievalResult {
    std::string query;
    std::vector<ScoredChunk> chunks;
    double elapsed_ms{0.0};
    Strategy strategy{Strategy::vector};
    bool reranked{false};
    int candidates_examined{0};
    bool degraded{false};
    std::vector<std::string> notes;

    // "vector", "lexical", "hybrid", optionally suffixed with "+rerank".
    std::string strategy_name() const;
};

} // namespace ragcore
