#pragma once
#include "types.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ragcore {

struct VectorIndexConfig {
    std::string kind{"sqlite"}; // sqlite | qdrant
    std::string sqlite_path{"./data/rag_index.db"};
    std::string qdrant_url{"http://localhost:6333"};
    std::string api_key;
    long timeout_ms{30000};
    int max_retries{3};
};

// Narrow contract over a vector index engine. Scores returned by search are
// "higher is better" for every metric; identical vectors score the metric's
// maximum (1 for cosine and euclidean).
class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    // No-op when the collection exists with the same shape; recreate drops it first.
    virtual void create_collection(const CollectionConfig& config, bool recreate) = 0;
    virtual void drop_collection(const std::string& collection) = 0;
    virtual bool has_collection(const std::string& collection) = 0;

    // Idempotent by id. All vectors must match the collection dimension.
    virtual void upsert(const std::string& collection, const std::vector<IndexedVector>& points) = 0;
    virtual std::vector<IndexedVector> search(const std::string& collection, const std::vector<float>& query,
                                              std::size_t k, const Filter& filter,
                                              std::optional<float> score_threshold) = 0;
    virtual std::vector<IndexedVector> fetch(const std::string& collection, const std::vector<std::string>& ids) = 0;
    virtual void remove(const std::string& collection, const std::vector<std::string>& ids) = 0;
    // Every point in the collection, vectors included.
    virtual std::vector<IndexedVector> scroll(const std::string& collection) = 0;
    virtual CollectionStats collection_stats(const std::string& collection) = 0;
    virtual bool healthy() = 0;
};

float similarity(DistanceMetric metric, const std::vector<float>& a, const std::vector<float>& b);

// Exact-match conjunction over top-level keys. Null or empty filters match everything.
bool matches_filter(const Metadata& metadata, const Filter& filter);

std::unique_ptr<VectorIndex> make_vector_index(const VectorIndexConfig& config);

} // namespace ragcore
