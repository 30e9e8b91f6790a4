#pragma once
#include "retry.hpp"
#include "vector_index.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ragcore {

// Qdrant REST client. Chunk ids are not valid Qdrant point ids, so each is
// mapped to a UUID derived from its SHA-256 and kept in the payload as
// "chunk_id".
class QdrantVectorIndex : public VectorIndex {
public:
    explicit QdrantVectorIndex(const VectorIndexConfig& config);

    void create_collection(const CollectionConfig& config, bool recreate) override;
    void drop_collection(const std::string& collection) override;
    bool has_collection(const std::string& collection) override;

    void upsert(const std::string& collection, const std::vector<IndexedVector>& points) override;
    std::vector<IndexedVector> search(const std::string& collection, const std::vector<float>& query,
                                      std::size_t k, const Filter& filter,
                                      std::optional<float> score_threshold) override;
    std::vector<IndexedVector> fetch(const std::string& collection, const std::vector<std::string>& ids) override;
    void remove(const std::string& collection, const std::vector<std::string>& ids) override;
    std::vector<IndexedVector> scroll(const std::string& collection) override;
    CollectionStats collection_stats(const std::string& collection) override;
    bool healthy() override;

    static std::string point_uuid(const std::string& id);

private:
    nlohmann::json call(const std::string& method, const std::string& path, const nlohmann::json& body,
                        const std::string& collection = {});
    CollectionConfig collection_shape(const std::string& collection);
    IndexedVector from_point(const nlohmann::json& point) const;

    std::string url_;
    std::vector<std::string> headers_;
    long timeout_ms_{30000};
    RetryPolicy retry_;
    std::mutex shapes_mtx_;
    std::map<std::string, CollectionConfig> shapes_;
};

nlohmann::json to_qdrant_filter(const Filter& filter);

} // namespace ragcore
