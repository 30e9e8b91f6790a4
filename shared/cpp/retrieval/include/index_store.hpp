#pragma once
#include "lexical_index.hpp"
#include "vector_index.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ragcore {

// Vector index plus its in-process lexical mirror. Every successful vector
// write is followed by a lexical update under the same per-collection writer
// lock; readers take an immutable snapshot and never block on writers.
class IndexStore {
public:
    explicit IndexStore(VectorIndex& vectors, LexicalTokenizer tokenizer = default_lexical_tokens,
                        Bm25Params params = {});

    void create_collection(const CollectionConfig& config, bool recreate);
    // Drops every point and keeps the collection shape.
    void clear_collection(const std::string& collection);

    void upsert(const std::string& collection, const std::vector<IndexedVector>& points);
    std::vector<IndexedVector> search(const std::string& collection, const std::vector<float>& query, std::size_t k,
                                      const Filter& filter = nullptr,
                                      std::optional<float> score_threshold = std::nullopt);
    std::vector<LexicalHit> lexical_search(const std::string& collection, const std::string& query, std::size_t k,
                                           const Filter& filter = nullptr) const;
    void remove(const std::string& collection, const std::vector<std::string>& ids);

    // Replaces the document's chunk set in both indices. On a vector-side
    // failure the prior points are restored and the lexical mirror is left
    // as it was.
    std::size_t commit_document(const std::string& collection, const std::string& document_id,
                                const std::vector<IndexedVector>& points);
    std::size_t remove_document(const std::string& collection, const std::string& document_id);
    std::vector<std::string> document_chunk_ids(const std::string& collection, const std::string& document_id) const;

    CollectionStats collection_stats(const std::string& collection);
    bool health_check();

    // Replays every stored point into a fresh lexical snapshot.
    std::size_t rebuild_lexical(const std::string& collection);
    std::shared_ptr<const LexicalIndex> lexical_snapshot(const std::string& collection) const;
    std::size_t lexical_size(const std::string& collection) const;

private:
    struct CollectionState {
        std::mutex write_mtx;
        std::size_t dim{0};
        std::map<std::string, LexicalEntry> corpus;
        std::shared_ptr<const LexicalIndex> snapshot;
    };

    CollectionState& state(const std::string& collection) const;
    void validate_dims(CollectionState& st, const std::string& collection, const std::vector<IndexedVector>& points);
    void publish(CollectionState& st);
    static std::vector<std::string> ids_for_document(const CollectionState& st, const std::string& document_id);

    VectorIndex& vectors_;
    LexicalTokenizer tokenizer_;
    Bm25Params params_;
    mutable std::mutex states_mtx_;
    mutable std::map<std::string, std::unique_ptr<CollectionState>> states_;
};

} // namespace ragcore
