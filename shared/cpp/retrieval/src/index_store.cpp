#include "../include/index_store.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include <atomic>
#include <set>

namespace ragcore {

static std::string document_of(const Metadata& metadata) {
    if (!metadata.is_object()) return {};
    auto it = metadata.find("document_id");
    return it != metadata.end() && it->is_string() ? it->get<std::string>() : std::string();
}

IndexStore::IndexStore(VectorIndex& vectors, LexicalTokenizer tokenizer, Bm25Params params)
    : vectors_(vectors), tokenizer_(tokenizer ? std::move(tokenizer) : default_lexical_tokens), params_(params) {}

IndexStore::CollectionState& IndexStore::state(const std::string& collection) const {
    std::lock_guard<std::mutex> lock(states_mtx_);
    auto& slot = states_[collection];
    if (!slot) slot = std::make_unique<CollectionState>();
    return *slot;
}

void IndexStore::publish(CollectionState& st) {
    std::vector<LexicalEntry> entries;
    entries.reserve(st.corpus.size());
    for (auto& kv : st.corpus) entries.push_back(kv.second);
    auto next = std::make_shared<const LexicalIndex>(std::move(entries), tokenizer_, params_);
    std::atomic_store(&st.snapshot, std::move(next));
}

void IndexStore::validate_dims(CollectionState& st, const std::string& collection,
                               const std::vector<IndexedVector>& points) {
    if (st.dim == 0) st.dim = vectors_.collection_stats(collection).dim;
    for (auto& p : points) {
        if (p.vector.size() != st.dim) throw DimensionMismatch(st.dim, p.vector.size(), "upsert " + p.id);
    }
}

std::vector<std::string> IndexStore::ids_for_document(const CollectionState& st, const std::string& document_id) {
    std::vector<std::string> ids;
    for (auto& kv : st.corpus) {
        if (document_of(kv.second.metadata) == document_id) ids.push_back(kv.first);
    }
    return ids;
}

void IndexStore::create_collection(const CollectionConfig& config, bool recreate) {
    auto& st = state(config.name);
    std::lock_guard<std::mutex> lock(st.write_mtx);
    vectors_.create_collection(config, recreate);
    st.dim = config.dim;
    if (recreate) {
        st.corpus.clear();
        publish(st);
    }
}

void IndexStore::clear_collection(const std::string& collection) {
    auto shape = vectors_.collection_stats(collection);
    create_collection({collection, shape.dim, shape.distance}, true);
    log_info("cleared collection " + collection + " (" + std::to_string(shape.point_count) + " points)");
}

void IndexStore::upsert(const std::string& collection, const std::vector<IndexedVector>& points) {
    auto& st = state(collection);
    std::lock_guard<std::mutex> lock(st.write_mtx);
    validate_dims(st, collection, points);
    vectors_.upsert(collection, points);
    for (auto& p : points) st.corpus[p.id] = LexicalEntry{p.id, p.text, p.metadata};
    publish(st);
}

std::vector<IndexedVector> IndexStore::search(const std::string& collection, const std::vector<float>& query,
                                              std::size_t k, const Filter& filter,
                                              std::optional<float> score_threshold) {
    return vectors_.search(collection, query, k, filter, score_threshold);
}

std::vector<LexicalHit> IndexStore::lexical_search(const std::string& collection, const std::string& query,
                                                   std::size_t k, const Filter& filter) const {
    auto snap = lexical_snapshot(collection);
    if (!snap) return {};
    return snap->search(query, k, filter);
}

void IndexStore::remove(const std::string& collection, const std::vector<std::string>& ids) {
    auto& st = state(collection);
    std::lock_guard<std::mutex> lock(st.write_mtx);
    vectors_.remove(collection, ids);
    for (auto& id : ids) st.corpus.erase(id);
    publish(st);
}

std::size_t IndexStore::commit_document(const std::string& collection, const std::string& document_id,
                                        const std::vector<IndexedVector>& points) {
    auto& st = state(collection);
    std::lock_guard<std::mutex> lock(st.write_mtx);
    validate_dims(st, collection, points);

    auto prior_ids = ids_for_document(st, document_id);
    std::vector<IndexedVector> prior = prior_ids.empty() ? std::vector<IndexedVector>{}
                                                         : vectors_.fetch(collection, prior_ids);
    std::set<std::string> new_ids;
    for (auto& p : points) new_ids.insert(p.id);
    std::set<std::string> old_ids(prior_ids.begin(), prior_ids.end());
    std::vector<std::string> stale, added;
    for (auto& id : prior_ids) {
        if (!new_ids.count(id)) stale.push_back(id);
    }
    for (auto& id : new_ids) {
        if (!old_ids.count(id)) added.push_back(id);
    }

    try {
        vectors_.upsert(collection, points);
        if (!stale.empty()) vectors_.remove(collection, stale);
    } catch (const std::exception& e) {
        log_error("commit of " + document_id + " failed, rolling back: " + e.what());
        try {
            if (!added.empty()) vectors_.remove(collection, added);
            if (!prior.empty()) vectors_.upsert(collection, prior);
        } catch (const std::exception& rollback_error) {
            log_error("rollback of " + document_id + " incomplete: " + rollback_error.what());
        }
        throw;
    }

    for (auto& id : stale) st.corpus.erase(id);
    for (auto& p : points) st.corpus[p.id] = LexicalEntry{p.id, p.text, p.metadata};
    publish(st);
    return points.size();
}

std::size_t IndexStore::remove_document(const std::string& collection, const std::string& document_id) {
    auto& st = state(collection);
    std::lock_guard<std::mutex> lock(st.write_mtx);
    auto ids = ids_for_document(st, document_id);
    if (ids.empty()) return 0;
    vectors_.remove(collection, ids);
    for (auto& id : ids) st.corpus.erase(id);
    publish(st);
    return ids.size();
}

std::vector<std::string> IndexStore::document_chunk_ids(const std::string& collection,
                                                        const std::string& document_id) const {
    auto& st = state(collection);
    std::lock_guard<std::mutex> lock(st.write_mtx);
    return ids_for_document(st, document_id);
}

CollectionStats IndexStore::collection_stats(const std::string& collection) {
    return vectors_.collection_stats(collection);
}

bool IndexStore::health_check() {
    try {
        return vectors_.healthy();
    } catch (const std::exception& e) {
        log_warn(std::string("vector index health check failed: ") + e.what());
        return false;
    }
}

std::size_t IndexStore::rebuild_lexical(const std::string& collection) {
    auto& st = state(collection);
    std::lock_guard<std::mutex> lock(st.write_mtx);
    auto points = vectors_.scroll(collection);
    st.corpus.clear();
    for (auto& p : points) st.corpus[p.id] = LexicalEntry{p.id, p.text, p.metadata};
    publish(st);
    log_info("lexical index for " + collection + " rebuilt from " + std::to_string(points.size()) + " points");
    return points.size();
}

std::shared_ptr<const LexicalIndex> IndexStore::lexical_snapshot(const std::string& collection) const {
    auto& st = state(collection);
    return std::atomic_load(&st.snapshot);
}

std::size_t IndexStore::lexical_size(const std::string& collection) const {
    auto snap = lexical_snapshot(collection);
    return snap ? snap->size() : 0;
}

} // namespace ragcore
