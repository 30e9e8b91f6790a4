#include "../include/qdrant_vector_index.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace ragcore {

static std::string qdrant_distance(DistanceMetric metric) {
    switch (metric) {
        case DistanceMetric::cosine: return "Cosine";
        case DistanceMetric::dot: return "Dot";
        case DistanceMetric::euclidean: return "Euclid";
    }
    return "Cosine";
}

static DistanceMetric from_qdrant_distance(const std::string& name) {
    if (name == "Dot") return DistanceMetric::dot;
    if (name == "Euclid") return DistanceMetric::euclidean;
    return DistanceMetric::cosine;
}

json to_qdrant_filter(const Filter& filter) {
    if (filter.is_null() || filter.empty()) return nullptr;
    if (!filter.is_object()) throw RetrievalError("filter must be a JSON object");
    json must = json::array();
    for (auto it = filter.begin(); it != filter.end(); ++it) {
        must.push_back({{"key", "metadata." + it.key()}, {"match", {{"value", it.value()}}}});
    }
    return json{{"must", must}};
}

QdrantVectorIndex::QdrantVectorIndex(const VectorIndexConfig& config)
    : url_(config.qdrant_url), timeout_ms_(config.timeout_ms) {
    while (!url_.empty() && url_.back() == '/') url_.pop_back();
    if (!config.api_key.empty()) headers_.push_back("api-key: " + config.api_key);
    retry_.max_retries = config.max_retries;
}

std::string QdrantVectorIndex::point_uuid(const std::string& id) {
    std::string h = sha256_hex(id).substr(0, 32);
    return h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" + h.substr(16, 4) + "-" +
           h.substr(20, 12);
}

json QdrantVectorIndex::call(const std::string& method, const std::string& path, const json& body,
                             const std::string& collection) {
    return with_retry(retry_, "qdrant " + method + " " + path, [&] {
        auto r = http_request(method, url_ + path, body.is_null() ? std::string() : body.dump(), timeout_ms_,
                              headers_);
        if (r.status == 404 && !collection.empty()) throw CollectionNotFound(collection);
        if (r.status == 429 || r.status >= 500) {
            throw ProviderUnavailable("qdrant " + path + ": status " + std::to_string(r.status));
        }
        if (!r.ok()) {
            throw RetrievalError("qdrant " + path + ": status " + std::to_string(r.status) + ": " +
                                 r.body.substr(0, 200));
        }
        try {
            return r.body.empty() ? json::object() : json::parse(r.body);
        } catch (const json::exception& e) {
            throw ProviderUnavailable(std::string("qdrant ") + path + ": malformed response: " + e.what());
        }
    });
}

IndexedVector QdrantVectorIndex::from_point(const json& point) const {
    IndexedVector p;
    const json& payload = point.contains("payload") && point["payload"].is_object() ? point["payload"] : json::object();
    p.id = payload.value("chunk_id", std::string());
    if (p.id.empty() && point.contains("id")) p.id = point["id"].is_string() ? point["id"].get<std::string>()
                                                                              : point["id"].dump();
    p.text = payload.value("text", std::string());
    if (payload.contains("metadata") && payload["metadata"].is_object()) p.metadata = payload["metadata"];
    if (point.contains("vector") && point["vector"].is_array()) {
        for (auto& x : point["vector"]) p.vector.push_back(x.get<float>());
    }
    if (point.contains("score")) p.score = point["score"].get<float>();
    return p;
}

CollectionConfig QdrantVectorIndex::collection_shape(const std::string& collection) {
    {
        std::lock_guard<std::mutex> lock(shapes_mtx_);
        auto it = shapes_.find(collection);
        if (it != shapes_.end()) return it->second;
    }
    auto s = collection_stats(collection);
    CollectionConfig c{s.name, s.dim, s.distance};
    std::lock_guard<std::mutex> lock(shapes_mtx_);
    shapes_[collection] = c;
    return c;
}

void QdrantVectorIndex::create_collection(const CollectionConfig& config, bool recreate) {
    if (config.dim == 0) throw RetrievalError("collection dimension must be > 0");
    bool exists = has_collection(config.name);
    if (exists && !recreate) {
        auto shape = collection_shape(config.name);
        if (shape.dim != config.dim) throw DimensionMismatch(shape.dim, config.dim, "collection " + config.name);
        return;
    }
    if (exists) drop_collection(config.name);
    json body = {{"vectors", {{"size", config.dim}, {"distance", qdrant_distance(config.distance)}}}};
    call("PUT", "/collections/" + config.name, body);
    {
        std::lock_guard<std::mutex> lock(shapes_mtx_);
        shapes_[config.name] = config;
    }
    log_info("created qdrant collection " + config.name + " (dim " + std::to_string(config.dim) + ")");
}

void QdrantVectorIndex::drop_collection(const std::string& collection) {
    {
        std::lock_guard<std::mutex> lock(shapes_mtx_);
        shapes_.erase(collection);
    }
    try {
        call("DELETE", "/collections/" + collection, nullptr, collection);
    } catch (const CollectionNotFound&) {
        log_debug("drop of missing qdrant collection " + collection);
    }
}

bool QdrantVectorIndex::has_collection(const std::string& collection) {
    try {
        call("GET", "/collections/" + collection, nullptr, collection);
        return true;
    } catch (const CollectionNotFound&) {
        return false;
    }
}

void QdrantVectorIndex::upsert(const std::string& collection, const std::vector<IndexedVector>& points) {
    auto shape = collection_shape(collection);
    for (auto& p : points) {
        if (p.vector.size() != shape.dim) throw DimensionMismatch(shape.dim, p.vector.size(), "upsert " + p.id);
    }
    if (points.empty()) return;
    json arr = json::array();
    for (auto& p : points) {
        arr.push_back({
            {"id", point_uuid(p.id)},
            {"vector", p.vector},
            {"payload", {{"chunk_id", p.id}, {"text", p.text}, {"metadata", p.metadata}}}
        });
    }
    call("PUT", "/collections/" + collection + "/points?wait=true", json{{"points", arr}}, collection);
}

std::vector<IndexedVector> QdrantVectorIndex::search(const std::string& collection, const std::vector<float>& query,
                                                     std::size_t k, const Filter& filter,
                                                     std::optional<float> score_threshold) {
    auto shape = collection_shape(collection);
    if (query.size() != shape.dim) throw DimensionMismatch(shape.dim, query.size(), "search " + collection);
    std::vector<IndexedVector> out;
    if (k == 0) return out;
    json body = {{"vector", query}, {"limit", k}, {"with_payload", true}};
    json qf = to_qdrant_filter(filter);
    if (!qf.is_null()) body["filter"] = qf;
    auto data = call("POST", "/collections/" + collection + "/points/search", body, collection);
    for (auto& pt : data.value("result", json::array())) {
        auto p = from_point(pt);
        float s = p.score.value_or(0.0f);
        // Qdrant reports raw distance for Euclid.
        if (shape.distance == DistanceMetric::euclidean) s = 1.0f / (1.0f + s);
        if (score_threshold && s < *score_threshold) continue;
        p.score = s;
        out.push_back(std::move(p));
    }
    std::stable_sort(out.begin(), out.end(), [](const IndexedVector& a, const IndexedVector& b) {
        if (*a.score != *b.score) return *a.score > *b.score;
        return a.id < b.id;
    });
    return out;
}

std::vector<IndexedVector> QdrantVectorIndex::fetch(const std::string& collection,
                                                    const std::vector<std::string>& ids) {
    if (ids.empty()) return {};
    json uuids = json::array();
    for (auto& id : ids) uuids.push_back(point_uuid(id));
    json body = {{"ids", uuids}, {"with_payload", true}, {"with_vector", true}};
    auto data = call("POST", "/collections/" + collection + "/points", body, collection);
    std::vector<IndexedVector> out;
    for (auto& pt : data.value("result", json::array())) out.push_back(from_point(pt));
    return out;
}

void QdrantVectorIndex::remove(const std::string& collection, const std::vector<std::string>& ids) {
    if (ids.empty()) return;
    json uuids = json::array();
    for (auto& id : ids) uuids.push_back(point_uuid(id));
    call("POST", "/collections/" + collection + "/points/delete?wait=true", json{{"points", uuids}}, collection);
}

std::vector<IndexedVector> QdrantVectorIndex::scroll(const std::string& collection) {
    std::vector<IndexedVector> out;
    json offset = nullptr;
    do {
        json body = {{"limit", 256}, {"with_payload", true}, {"with_vector", true}};
        if (!offset.is_null()) body["offset"] = offset;
        auto data = call("POST", "/collections/" + collection + "/points/scroll", body, collection);
        const json& result = data.contains("result") ? data["result"] : json::object();
        for (auto& pt : result.value("points", json::array())) out.push_back(from_point(pt));
        offset = result.value("next_page_offset", json());
    } while (!offset.is_null());
    return out;
}

CollectionStats QdrantVectorIndex::collection_stats(const std::string& collection) {
    auto data = call("GET", "/collections/" + collection, nullptr, collection);
    CollectionStats s;
    s.name = collection;
    try {
        const json& result = data.at("result");
        if (result.contains("points_count") && result["points_count"].is_number()) {
            s.point_count = result["points_count"].get<std::size_t>();
        }
        const json& vectors = result.at("config").at("params").at("vectors");
        s.dim = vectors.at("size").get<std::size_t>();
        s.distance = from_qdrant_distance(vectors.value("distance", std::string("Cosine")));
    } catch (const json::exception& e) {
        throw ProviderUnavailable(std::string("qdrant collection info malformed: ") + e.what());
    }
    return s;
}

bool QdrantVectorIndex::healthy() {
    try {
        auto r = http_get(url_ + "/readyz", std::min(timeout_ms_, 5000L), headers_);
        return r.ok();
    } catch (const ProviderUnavailable& e) {
        log_warn(std::string("qdrant health check failed: ") + e.what());
        return false;
    }
}

} // namespace ragcore
