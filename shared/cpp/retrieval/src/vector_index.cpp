#include "../include/vector_index.hpp"
#include "../include/errors.hpp"
#include "../include/qdrant_vector_index.hpp"
#include "../include/sqlite_vector_index.hpp"
#include <algorithm>
#include <cmath>

namespace ragcore {

float similarity(DistanceMetric metric, const std::vector<float>& a, const std::vector<float>& b) {
    size_t n = std::min(a.size(), b.size());
    switch (metric) {
        case DistanceMetric::cosine: {
            double dot = 0.0, na = 0.0, nb = 0.0;
            for (size_t i = 0; i < n; ++i) {
                dot += double(a[i]) * b[i];
                na += double(a[i]) * a[i];
                nb += double(b[i]) * b[i];
            }
            if (na == 0.0 || nb == 0.0) return 0.0f;
            return float(dot / (std::sqrt(na) * std::sqrt(nb)));
        }
        case DistanceMetric::dot: {
            double dot = 0.0;
            for (size_t i = 0; i < n; ++i) dot += double(a[i]) * b[i];
            return float(dot);
        }
        case DistanceMetric::euclidean: {
            double sum = 0.0;
            for (size_t i = 0; i < n; ++i) {
                double d = double(a[i]) - b[i];
                sum += d * d;
            }
            return float(1.0 / (1.0 + std::sqrt(sum)));
        }
    }
    return 0.0f;
}

bool matches_filter(const Metadata& metadata, const Filter& filter) {
    if (filter.is_null() || filter.empty()) return true;
    if (!filter.is_object()) throw RetrievalError("filter must be a JSON object");
    if (!metadata.is_object()) return false;
    for (auto it = filter.begin(); it != filter.end(); ++it) {
        auto m = metadata.find(it.key());
        if (m == metadata.end() || *m != it.value()) return false;
    }
    return true;
}

std::unique_ptr<VectorIndex> make_vector_index(const VectorIndexConfig& config) {
    if (config.kind == "sqlite") return std::make_unique<SqliteVectorIndex>(config.sqlite_path);
    if (config.kind == "qdrant") return std::make_unique<QdrantVectorIndex>(config);
    throw ConfigError("unknown vector index kind: " + config.kind);
}

} // namespace ragcore
