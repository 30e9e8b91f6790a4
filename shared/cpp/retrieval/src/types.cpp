#include "../include/types.hpp"
#include "../include/errors.hpp"

namespace ragcore {

std::string to_string(DistanceMetric metric) {
    switch (metric) {
        case DistanceMetric::cosine: return "cosine";
        case DistanceMetric::dot: return "dot";
        case DistanceMetric::euclidean: return "euclidean";
    }
    return "cosine";
}

DistanceMetric parse_distance_metric(const std::string& name) {
    if (name == "cosine") return DistanceMetric::cosine;
    if (name == "dot") return DistanceMetric::dot;
    if (name == "euclidean" || name == "euclid") return DistanceMetric::euclidean;
    throw ConfigError("unknown distance metric: " + name);
}

std::string RetrievalResult::strategy_name() const {
    std::string s;
    switch (strategy) {
        case Strategy::vector: s = "vector"; break;
        case Strategy::lexical: s = "lexical"; break;
        case Strategy::hybrid: s = "hybrid"; break;
    }
    if (reranked) s += "+rerank";
    return s;
}

} // namespace ragcore
