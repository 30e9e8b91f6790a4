#pragma once
#include "chunker.hpp"
#include "embedding.hpp"
#include "kv_cache.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "reranker.hpp"
#include "vector_index.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ragcore {

struct RagConfig {
    ChunkerConfig chunker;
    ChunkStrategy strategy{ChunkStrategy::recursive};
    EmbeddingConfig embedding;
    RerankConfig rerank;
    VectorIndexConfig index;
    CacheConfig cache;
    PipelineConfig pipeline;
    LogLevel log_level{LogLevel::info};
};

RagConfig default_config();

// Overlays the sections present in j onto config. Wrong value types throw ConfigError.
void apply_config_json(RagConfig& config, const nlohmann::json& j);
void load_config_file(RagConfig& config, const std::string& path);
void apply_env(RagConfig& config);

// Throws ConfigError on the first invalid setting.
void validate(const RagConfig& config);

} // namespace ragcore
