#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace ragcore {

namespace {
template <typename T>
void read(const json& section, const char* key, T& out, const std::string& where) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(where + "." + key + ": " + e.what());
    }
}

void read_ms(const json& section, const char* key, std::chrono::milliseconds& out, const std::string& where) {
    long long ms = out.count();
    read(section, key, ms, where);
    out = std::chrono::milliseconds(ms);
}

const json& section_of(const json& j, const char* name) {
    static const json empty = json::object();
    auto it = j.find(name);
    if (it == j.end()) return empty;
    if (!it->is_object()) throw ConfigError(std::string("config section ") + name + " must be an object");
    return *it;
}

std::size_t env_size(const char* key, std::size_t def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        long long n = std::stoll(v);
        if (n < 0) throw ConfigError(std::string(key) + " must not be negative");
        return (std::size_t)n;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string(key) + " is not a number: " + v);
    }
}

double env_double(const char* key, double def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        return std::stod(v);
    } catch (const std::logic_error&) {
        throw ConfigError(std::string(key) + " is not a number: " + v);
    }
}
}

RagConfig default_config() {
    RagConfig c;
    c.pipeline.dim = c.embedding.dim;
    return c;
}

void apply_config_json(RagConfig& config, const json& j) {
    if (!j.is_object()) throw ConfigError("config root must be a JSON object");

    if (j.contains("log_level")) {
        std::string level;
        read(j, "log_level", level, "config");
        config.log_level = parse_log_level(level);
    }

    const json& chunking = section_of(j, "chunking");
    read(chunking, "chunk_tokens", config.chunker.chunk_tokens, "chunking");
    read(chunking, "overlap_tokens", config.chunker.overlap_tokens, "chunking");
    read(chunking, "min_chunk_tokens", config.chunker.min_chunk_tokens, "chunking");
    if (chunking.contains("strategy")) {
        std::string s;
        read(chunking, "strategy", s, "chunking");
        config.strategy = parse_chunk_strategy(s);
    }

    const json& embedding = section_of(j, "embedding");
    read(embedding, "provider", config.embedding.provider, "embedding");
    read(embedding, "url", config.embedding.url, "embedding");
    read(embedding, "model", config.embedding.model, "embedding");
    read(embedding, "api_key", config.embedding.api_key, "embedding");
    read(embedding, "dim", config.embedding.dim, "embedding");
    read(embedding, "batch_size", config.embedding.batch_size, "embedding");
    read(embedding, "timeout_ms", config.embedding.timeout_ms, "embedding");
    read(embedding, "requests_per_second", config.embedding.requests_per_second, "embedding");
    read(embedding, "max_retries", config.embedding.max_retries, "embedding");
    read(embedding, "cache_ttl_seconds", config.embedding.cache_ttl_seconds, "embedding");
    read(embedding, "use_cache", config.embedding.use_cache, "embedding");

    const json& rerank = section_of(j, "rerank");
    read(rerank, "provider", config.rerank.provider, "rerank");
    read(rerank, "url", config.rerank.url, "rerank");
    read(rerank, "model", config.rerank.model, "rerank");
    read(rerank, "api_key", config.rerank.api_key, "rerank");
    read(rerank, "timeout_ms", config.rerank.timeout_ms, "rerank");
    read(rerank, "requests_per_second", config.rerank.requests_per_second, "rerank");
    read(rerank, "max_retries", config.rerank.max_retries, "rerank");

    const json& index = section_of(j, "index");
    read(index, "kind", config.index.kind, "index");
    read(index, "sqlite_path", config.index.sqlite_path, "index");
    read(index, "qdrant_url", config.index.qdrant_url, "index");
    read(index, "api_key", config.index.api_key, "index");
    read(index, "timeout_ms", config.index.timeout_ms, "index");
    read(index, "max_retries", config.index.max_retries, "index");

    const json& cache = section_of(j, "cache");
    read(cache, "kind", config.cache.kind, "cache");
    read(cache, "sqlite_path", config.cache.sqlite_path, "cache");
    read(cache, "shards", config.cache.shards, "cache");

    const json& pipeline = section_of(j, "pipeline");
    read(pipeline, "collection", config.pipeline.collection, "pipeline");
    if (pipeline.contains("distance")) {
        std::string d;
        read(pipeline, "distance", d, "pipeline");
        config.pipeline.distance = parse_distance_metric(d);
    }
    read(pipeline, "default_alpha", config.pipeline.default_alpha, "pipeline");
    read(pipeline, "max_rerank_candidates", config.pipeline.max_rerank_candidates, "pipeline");
    if (pipeline.contains("score_threshold") && !pipeline["score_threshold"].is_null()) {
        float t = 0.0f;
        read(pipeline, "score_threshold", t, "pipeline");
        config.pipeline.score_threshold = t;
    }
    read_ms(pipeline, "lexical_timeout_ms", config.pipeline.lexical_timeout, "pipeline");
    read_ms(pipeline, "embed_timeout_ms", config.pipeline.embed_timeout, "pipeline");
    read_ms(pipeline, "vector_timeout_ms", config.pipeline.vector_timeout, "pipeline");
    read_ms(pipeline, "rerank_timeout_ms", config.pipeline.rerank_timeout, "pipeline");
    read(pipeline, "query_threads", config.pipeline.query_threads, "pipeline");
    read(pipeline, "ingest_threads", config.pipeline.ingest_threads, "pipeline");
    read(pipeline, "ingest_batch_size", config.pipeline.ingest_batch_size, "pipeline");

    config.pipeline.dim = config.embedding.dim;
}

void load_config_file(RagConfig& config, const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open config file " + path);
    json j;
    try {
        j = json::parse(in);
    } catch (const json::exception& e) {
        throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }
    apply_config_json(config, j);
}

void apply_env(RagConfig& config) {
    std::string level = getenv_or("RAG_LOG_LEVEL", "");
    if (!level.empty()) config.log_level = parse_log_level(level);

    config.chunker.chunk_tokens = env_size("RAG_CHUNK_TOKENS", config.chunker.chunk_tokens);
    config.chunker.overlap_tokens = env_size("RAG_CHUNK_OVERLAP", config.chunker.overlap_tokens);
    config.chunker.min_chunk_tokens = env_size("RAG_MIN_CHUNK_TOKENS", config.chunker.min_chunk_tokens);
    std::string strategy = getenv_or("RAG_CHUNK_STRATEGY", "");
    if (!strategy.empty()) config.strategy = parse_chunk_strategy(strategy);

    config.embedding.provider = getenv_or("RAG_EMBED_PROVIDER", config.embedding.provider);
    if (config.embedding.provider == "ollama") {
        config.embedding.url = getenv_or("OLLAMA_URL", config.embedding.url);
    } else if (config.embedding.provider == "openai") {
        config.embedding.api_key = getenv_or("OPENAI_API_KEY", config.embedding.api_key);
    }
    config.embedding.url = getenv_or("RAG_EMBED_URL", config.embedding.url);
    config.embedding.model = getenv_or("RAG_EMBED_MODEL", config.embedding.model);
    config.embedding.dim = env_size("RAG_EMBED_DIM", config.embedding.dim);
    config.embedding.batch_size = env_size("RAG_EMBED_BATCH", config.embedding.batch_size);
    config.embedding.requests_per_second = env_double("RAG_EMBED_QPS", config.embedding.requests_per_second);

    config.rerank.provider = getenv_or("RAG_RERANK_PROVIDER", config.rerank.provider);
    config.rerank.url = getenv_or("RAG_RERANK_URL", config.rerank.url);
    config.rerank.model = getenv_or("RAG_RERANK_MODEL", config.rerank.model);
    config.rerank.api_key = getenv_or("COHERE_API_KEY", config.rerank.api_key);

    config.index.kind = getenv_or("RAG_INDEX", config.index.kind);
    config.index.sqlite_path = getenv_or("RAG_DB_PATH", config.index.sqlite_path);
    config.index.qdrant_url = getenv_or("QDRANT_URL", config.index.qdrant_url);
    config.index.api_key = getenv_or("QDRANT_API_KEY", config.index.api_key);

    config.cache.kind = getenv_or("RAG_CACHE", config.cache.kind);
    config.cache.sqlite_path = getenv_or("RAG_CACHE_PATH", config.cache.sqlite_path);

    config.pipeline.collection = getenv_or("RAG_COLLECTION", config.pipeline.collection);
    config.pipeline.default_alpha = (float)env_double("RAG_ALPHA", config.pipeline.default_alpha);
    config.pipeline.dim = config.embedding.dim;
}

void validate(const RagConfig& config) {
    if (config.chunker.chunk_tokens == 0) throw ConfigError("chunk_tokens must be positive");
    if (config.chunker.overlap_tokens >= config.chunker.chunk_tokens) {
        throw ConfigError("overlap_tokens must be smaller than chunk_tokens");
    }
    if (config.embedding.provider != "ollama" && config.embedding.provider != "openai" &&
        config.embedding.provider != "hashing") {
        throw ConfigError("unknown embedding provider: " + config.embedding.provider);
    }
    if (config.embedding.dim == 0) throw ConfigError("embedding dim must be positive");
    if (config.embedding.batch_size == 0) throw ConfigError("embedding batch_size must be positive");
    if (config.embedding.max_retries < 0) throw ConfigError("embedding max_retries must not be negative");
    if (config.rerank.provider != "none" && config.rerank.provider != "cohere" && config.rerank.provider != "http") {
        throw ConfigError("unknown rerank provider: " + config.rerank.provider);
    }
    if (config.index.kind != "sqlite" && config.index.kind != "qdrant") {
        throw ConfigError("unknown vector index kind: " + config.index.kind);
    }
    if (config.cache.kind != "memory" && config.cache.kind != "sqlite") {
        throw ConfigError("unknown cache kind: " + config.cache.kind);
    }
    if (config.pipeline.collection.empty()) throw ConfigError("collection name must not be empty");
    if (config.pipeline.default_alpha < 0.0f || config.pipeline.default_alpha > 1.0f) {
        throw ConfigError("default_alpha must be within [0, 1]");
    }
    if (config.pipeline.dim != config.embedding.dim) {
        throw ConfigError("collection dim " + std::to_string(config.pipeline.dim) + " differs from embedding dim " +
                          std::to_string(config.embedding.dim));
    }
    if (config.pipeline.ingest_batch_size == 0) throw ConfigError("ingest_batch_size must be positive");
}

} // namespace ragcore
