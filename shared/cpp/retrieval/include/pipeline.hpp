#pragma once
#include "chunker.hpp"
#include "embedding.hpp"
#include "index_store.hpp"
#include "reranker.hpp"
#include "worker_pool.hpp"
#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ragcore {

struct PipelineConfig {
    std::string collection{"lumen_knowledge"};
    DistanceMetric distance{DistanceMetric::cosine};
    std::size_t dim{1024};
    float default_alpha{0.5f};
    std::size_t max_rerank_candidates{50};
    std::optional<float> score_threshold;
    std::chrono::milliseconds lexical_timeout{2000};
    std::chrono::milliseconds embed_timeout{10000};
    std::chrono::milliseconds vector_timeout{15000};
    std::chrono::milliseconds rerank_timeout{10000};
    std::size_t query_threads{4};
    std::size_t ingest_threads{2};
    std::size_t ingest_batch_size{8};
};

struct RetrieveOptions {
    std::size_t k{5};
    bool use_hybrid{true};
    bool use_rerank{true};
    Filter filter;
    std::optional<float> alpha;
};

struct IngestFailure {
    std::string document_id;
    std::string error;
};

struct IngestReport {
    std::vector<std::pair<std::string, std::size_t>> indexed; // document id, chunks
    std::vector<IngestFailure> failures;
    std::size_t total_chunks{0};
};

struct PipelineStats {
    std::size_t total_queries{0};
    std::size_t degraded_queries{0};
    std::size_t failed_queries{0};
    double avg_latency_ms{0.0};
    std::size_t indexed_chunk_count{0};
    double cache_hit_rate{0.0};
    double total_embedding_cost{0.0};
    std::size_t total_embedding_tokens{0};
};

struct PipelineHealth {
    bool vector_index{false};
    std::size_t lexical_chunks{0};
    bool reranker_configured{false};
};

enum class SideStatus { skipped, ok, failed, timed_out };

// Result of one retrieval side: a value, or the reason there is none.
template <typename T>
struct SideOutcome {
    SideStatus status{SideStatus::skipped};
    T value{};
    std::string message;

    bool ok() const { return status == SideStatus::ok; }
};

template <typename T>
SideOutcome<T> await_side(std::future<T>& fut, std::chrono::steady_clock::time_point deadline,
                          const std::string& side) {
    SideOutcome<T> out;
    if (fut.wait_until(deadline) != std::future_status::ready) {
        out.status = SideStatus::timed_out;
        out.message = side + " timed out";
        return out;
    }
    try {
        out.value = fut.get();
        out.status = SideStatus::ok;
    } catch (const std::exception& e) {
        out.status = SideStatus::failed;
        out.message = side + " failed: " + e.what();
    }
    return out;
}

// Ingest: chunk -> embed -> commit to both indices. Query: lexical and vector
// search in parallel -> fusion -> optional rerank. Components are owned by the
// caller and must outlive the pipeline.
class RetrievalPipeline {
public:
    RetrievalPipeline(Chunker& chunker, EmbeddingClient& embedder, IndexStore& store, Reranker* reranker,
                      PipelineConfig config = {});

    // Creates the collection if missing and rebuilds the lexical mirror from it.
    void initialize();

    std::size_t index_document(const Document& document, ChunkStrategy strategy = ChunkStrategy::recursive);
    std::size_t index_conversation(const std::string& conversation_id,
                                   const std::vector<ConversationMessage>& messages,
                                   std::size_t max_messages_per_chunk = 10);
    IngestReport index_documents(const std::vector<Document>& documents,
                                 ChunkStrategy strategy = ChunkStrategy::recursive);
    std::size_t delete_document(const std::string& document_id);

    RetrievalResult retrieve(const std::string& query, const RetrieveOptions& options);
    RetrievalResult retrieve(const std::string& query, std::size_t k, bool use_hybrid = true, bool use_rerank = true,
                             const Filter& filter = nullptr, std::optional<float> alpha = std::nullopt);

    void clear_index();
    void clear_index(const std::string& collection);

    PipelineStats stats() const;
    PipelineHealth health();
    const PipelineConfig& config() const { return config_; }

private:
    std::size_t commit_chunks(const std::string& document_id, const std::vector<Chunk>& chunks);
    void record_query(double elapsed_ms, bool degraded, bool failed);

    Chunker& chunker_;
    EmbeddingClient& embedder_;
    IndexStore& store_;
    Reranker* reranker_;
    PipelineConfig config_;
    KeyedMutex document_locks_;

    mutable std::mutex stats_mtx_;
    std::size_t total_queries_{0};
    std::size_t degraded_queries_{0};
    std::size_t failed_queries_{0};
    double total_latency_ms_{0.0};

    // Last, so queued and timed-out tasks finish before anything they touch goes away.
    WorkerPool ingest_pool_;
    WorkerPool query_pool_;
};

} // namespace ragcore
