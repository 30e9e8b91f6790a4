#include "../include/pipeline.hpp"
#include "../include/errors.hpp"
#include "../include/fusion.hpp"
#include "../include/log.hpp"
#include <algorithm>

namespace ragcore {

namespace {
using Clock = std::chrono::steady_clock;

double ms_since(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

std::string document_of(const Metadata& metadata) {
    if (!metadata.is_object()) return {};
    auto it = metadata.find("document_id");
    return it != metadata.end() && it->is_string() ? it->get<std::string>() : std::string();
}

std::vector<ScoredChunk> from_vector_hits(const std::vector<IndexedVector>& hits) {
    std::vector<ScoredChunk> out;
    out.reserve(hits.size());
    for (auto& h : hits) {
        ScoredChunk c;
        c.id = h.id;
        c.document_id = document_of(h.metadata);
        c.text = h.text;
        c.metadata = h.metadata;
        c.score = h.score.value_or(0.0f);
        out.push_back(std::move(c));
    }
    return out;
}

std::vector<ScoredChunk> from_lexical_hits(const std::vector<LexicalHit>& hits) {
    std::vector<ScoredChunk> out;
    out.reserve(hits.size());
    for (auto& h : hits) {
        ScoredChunk c;
        c.id = h.id;
        c.document_id = document_of(h.metadata);
        c.text = h.text;
        c.metadata = h.metadata;
        c.score = h.score;
        out.push_back(std::move(c));
    }
    return out;
}
}

RetrievalPipeline::RetrievalPipeline(Chunker& chunker, EmbeddingClient& embedder, IndexStore& store,
                                     Reranker* reranker, PipelineConfig config)
    : chunker_(chunker),
      embedder_(embedder),
      store_(store),
      reranker_(reranker),
      config_(std::move(config)),
      ingest_pool_(config_.ingest_threads, "ingest"),
      query_pool_(config_.query_threads, "query") {
    if (config_.default_alpha < 0.0f || config_.default_alpha > 1.0f) {
        throw ConfigError("default alpha must be within [0, 1]");
    }
    if (config_.ingest_batch_size == 0) config_.ingest_batch_size = 1;
}

void RetrievalPipeline::initialize() {
    store_.create_collection({config_.collection, config_.dim, config_.distance}, false);
    std::size_t n = store_.rebuild_lexical(config_.collection);
    log_info("retrieval pipeline ready: collection " + config_.collection + ", " + std::to_string(n) +
             " chunks, reranker " + (reranker_ ? "on" : "off"));
}

std::size_t RetrievalPipeline::commit_chunks(const std::string& document_id, const std::vector<Chunk>& chunks) {
    try {
        std::vector<std::string> texts;
        texts.reserve(chunks.size());
        for (auto& c : chunks) texts.push_back(c.text);
        auto embedded = embedder_.embed_batch(texts);
        if (embedded.size() != chunks.size()) {
            throw IngestError(document_id, "embedding returned " + std::to_string(embedded.size()) + " vectors for " +
                                               std::to_string(chunks.size()) + " chunks");
        }
        std::vector<IndexedVector> points;
        points.reserve(chunks.size());
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            IndexedVector p;
            p.id = chunks[i].id;
            p.vector = std::move(embedded[i].vector);
            p.text = chunks[i].text;
            p.metadata = chunks[i].metadata;
            points.push_back(std::move(p));
        }
        return store_.commit_document(config_.collection, document_id, points);
    } catch (const DimensionMismatch&) {
        throw;
    } catch (const IngestError&) {
        throw;
    } catch (const std::exception& e) {
        throw IngestError(document_id, e.what());
    }
}

std::size_t RetrievalPipeline::index_document(const Document& document, ChunkStrategy strategy) {
    if (document.id.empty()) throw IngestError(document.id, "document id must not be empty");
    auto guard = document_locks_.lock(document.id);
    auto start = Clock::now();

    std::vector<Chunk> chunks;
    try {
        chunks = chunker_.chunk(document, strategy);
    } catch (const std::exception& e) {
        throw IngestError(document.id, std::string("chunking: ") + e.what());
    }
    if (chunks.empty()) {
        std::size_t removed = store_.remove_document(config_.collection, document.id);
        log_info("document " + document.id + " is empty; removed " + std::to_string(removed) + " stale chunks");
        return 0;
    }

    std::size_t n = commit_chunks(document.id, chunks);
    log_info("indexed " + document.id + ": " + std::to_string(n) + " chunks in " +
             std::to_string((long long)ms_since(start)) + "ms");
    return n;
}

std::size_t RetrievalPipeline::index_conversation(const std::string& conversation_id,
                                                  const std::vector<ConversationMessage>& messages,
                                                  std::size_t max_messages_per_chunk) {
    if (conversation_id.empty()) throw IngestError(conversation_id, "conversation id must not be empty");
    auto guard = document_locks_.lock(conversation_id);
    auto chunks = chunker_.chunk_conversation(conversation_id, messages, max_messages_per_chunk);
    if (chunks.empty()) {
        store_.remove_document(config_.collection, conversation_id);
        return 0;
    }
    std::size_t n = commit_chunks(conversation_id, chunks);
    log_info("indexed conversation " + conversation_id + ": " + std::to_string(n) + " chunks");
    return n;
}

IngestReport RetrievalPipeline::index_documents(const std::vector<Document>& documents, ChunkStrategy strategy) {
    IngestReport report;
    for (std::size_t i = 0; i < documents.size(); i += config_.ingest_batch_size) {
        std::size_t end = std::min(documents.size(), i + config_.ingest_batch_size);
        std::vector<std::future<std::size_t>> pending;
        pending.reserve(end - i);
        for (std::size_t j = i; j < end; ++j) {
            const Document* doc = &documents[j];
            pending.push_back(ingest_pool_.submit([this, doc, strategy] { return index_document(*doc, strategy); }));
        }
        for (std::size_t j = i; j < end; ++j) {
            try {
                std::size_t n = pending[j - i].get();
                report.indexed.emplace_back(documents[j].id, n);
                report.total_chunks += n;
            } catch (const std::exception& e) {
                log_error(e.what());
                report.failures.push_back({documents[j].id, e.what()});
            }
        }
    }
    log_info("ingest batch done: " + std::to_string(report.indexed.size()) + " documents, " +
             std::to_string(report.total_chunks) + " chunks, " + std::to_string(report.failures.size()) +
             " failures");
    return report;
}

std::size_t RetrievalPipeline::delete_document(const std::string& document_id) {
    auto guard = document_locks_.lock(document_id);
    std::size_t removed = store_.remove_document(config_.collection, document_id);
    log_info("deleted " + document_id + ": " + std::to_string(removed) + " chunks");
    return removed;
}

RetrievalResult RetrievalPipeline::retrieve(const std::string& query, std::size_t k, bool use_hybrid,
                                            bool use_rerank, const Filter& filter, std::optional<float> alpha) {
    RetrieveOptions options;
    options.k = k;
    options.use_hybrid = use_hybrid;
    options.use_rerank = use_rerank;
    options.filter = filter;
    options.alpha = alpha;
    return retrieve(query, options);
}

RetrievalResult RetrievalPipeline::retrieve(const std::string& query, const RetrieveOptions& options) {
    auto start = Clock::now();
    float alpha = options.alpha.value_or(config_.default_alpha);
    if (alpha < 0.0f || alpha > 1.0f) throw RetrievalError("alpha must be within [0, 1]");

    RetrievalResult result;
    result.query = query;
    result.strategy = Strategy::vector;
    if (options.k == 0) {
        result.elapsed_ms = ms_since(start);
        return result;
    }

    const std::string collection = config_.collection;
    const std::size_t candidates = 2 * options.k;
    const Filter filter = options.filter;
    auto snapshot = store_.lexical_snapshot(collection);
    bool lexical_available = snapshot && !snapshot->empty();

    // Lexical side starts first so it runs alongside the embedding call.
    SideOutcome<std::vector<LexicalHit>> lexical;
    std::future<std::vector<LexicalHit>> lexical_future;
    if (options.use_hybrid && lexical_available) {
        lexical_future = query_pool_.submit([snapshot, query, candidates, filter] {
            return snapshot->search(query, candidates, filter);
        });
    }

    SideOutcome<std::vector<IndexedVector>> vector;
    auto embed_future = query_pool_.submit([this, query] { return embedder_.embed(query).vector; });
    auto embedded = await_side(embed_future, start + config_.embed_timeout, "query embedding");
    if (embedded.ok()) {
        auto qv = std::move(embedded.value);
        auto threshold = config_.score_threshold;
        auto search_future = query_pool_.submit([this, collection, qv, candidates, filter, threshold] {
            return store_.search(collection, qv, candidates, filter, threshold);
        });
        vector = await_side(search_future, start + config_.vector_timeout, "vector search");
    } else {
        vector.status = embedded.status;
        vector.message = embedded.message;
    }

    if (lexical_future.valid()) {
        lexical = await_side(lexical_future, start + config_.lexical_timeout, "lexical search");
    }
    // Vector side gone and lexical never tried: fall back to lexical alone.
    if (!vector.ok() && lexical.status == SideStatus::skipped && lexical_available) {
        auto fallback = query_pool_.submit([snapshot, query, candidates, filter] {
            return snapshot->search(query, candidates, filter);
        });
        lexical = await_side(fallback, Clock::now() + config_.lexical_timeout, "lexical search");
    }

    for (auto* msg : {&vector.message, &lexical.message}) {
        if (!msg->empty()) {
            result.notes.push_back(*msg);
            log_warn("query degraded: " + *msg);
        }
    }

    std::vector<ScoredChunk> ranked;
    if (vector.ok() && lexical.ok()) {
        result.strategy = Strategy::hybrid;
        ranked = fuse_scores(from_lexical_hits(lexical.value), from_vector_hits(vector.value), alpha);
    } else if (vector.ok()) {
        result.strategy = Strategy::vector;
        ranked = from_vector_hits(vector.value);
        result.degraded = lexical.status == SideStatus::failed || lexical.status == SideStatus::timed_out;
    } else if (lexical.ok()) {
        result.strategy = Strategy::lexical;
        ranked = from_lexical_hits(lexical.value);
        result.degraded = true;
    } else if (lexical.status == SideStatus::skipped && !lexical_available) {
        // Nothing is indexed lexically, so there is nothing to return either way.
        result.degraded = true;
    } else {
        double elapsed = ms_since(start);
        record_query(elapsed, true, true);
        std::string why;
        for (auto& n : result.notes) why += (why.empty() ? "" : "; ") + n;
        throw RetrievalError("retrieval failed: " + why);
    }
    result.candidates_examined = (int)ranked.size();

    if (options.use_rerank && reranker_ && !ranked.empty()) {
        std::size_t n = std::min({candidates, config_.max_rerank_candidates, ranked.size()});
        std::vector<std::string> texts;
        texts.reserve(n);
        for (std::size_t i = 0; i < n; ++i) texts.push_back(ranked[i].text);
        std::size_t top_n = std::min(options.k, n);
        Reranker* reranker = reranker_;
        auto rerank_future = query_pool_.submit([reranker, query, texts, top_n] {
            return reranker->rerank(query, texts, top_n);
        });
        auto reranked = await_side(rerank_future, Clock::now() + config_.rerank_timeout, "rerank");
        std::string rejected;
        if (reranked.ok()) {
            std::vector<bool> seen(n, false);
            for (auto& hit : reranked.value) {
                if (hit.index >= n || seen[hit.index]) {
                    rejected = "rerank returned invalid index " + std::to_string(hit.index);
                    break;
                }
                seen[hit.index] = true;
            }
        }
        if (reranked.ok() && !reranked.value.empty() && rejected.empty()) {
            std::vector<bool> used(ranked.size(), false);
            std::vector<ScoredChunk> out;
            out.reserve(ranked.size());
            for (auto& hit : reranked.value) {
                ScoredChunk c = ranked[hit.index];
                c.score = hit.relevance_score;
                used[hit.index] = true;
                out.push_back(std::move(c));
            }
            // Candidates the reranker did not score keep their fused order behind the reranked ones.
            for (std::size_t i = 0; i < ranked.size(); ++i) {
                if (!used[i]) out.push_back(std::move(ranked[i]));
            }
            ranked = std::move(out);
            result.reranked = true;
        } else {
            std::string msg = !reranked.ok() ? reranked.message
                              : !rejected.empty() ? rejected
                                                  : "rerank returned no results";
            result.notes.push_back(msg);
            result.degraded = true;
            log_warn("rerank skipped, keeping fused order: " + msg);
        }
    }

    if (ranked.size() > options.k) ranked.resize(options.k);
    result.chunks = std::move(ranked);
    result.elapsed_ms = ms_since(start);
    record_query(result.elapsed_ms, result.degraded, false);
    log_info("query \"" + query.substr(0, 60) + "\" -> " + std::to_string(result.chunks.size()) + " results (" +
             result.strategy_name() + ", " + std::to_string((long long)result.elapsed_ms) + "ms)");
    return result;
}

void RetrievalPipeline::record_query(double elapsed_ms, bool degraded, bool failed) {
    std::lock_guard<std::mutex> lock(stats_mtx_);
    ++total_queries_;
    if (degraded) ++degraded_queries_;
    if (failed) ++failed_queries_;
    total_latency_ms_ += elapsed_ms;
}

void RetrievalPipeline::clear_index() {
    clear_index(config_.collection);
}

void RetrievalPipeline::clear_index(const std::string& collection) {
    store_.clear_collection(collection);
}

PipelineStats RetrievalPipeline::stats() const {
    PipelineStats s;
    {
        std::lock_guard<std::mutex> lock(stats_mtx_);
        s.total_queries = total_queries_;
        s.degraded_queries = degraded_queries_;
        s.failed_queries = failed_queries_;
        s.avg_latency_ms = total_queries_ ? total_latency_ms_ / double(total_queries_) : 0.0;
    }
    s.indexed_chunk_count = store_.lexical_size(config_.collection);
    auto e = embedder_.stats();
    s.cache_hit_rate = e.cache_hit_rate();
    s.total_embedding_cost = e.total_cost;
    s.total_embedding_tokens = e.total_tokens;
    return s;
}

PipelineHealth RetrievalPipeline::health() {
    PipelineHealth h;
    h.vector_index = store_.health_check();
    h.lexical_chunks = store_.lexical_size(config_.collection);
    h.reranker_configured = reranker_ != nullptr;
    return h;
}

} // namespace ragcore
