#include "../include/rag.hpp"
#include "../../../shared/cpp/retrieval/include/log.hpp"
#include "../../../shared/cpp/retrieval/include/util.hpp"
#include <chrono>

using ragcore::Document;

static void ensure_parent_dir(const std::string& db_path) {
    if (db_path.empty() || db_path == ":memory:") return;
    auto parent = std::filesystem::path(db_path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
}

std::vector<Document> load_documents(const IngestOptions& opts) {
    std::vector<std::string> default_exts = {
        ".c", ".cc", ".cpp", ".cxx", ".h", ".hpp", ".hh", ".md", ".txt"
    };
    std::vector<std::string> ignores = opts.ignore_dirs.empty() ? std::vector<std::string>{
        ".git", ".svn", ".hg", ".idea", ".vscode", "build", "out", "bin", "obj", "node_modules", "venv", "dist", "target"
    } : opts.ignore_dirs;

    auto exts = opts.exts.empty() ? default_exts : opts.exts;
    auto paths = ragcore::list_files(opts.dir, exts, ignores);

    std::vector<Document> docs;
    docs.reserve(paths.size());
    for (auto& p : paths) {
        Document d;
        d.text = ragcore::read_text_file(p);
        if (d.text.empty()) continue;
        d.id = ragcore::sha1_hex(p.string());
        d.metadata = {
            {"source_path", p.string()},
            {"filename", p.filename().string()},
            {"extension", p.extension().string()},
            {"content_sha1", ragcore::sha1_file(p)}
        };
        docs.push_back(std::move(d));
    }
    ragcore::log_info("found " + std::to_string(docs.size()) + " documents under " + opts.dir.string());
    return docs;
}

RagRuntime::RagRuntime(const ragcore::RagConfig& config) : config_(config) {
    using namespace ragcore;
    validate(config_);
    set_log_level(config_.log_level);

    if (config_.index.kind == "sqlite") ensure_parent_dir(config_.index.sqlite_path);
    if (config_.embedding.use_cache && config_.cache.kind == "sqlite") ensure_parent_dir(config_.cache.sqlite_path);

    tokenizer_ = std::make_shared<ApproxTokenizer>();
    chunker_ = std::make_unique<Chunker>(config_.chunker, tokenizer_);
    provider_ = make_embedding_provider(config_.embedding);
    provider_client_ = std::make_unique<ProviderEmbeddingClient>(*provider_, config_.embedding, tokenizer_);

    EmbeddingClient* embedder = provider_client_.get();
    if (config_.embedding.use_cache) {
        cache_ = make_cache(config_.cache);
        auto ttl = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::seconds(config_.embedding.cache_ttl_seconds));
        cached_client_ = std::make_unique<CachingEmbeddingClient>(*provider_client_, *cache_, ttl, tokenizer_);
        embedder = cached_client_.get();
    }

    index_ = make_vector_index(config_.index);
    store_ = std::make_unique<IndexStore>(*index_);
    reranker_ = make_reranker(config_.rerank);
    pipeline_ = std::make_unique<RetrievalPipeline>(*chunker_, *embedder, *store_, reranker_.get(), config_.pipeline);
    pipeline_->initialize();
}

std::size_t RagRuntime::clear_embedding_cache() {
    return cached_client_ ? cached_client_->clear_cache() : 0;
}

ragcore::IngestReport rag_ingest(RagRuntime& runtime, const IngestOptions& opts) {
    if (opts.reset) runtime.pipeline().clear_index();
    auto docs = load_documents(opts);
    return runtime.pipeline().index_documents(docs, opts.strategy);
}
