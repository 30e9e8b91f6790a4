#pragma once
#include "../../../shared/cpp/retrieval/include/config.hpp"
#include "../../../shared/cpp/retrieval/include/pipeline.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

struct IngestOptions {
    std::filesystem::path dir;
    std::vector<std::string> exts; // include-list; empty means default set
    std::vector<std::string> ignore_dirs; // default added if empty
    bool reset{false};
    ragcore::ChunkStrategy strategy{ragcore::ChunkStrategy::recursive};
};

// Documents for every matching file under opts.dir. The id is the SHA-1 of
// the path so re-ingesting an edited file replaces its chunks.
std::vector<ragcore::Document> load_documents(const IngestOptions& opts);

// Builds and owns one retrieval stack from a validated config.
class RagRuntime {
public:
    explicit RagRuntime(const ragcore::RagConfig& config);

    ragcore::RetrievalPipeline& pipeline() { return *pipeline_; }
    const ragcore::RagConfig& config() const { return config_; }
    std::size_t clear_embedding_cache();

private:
    ragcore::RagConfig config_;
    std::shared_ptr<const ragcore::Tokenizer> tokenizer_;
    std::unique_ptr<ragcore::Chunker> chunker_;
    std::unique_ptr<ragcore::KeyValueCache> cache_;
    std::unique_ptr<ragcore::EmbeddingProvider> provider_;
    std::unique_ptr<ragcore::ProviderEmbeddingClient> provider_client_;
    std::unique_ptr<ragcore::CachingEmbeddingClient> cached_client_;
    std::unique_ptr<ragcore::VectorIndex> index_;
    std::unique_ptr<ragcore::IndexStore> store_;
    std::unique_ptr<ragcore::Reranker> reranker_;
    std::unique_ptr<ragcore::RetrievalPipeline> pipeline_;
};

ragcore::IngestReport rag_ingest(RagRuntime& runtime, const IngestOptions& opts);
