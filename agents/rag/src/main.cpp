#include "../include/rag.hpp"
#include "../../../shared/cpp/retrieval/include/errors.hpp"
#include <iostream>
#include <filesystem>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

static void usage() {
    std::cerr << "rag_cli usage:\n"
              << "  ingest --dir <path> [--reset] [--strategy recursive|token_window|paragraph|sentence]\n"
              << "  query --question \"...\" [--top-k N] [--alpha A] [--no-hybrid] [--no-rerank] [--filter <json>]\n"
              << "  delete --id <document_id>\n"
              << "  clear\n"
              << "  stats\n"
              << "common: [--config <file>] [--db <dbfile>] [--ollama <url>] [--embed-model <name>]\n"
              << "        [--provider ollama|openai|hashing] [--index sqlite|qdrant]\n";
}

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Consumes a shared flag at argv[i]; returns false if it is not one.
static bool apply_common_flag(ragcore::RagConfig& cfg, int argc, char** argv, int& i) {
    std::string a = argv[i];
    auto next = [&]() -> std::string {
        if (i + 1 >= argc) throw UsageError(a + " needs a value");
        return argv[++i];
    };
    if (a == "--db") cfg.index.sqlite_path = next();
    else if (a == "--ollama") cfg.embedding.url = next();
    else if (a == "--embed-model") cfg.embedding.model = next();
    else if (a == "--provider") cfg.embedding.provider = next();
    else if (a == "--index") cfg.index.kind = next();
    else if (a == "--config") next(); // already applied before env
    else return false;
    return true;
}

static std::string find_config_path(int argc, char** argv) {
    for (int i = 2; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") return argv[i + 1];
    }
    return {};
}

static void print_stats(RagRuntime& rt) {
    auto s = rt.pipeline().stats();
    auto h = rt.pipeline().health();
    std::cout << "collection:        " << rt.config().pipeline.collection << "\n"
              << "vector index:      " << (h.vector_index ? "up" : "DOWN") << "\n"
              << "indexed chunks:    " << s.indexed_chunk_count << "\n"
              << "reranker:          " << (h.reranker_configured ? "configured" : "off") << "\n"
              << "queries:           " << s.total_queries << " (" << s.degraded_queries << " degraded, "
              << s.failed_queries << " failed)\n"
              << "avg latency ms:    " << s.avg_latency_ms << "\n"
              << "cache hit rate:    " << s.cache_hit_rate << "\n"
              << "embedding tokens:  " << s.total_embedding_tokens << "\n"
              << "embedding cost $:  " << s.total_embedding_cost << "\n";
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 2; }
    std::string cmd = argv[1];
    try {
        ragcore::RagConfig cfg = ragcore::default_config();
        std::string config_path = find_config_path(argc, argv);
        if (!config_path.empty()) ragcore::load_config_file(cfg, config_path);
        ragcore::apply_env(cfg);

        if (cmd == "ingest") {
            IngestOptions opts;
            opts.strategy = cfg.strategy;
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (apply_common_flag(cfg, argc, argv, i)) continue;
                if (a == "--dir" && i + 1 < argc) opts.dir = std::filesystem::path(argv[++i]);
                else if (a == "--reset") opts.reset = true;
                else if (a == "--strategy" && i + 1 < argc) opts.strategy = ragcore::parse_chunk_strategy(argv[++i]);
                else throw UsageError("unknown argument " + a);
            }
            if (opts.dir.empty()) throw UsageError("ingest needs --dir");
            cfg.pipeline.dim = cfg.embedding.dim;
            RagRuntime rt(cfg);
            auto report = rag_ingest(rt, opts);
            std::cout << "[OK] Ingested documents: " << report.indexed.size() << ", chunks: " << report.total_chunks
                      << "\n";
            for (auto& f : report.failures) std::cout << "[FAIL] " << f.document_id << ": " << f.error << "\n";
            return report.failures.empty() ? 0 : 1;
        } else if (cmd == "query") {
            ragcore::RetrieveOptions q;
            std::string question;
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (apply_common_flag(cfg, argc, argv, i)) continue;
                if (a == "--question" && i + 1 < argc) question = argv[++i];
                else if (a == "--top-k" && i + 1 < argc) q.k = (std::size_t)std::stoul(argv[++i]);
                else if (a == "--alpha" && i + 1 < argc) q.alpha = std::stof(argv[++i]);
                else if (a == "--no-hybrid") q.use_hybrid = false;
                else if (a == "--no-rerank") q.use_rerank = false;
                else if (a == "--filter" && i + 1 < argc) q.filter = json::parse(argv[++i]);
                else throw UsageError("unknown argument " + a);
            }
            if (question.empty()) throw UsageError("query needs --question");
            cfg.pipeline.dim = cfg.embedding.dim;
            RagRuntime rt(cfg);
            auto res = rt.pipeline().retrieve(question, q);
            std::cout << "\n==== Results (" << res.strategy_name() << ", " << res.elapsed_ms << " ms) ====\n\n";
            int i = 1;
            for (auto& c : res.chunks) {
                std::string name = c.metadata.value("filename", c.document_id);
                std::string path = c.metadata.value("source_path", std::string());
                std::cout << "[" << i++ << "] " << c.score << "  " << name << " - " << path << "\n"
                          << c.text.substr(0, 300) << "\n\n";
            }
            for (auto& n : res.notes) std::cout << "[WARN] " << n << "\n";
            return 0;
        } else if (cmd == "delete") {
            std::string id;
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (apply_common_flag(cfg, argc, argv, i)) continue;
                if (a == "--id" && i + 1 < argc) id = argv[++i];
                else throw UsageError("unknown argument " + a);
            }
            if (id.empty()) throw UsageError("delete needs --id");
            cfg.pipeline.dim = cfg.embedding.dim;
            RagRuntime rt(cfg);
            std::cout << "[OK] Removed chunks: " << rt.pipeline().delete_document(id) << "\n";
            return 0;
        } else if (cmd == "clear" || cmd == "stats") {
            for (int i = 2; i < argc; ++i) {
                if (!apply_common_flag(cfg, argc, argv, i)) throw UsageError(std::string("unknown argument ") + argv[i]);
            }
            cfg.pipeline.dim = cfg.embedding.dim;
            RagRuntime rt(cfg);
            if (cmd == "clear") {
                rt.pipeline().clear_index();
                std::cout << "[OK] Cleared " << rt.config().pipeline.collection << ", cached embeddings removed: "
                          << rt.clear_embedding_cache() << "\n";
            } else {
                print_stats(rt);
            }
            return 0;
        } else {
            usage();
            return 2;
        }
    } catch (const UsageError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        usage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
