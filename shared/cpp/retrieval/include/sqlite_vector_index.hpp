#pragma once
#include "vector_index.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace ragcore {

// Local vector index on a single SQLite file (or ":memory:"). Vectors are
// stored as float blobs and searched by brute force.
class SqliteVectorIndex : public VectorIndex {
public:
    explicit SqliteVectorIndex(const std::string& db_path);
    ~SqliteVectorIndex() override;

    void create_collection(const CollectionConfig& config, bool recreate) override;
    void drop_collection(const std::string& collection) override;
    bool has_collection(const std::string& collection) override;

    void upsert(const std::string& collection, const std::vector<IndexedVector>& points) override;
    std::vector<IndexedVector> search(const std::string& collection, const std::vector<float>& query,
                                      std::size_t k, const Filter& filter,
                                      std::optional<float> score_threshold) override;
    std::vector<IndexedVector> fetch(const std::string& collection, const std::vector<std::string>& ids) override;
    void remove(const std::string& collection, const std::vector<std::string>& ids) override;
    std::vector<IndexedVector> scroll(const std::string& collection) override;
    CollectionStats collection_stats(const std::string& collection) override;
    bool healthy() override;

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();
    std::optional<CollectionConfig> find_collection(const std::string& collection);
    CollectionConfig require_collection(const std::string& collection);
    IndexedVector read_row(sqlite3_stmt* st);

    std::mutex mtx_;
    sqlite3* db_ {nullptr};
    sqlite3_stmt* insert_stmt_ {nullptr};
    sqlite3_stmt* delete_stmt_ {nullptr};
    sqlite3_stmt* all_stmt_ {nullptr};
    sqlite3_stmt* one_stmt_ {nullptr};
    sqlite3_stmt* collection_stmt_ {nullptr};
};

} // namespace ragcore
