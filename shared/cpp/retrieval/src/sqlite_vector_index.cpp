#include "../include/sqlite_vector_index.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cstring>

using json = nlohmann::json;

namespace ragcore {

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static void bind_blob(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
    sqlite3_bind_blob(st, idx, v.data(), (int)(v.size() * sizeof(float)), SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* st, int idx) {
    const unsigned char* t = sqlite3_column_text(st, idx);
    return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
}

namespace {
// Resets the statement on scope exit so a throw never leaves it mid-step.
struct StmtReset {
    sqlite3_stmt* st;
    explicit StmtReset(sqlite3_stmt* s) : st(s) { sqlite3_reset(st); sqlite3_clear_bindings(st); }
    ~StmtReset() { sqlite3_reset(st); }
};

struct Transaction {
    sqlite3* db;
    bool done{false};
    explicit Transaction(sqlite3* d) : db(d) {
        if (sqlite3_exec(db, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            throw RetrievalError(std::string("begin transaction failed: ") + sqlite3_errmsg(db));
        }
    }
    void commit() {
        if (sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            throw RetrievalError(std::string("commit failed: ") + sqlite3_errmsg(db));
        }
        done = true;
    }
    ~Transaction() {
        if (!done) sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
};
}

SqliteVectorIndex::SqliteVectorIndex(const std::string& db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw RetrievalError("Failed to open SQLite DB: " + db_path + ": " + msg);
    }
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    log_debug("sqlite vector index opened at " + db_path);
}

SqliteVectorIndex::~SqliteVectorIndex() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SqliteVectorIndex::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS collections (\n"
         "  name TEXT PRIMARY KEY,\n"
         "  dim INTEGER NOT NULL,\n"
         "  distance TEXT NOT NULL\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS points (\n"
         "  collection TEXT NOT NULL,\n"
         "  id TEXT NOT NULL,\n"
         "  text TEXT,\n"
         "  metadata TEXT,\n"
         "  vector BLOB,\n"
         "  PRIMARY KEY (collection, id)\n"
         ");");
}

void SqliteVectorIndex::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw RetrievalError("SQLite error: " + msg);
    }
}

void SqliteVectorIndex::prepare_statements() {
    struct { const char* sql; sqlite3_stmt** out; } stmts[] = {
        {"INSERT OR REPLACE INTO points (collection, id, text, metadata, vector) VALUES (?, ?, ?, ?, ?);",
         &insert_stmt_},
        {"DELETE FROM points WHERE collection = ? AND id = ?;", &delete_stmt_},
        {"SELECT id, text, metadata, vector FROM points WHERE collection = ? ORDER BY id;", &all_stmt_},
        {"SELECT id, text, metadata, vector FROM points WHERE collection = ? AND id = ?;", &one_stmt_},
        {"SELECT dim, distance FROM collections WHERE name = ?;", &collection_stmt_},
    };
    for (auto& s : stmts) {
        if (sqlite3_prepare_v2(db_, s.sql, -1, s.out, nullptr) != SQLITE_OK) {
            throw RetrievalError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
    }
}

void SqliteVectorIndex::close_statements() {
    for (sqlite3_stmt** st : {&insert_stmt_, &delete_stmt_, &all_stmt_, &one_stmt_, &collection_stmt_}) {
        if (*st) { sqlite3_finalize(*st); *st = nullptr; }
    }
}

std::optional<CollectionConfig> SqliteVectorIndex::find_collection(const std::string& collection) {
    StmtReset guard(collection_stmt_);
    bind_text(collection_stmt_, 1, collection);
    int rc = sqlite3_step(collection_stmt_);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw RetrievalError(std::string("collection lookup failed: ") + sqlite3_errmsg(db_));
    CollectionConfig c;
    c.name = collection;
    c.dim = (size_t)sqlite3_column_int64(collection_stmt_, 0);
    c.distance = parse_distance_metric(column_text(collection_stmt_, 1));
    return c;
}

CollectionConfig SqliteVectorIndex::require_collection(const std::string& collection) {
    auto c = find_collection(collection);
    if (!c) throw CollectionNotFound(collection);
    return *c;
}

IndexedVector SqliteVectorIndex::read_row(sqlite3_stmt* st) {
    IndexedVector p;
    p.id = column_text(st, 0);
    p.text = column_text(st, 1);
    std::string meta = column_text(st, 2);
    p.metadata = meta.empty() ? Metadata::object() : json::parse(meta);
    const void* blob = sqlite3_column_blob(st, 3);
    int bytes = sqlite3_column_bytes(st, 3);
    p.vector.resize(bytes / (int)sizeof(float));
    if (bytes > 0) std::memcpy(p.vector.data(), blob, p.vector.size() * sizeof(float));
    return p;
}

void SqliteVectorIndex::create_collection(const CollectionConfig& config, bool recreate) {
    if (config.name.empty()) throw RetrievalError("collection name must not be empty");
    if (config.dim == 0) throw RetrievalError("collection dimension must be > 0");
    std::lock_guard<std::mutex> lock(mtx_);
    auto existing = find_collection(config.name);
    if (existing && !recreate) {
        if (existing->dim != config.dim) {
            throw DimensionMismatch(existing->dim, config.dim, "collection " + config.name);
        }
        return;
    }
    Transaction tx(db_);
    if (existing) {
        sqlite3_stmt* st = nullptr;
        if (sqlite3_prepare_v2(db_, "DELETE FROM points WHERE collection = ?;", -1, &st, nullptr) != SQLITE_OK) {
            throw RetrievalError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
        bind_text(st, 1, config.name);
        int rc = sqlite3_step(st);
        sqlite3_finalize(st);
        if (rc != SQLITE_DONE) throw RetrievalError("dropping points of " + config.name + " failed");
    }
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db_, "INSERT OR REPLACE INTO collections (name, dim, distance) VALUES (?, ?, ?);",
                           -1, &st, nullptr) != SQLITE_OK) {
        throw RetrievalError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
    }
    bind_text(st, 1, config.name);
    sqlite3_bind_int64(st, 2, (sqlite3_int64)config.dim);
    bind_text(st, 3, to_string(config.distance));
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) throw RetrievalError("create collection " + config.name + " failed");
    tx.commit();
    log_info((existing ? "recreated collection " : "created collection ") + config.name + " (dim " +
             std::to_string(config.dim) + ", " + to_string(config.distance) + ")");
}

void SqliteVectorIndex::drop_collection(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);
    for (const char* sql : {"DELETE FROM points WHERE collection = ?;", "DELETE FROM collections WHERE name = ?;"}) {
        sqlite3_stmt* st = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &st, nullptr) != SQLITE_OK) {
            throw RetrievalError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
        bind_text(st, 1, collection);
        int rc = sqlite3_step(st);
        sqlite3_finalize(st);
        if (rc != SQLITE_DONE) throw RetrievalError("drop collection " + collection + " failed");
    }
    tx.commit();
}

bool SqliteVectorIndex::has_collection(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mtx_);
    return find_collection(collection).has_value();
}

void SqliteVectorIndex::upsert(const std::string& collection, const std::vector<IndexedVector>& points) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto c = require_collection(collection);
    for (auto& p : points) {
        if (p.vector.size() != c.dim) throw DimensionMismatch(c.dim, p.vector.size(), "upsert " + p.id);
    }
    if (points.empty()) return;
    Transaction tx(db_);
    for (auto& p : points) {
        StmtReset guard(insert_stmt_);
        bind_text(insert_stmt_, 1, collection);
        bind_text(insert_stmt_, 2, p.id);
        bind_text(insert_stmt_, 3, p.text);
        bind_text(insert_stmt_, 4, p.metadata.dump());
        bind_blob(insert_stmt_, 5, p.vector);
        if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
            throw RetrievalError("insert point " + p.id + " failed: " + sqlite3_errmsg(db_));
        }
    }
    tx.commit();
}

std::vector<IndexedVector> SqliteVectorIndex::search(const std::string& collection, const std::vector<float>& query,
                                                     std::size_t k, const Filter& filter,
                                                     std::optional<float> score_threshold) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto c = require_collection(collection);
    if (query.size() != c.dim) throw DimensionMismatch(c.dim, query.size(), "search " + collection);
    std::vector<IndexedVector> out;
    if (k == 0) return out;
    {
        StmtReset guard(all_stmt_);
        bind_text(all_stmt_, 1, collection);
        int rc;
        while ((rc = sqlite3_step(all_stmt_)) == SQLITE_ROW) {
            auto p = read_row(all_stmt_);
            if (!matches_filter(p.metadata, filter)) continue;
            float score = similarity(c.distance, p.vector, query);
            if (score_threshold && score < *score_threshold) continue;
            p.score = score;
            out.push_back(std::move(p));
        }
        if (rc != SQLITE_DONE) throw RetrievalError(std::string("search failed: ") + sqlite3_errmsg(db_));
    }
    auto by_score = [](const IndexedVector& a, const IndexedVector& b) {
        if (*a.score != *b.score) return *a.score > *b.score;
        return a.id < b.id;
    };
    size_t n = std::min(k, out.size());
    std::partial_sort(out.begin(), out.begin() + n, out.end(), by_score);
    out.resize(n);
    return out;
}

std::vector<IndexedVector> SqliteVectorIndex::fetch(const std::string& collection,
                                                    const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mtx_);
    require_collection(collection);
    std::vector<IndexedVector> out;
    for (auto& id : ids) {
        StmtReset guard(one_stmt_);
        bind_text(one_stmt_, 1, collection);
        bind_text(one_stmt_, 2, id);
        int rc = sqlite3_step(one_stmt_);
        if (rc == SQLITE_ROW) {
            out.push_back(read_row(one_stmt_));
        } else if (rc != SQLITE_DONE) {
            throw RetrievalError(std::string("fetch failed: ") + sqlite3_errmsg(db_));
        }
    }
    return out;
}

void SqliteVectorIndex::remove(const std::string& collection, const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mtx_);
    require_collection(collection);
    if (ids.empty()) return;
    Transaction tx(db_);
    for (auto& id : ids) {
        StmtReset guard(delete_stmt_);
        bind_text(delete_stmt_, 1, collection);
        bind_text(delete_stmt_, 2, id);
        if (sqlite3_step(delete_stmt_) != SQLITE_DONE) {
            throw RetrievalError("delete point " + id + " failed: " + sqlite3_errmsg(db_));
        }
    }
    tx.commit();
}

std::vector<IndexedVector> SqliteVectorIndex::scroll(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mtx_);
    require_collection(collection);
    std::vector<IndexedVector> out;
    StmtReset guard(all_stmt_);
    bind_text(all_stmt_, 1, collection);
    int rc;
    while ((rc = sqlite3_step(all_stmt_)) == SQLITE_ROW) out.push_back(read_row(all_stmt_));
    if (rc != SQLITE_DONE) throw RetrievalError(std::string("scroll failed: ") + sqlite3_errmsg(db_));
    return out;
}

CollectionStats SqliteVectorIndex::collection_stats(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto c = require_collection(collection);
    CollectionStats s;
    s.name = c.name;
    s.dim = c.dim;
    s.distance = c.distance;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM points WHERE collection = ?;", -1, &st, nullptr) != SQLITE_OK) {
        throw RetrievalError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
    }
    bind_text(st, 1, collection);
    if (sqlite3_step(st) == SQLITE_ROW) s.point_count = (size_t)sqlite3_column_int64(st, 0);
    sqlite3_finalize(st);
    return s;
}

bool SqliteVectorIndex::healthy() {
    std::lock_guard<std::mutex> lock(mtx_);
    return db_ && sqlite3_exec(db_, "SELECT 1;", nullptr, nullptr, nullptr) == SQLITE_OK;
}

} // namespace ragcore
