#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace ragcore {

struct RetrievalError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Embedding provider, vector index engine or reranker could not be reached
// or answered with something unusable.
struct ProviderUnavailable : RetrievalError {
    using RetrievalError::RetrievalError;
};

struct CollectionNotFound : RetrievalError {
    explicit CollectionNotFound(const std::string& name)
        : RetrievalError("collection not found: " + name), name_(name) {}
    const std::string& name() const { return name_; }

private:
    std::string name_;
};

struct DimensionMismatch : RetrievalError {
    DimensionMismatch(std::size_t expected, std::size_t actual, const std::string& where)
        : RetrievalError(where + ": expected dimension " + std::to_string(expected) +
                         ", got " + std::to_string(actual)),
          expected_(expected), actual_(actual) {}
    std::size_t expected() const { return expected_; }
    std::size_t actual() const { return actual_; }

private:
    std::size_t expected_{0};
    std::size_t actual_{0};
};

struct IngestError : RetrievalError {
    IngestError(const std::string& document_id, const std::string& reason)
        : RetrievalError("ingest of " + document_id + " failed: " + reason), document_id_(document_id) {}
    const std::string& document_id() const { return document_id_; }

private:
    std::string document_id_;
};

struct ConfigError : RetrievalError {
    using RetrievalError::RetrievalError;
};

} // namespace ragcore
