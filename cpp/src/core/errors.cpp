#include "docmem/errors.hpp"

#include <utility>

namespace docmem {

DocMemError::DocMemError(ErrorKind kind, const std::string& message, std::vector<std::string> doc_ids)
    : std::runtime_error(message), kind_(kind), doc_ids_(std::move(doc_ids)) {}

ValidationError::ValidationError(const std::string& message, std::vector<std::string> doc_ids)
    : DocMemError(ErrorKind::kValidation, message, std::move(doc_ids)) {}

ValidationError::ValidationError(ErrorKind kind, const std::string& message, std::vector<std::string> doc_ids)
    : DocMemError(kind, message, std::move(doc_ids)) {}

ChunkingError::ChunkingError(const std::string& message)
    : ValidationError(ErrorKind::kChunking, message, {}) {}

ExtractionError::ExtractionError(const std::string& message)
    : ValidationError(ErrorKind::kExtraction, message, {}) {}

EmbeddingError::EmbeddingError(const std::string& message, std::vector<std::string> doc_ids)
    : DocMemError(ErrorKind::kEmbedding, message, std::move(doc_ids)) {}

EmbeddingError::EmbeddingError(ErrorKind kind, const std::string& message, std::vector<std::string> doc_ids)
    : DocMemError(kind, message, std::move(doc_ids)) {}

RetrievalUnavailable::RetrievalUnavailable(const std::string& message)
    : EmbeddingError(ErrorKind::kRetrievalUnavailable, message, {}) {}

IndexOperationError::IndexOperationError(const std::string& message, std::vector<std::string> doc_ids)
    : DocMemError(ErrorKind::kIndexOperation, message, std::move(doc_ids)) {}

IndexCorrupted::IndexCorrupted(const std::string& message, bool restored, std::optional<std::string> snapshot_id)
    : DocMemError(ErrorKind::kIndexCorrupted, message),
      restored_(restored),
      snapshot_id_(std::move(snapshot_id)) {}

SnapshotError::SnapshotError(const std::string& message)
    : DocMemError(ErrorKind::kSnapshot, message) {}

RegistryError::RegistryError(const std::string& message, std::vector<std::string> doc_ids)
    : DocMemError(ErrorKind::kRegistry, message, std::move(doc_ids)) {}

}  // namespace docmem
