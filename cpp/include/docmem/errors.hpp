#pragma once

#include "docmem/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace docmem {

class DocMemError : public std::runtime_error {
 public:
  DocMemError(ErrorKind kind, const std::string& message, std::vector<std::string> doc_ids = {});

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::vector<std::string>& doc_ids() const noexcept { return doc_ids_; }

 private:
  ErrorKind kind_;
  std::vector<std::string> doc_ids_;
};

// Rejected before any side effect.
class ValidationError : public DocMemError {
 public:
  explicit ValidationError(const std::string& message, std::vector<std::string> doc_ids = {});

 protected:
  ValidationError(ErrorKind kind, const std::string& message, std::vector<std::string> doc_ids);
};

class ChunkingError final : public ValidationError {
 public:
  explicit ChunkingError(const std::string& message);
};

class ExtractionError final : public ValidationError {
 public:
  explicit ExtractionError(const std::string& message);
};

class EmbeddingError : public DocMemError {
 public:
  explicit EmbeddingError(const std::string& message, std::vector<std::string> doc_ids = {});

 protected:
  EmbeddingError(ErrorKind kind, const std::string& message, std::vector<std::string> doc_ids);
};

class RetrievalUnavailable final : public EmbeddingError {
 public:
  explicit RetrievalUnavailable(const std::string& message);
};

class IndexOperationError final : public DocMemError {
 public:
  explicit IndexOperationError(const std::string& message, std::vector<std::string> doc_ids = {});
};

class IndexCorrupted final : public DocMemError {
 public:
  IndexCorrupted(const std::string& message,
                 bool restored = false,
                 std::optional<std::string> snapshot_id = std::nullopt);

  [[nodiscard]] bool restored() const noexcept { return restored_; }
  [[nodiscard]] const std::optional<std::string>& snapshot_id() const noexcept { return snapshot_id_; }

 private:
  bool restored_ = false;
  std::optional<std::string> snapshot_id_;
};

class SnapshotError final : public DocMemError {
 public:
  explicit SnapshotError(const std::string& message);
};

class RegistryError final : public DocMemError {
 public:
  explicit RegistryError(const std::string& message, std::vector<std::string> doc_ids = {});
};

}  // namespace docmem
