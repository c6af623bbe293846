#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace docmem {

using Metadata = std::unordered_map<std::string, std::string>;

// SHA-256 of normalized document content.
using Fingerprint = std::array<std::byte, 32>;

enum class FileType : std::uint8_t {
  kPdf = 1,
  kTxt = 2,
  kDocx = 3,
};

enum class BackendKind : std::uint8_t {
  kFlat = 1,
  kDocument = 2,
};

enum class ErrorKind : std::uint8_t {
  kValidation,
  kChunking,
  kExtraction,
  kNotFound,
  kEmbedding,
  kRetrievalUnavailable,
  kIndexOperation,
  kIndexCorrupted,
  kSnapshot,
  kRegistry,
};

struct Chunk {
  std::string id;
  std::string text;
  std::vector<float> vector;
  std::string source_doc_id;
  std::uint64_t offset_start = 0;
  std::uint64_t offset_end = 0;
};

struct ScoredChunk {
  Chunk chunk;
  float score = 0.0F;
};

struct DocumentEntry {
  std::string doc_id;
  std::string original_filename;
  Fingerprint fingerprint{};
  FileType file_type = FileType::kTxt;
  std::vector<std::string> chunk_ids;
  std::int64_t ingested_at_ms = 0;
  std::uint64_t byte_size = 0;
  Metadata source_metadata;
};

enum class IngestStatus {
  kCommitted,
  kDuplicateRejected,
};

struct IngestOutcome {
  IngestStatus status = IngestStatus::kCommitted;
  std::string filename;
  std::string doc_id;
  std::size_t chunk_count = 0;
  std::optional<std::string> duplicate_of;
};

struct QueryHit {
  std::string chunk_id;
  std::string chunk_text;
  float score = 0.0F;
  std::string doc_id;
  std::string filename;
  FileType file_type = FileType::kTxt;
  std::uint64_t offset_start = 0;
  std::uint64_t offset_end = 0;
  std::size_t chunk_ordinal = 0;
  std::size_t total_chunks = 0;
  std::size_t approx_tokens = 0;
};

struct FileUpload {
  std::string filename;
  std::vector<std::byte> bytes;
  std::optional<FileType> file_type;
};

struct RemoveFailure {
  std::string doc_id;
  ErrorKind kind = ErrorKind::kIndexOperation;
  std::string reason;
};

struct RemoveReport {
  std::optional<std::string> snapshot_id;
  std::vector<std::string> removed;
  std::vector<RemoveFailure> failed;
};

struct IngestedFile {
  std::string filename;
  std::string doc_id;
  std::size_t chunk_count = 0;
};

struct FailedFile {
  std::string filename;
  ErrorKind kind = ErrorKind::kValidation;
  std::string message;
};

struct ReplaceReport {
  std::string snapshot_id;
  std::vector<IngestedFile> ingested;
  std::vector<FailedFile> failed;
  std::vector<std::string> duplicates;
  std::vector<std::string> skipped;
  bool cancelled = false;
};

struct DocumentFilter {
  std::optional<FileType> file_type;
  std::optional<std::string> filename_contains;
};

struct StoreStats {
  std::size_t doc_count = 0;
  std::size_t chunk_count = 0;
  BackendKind backend_type = BackendKind::kFlat;
  std::uint64_t storage_bytes = 0;
};

struct ProbeResult {
  std::string probe;
  bool passed = false;
  float best_score = 0.0F;
  std::optional<std::string> matched_filename;
};

struct SnapshotManifest {
  std::string id;
  std::string label;
  std::int64_t created_at_ms = 0;
  BackendKind backend = BackendKind::kFlat;
  int dimensions = 0;
  std::uint64_t doc_count = 0;
  std::uint64_t chunk_count = 0;
  Fingerprint index_sha256{};
  Fingerprint registry_sha256{};
};

struct IntegrityReport {
  std::size_t doc_count = 0;
  std::size_t chunk_count = 0;
  std::vector<std::string> missing_chunk_ids;
  std::vector<std::string> orphan_chunk_ids;

  [[nodiscard]] bool ok() const { return missing_chunk_ids.empty() && orphan_chunk_ids.empty(); }
};

struct RecoveryReport {
  bool corruption_detected = false;
  bool restored = false;
  std::optional<std::string> snapshot_id;
  std::string detail;
  std::size_t orphan_chunks_removed = 0;
};

struct ChunkingConfig {
  std::size_t chunk_size = 1000;
  std::size_t chunk_overlap = 200;
};

struct BackupConfig {
  std::size_t retention_count = 10;
  // Zero disables the age cap.
  std::chrono::hours max_age{0};
};

struct ManagerConfig {
  std::filesystem::path data_dir = "./data/docmem";
  BackendKind backend = BackendKind::kFlat;
  ChunkingConfig chunking{};
  BackupConfig backup{};
  int default_top_k = 4;
  int health_top_k = 1;
  float health_threshold = 0.75F;
  int embed_batch_size = 32;
  std::chrono::milliseconds embed_retry_backoff{200};
  std::string log_level = "info";
};

[[nodiscard]] std::string_view ToString(FileType type);
[[nodiscard]] std::string_view ToString(BackendKind kind);
[[nodiscard]] std::string_view ToString(ErrorKind kind);
[[nodiscard]] std::optional<FileType> FileTypeFromFilename(std::string_view filename);
[[nodiscard]] std::optional<FileType> FileTypeFromMimeType(std::string_view mime_type);
[[nodiscard]] std::optional<BackendKind> ParseBackendKind(std::string_view name);

[[nodiscard]] std::int64_t NowMillis();
// "yyyymmddThhmmssZ" in UTC.
[[nodiscard]] std::string UtcTimestamp(std::int64_t millis);
[[nodiscard]] std::size_t EstimateTokens(std::string_view text);

}  // namespace docmem
