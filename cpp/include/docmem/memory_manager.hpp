#pragma once

#include "docmem/backup_store.hpp"
#include "docmem/chunker.hpp"
#include "docmem/document_registry.hpp"
#include "docmem/embeddings.hpp"
#include "docmem/index_backend.hpp"
#include "docmem/text_extractor.hpp"
#include "docmem/types.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace docmem {

// Owns one index backend and the document registry under config.data_dir and
// keeps them consistent across ingest, removal, wipes and restores.
//
// Writers (Ingest, RemoveDocuments, ClearAll, ReplaceAll, RestoreBackup,
// CreateBackup) are serialized. Queries, HealthCheck and the listing calls run
// concurrently with each other and never see a half-applied mutation. Ingest
// embeds before taking exclusive access, so queries keep running meanwhile.
class MemoryManager {
 public:
  // Opens or creates the store. Corruption found on open triggers a restore of
  // the newest usable snapshot (see LastRecovery()); throws IndexCorrupted when
  // none can be restored. A null extractor installs PlainTextExtractor.
  MemoryManager(ManagerConfig config,
                std::shared_ptr<EmbeddingProvider> embedder,
                std::shared_ptr<TextExtractor> extractor = nullptr);
  ~MemoryManager();

  MemoryManager(const MemoryManager&) = delete;
  MemoryManager& operator=(const MemoryManager&) = delete;

  // Returns kDuplicateRejected without embedding when the normalized content is
  // already stored. Throws ValidationError (including ChunkingError and
  // ExtractionError), EmbeddingError, IndexOperationError or RegistryError; on
  // any throw nothing is left behind in the index or the registry.
  IngestOutcome Ingest(const FileUpload& upload);

  // top_k defaults to config().default_top_k. Throws ValidationError for empty
  // text or top_k <= 0, RetrievalUnavailable when embedding fails twice.
  [[nodiscard]] std::vector<QueryHit> Query(const std::string& text, std::optional<int> top_k = std::nullopt);

  // Takes a "pre-remove" snapshot first. Documents whose chunks could not all be
  // deleted stay registered and are reported in failed.
  RemoveReport RemoveDocuments(const std::vector<std::string>& doc_ids);

  // Snapshots ("clear-all"), then wipes index and registry. Returns the snapshot id.
  std::string ClearAll();

  // Snapshots ("replace-all"), wipes, then ingests files in order. A failing
  // file is reported and the rest continue; files committed before a failure or
  // a stop request stay committed.
  ReplaceReport ReplaceAll(const std::vector<FileUpload>& files, std::stop_token stop = {});

  // One result per probe: passed when the best hit scores >= health_threshold.
  [[nodiscard]] std::vector<ProbeResult> HealthCheck(const std::vector<std::string>& probes);

  // An empty label becomes "backup-<ts>". Returns the snapshot id.
  std::string CreateBackup(const std::string& label);
  // Accepts a snapshot id or a label (newest snapshot with that label). Throws
  // SnapshotError and keeps the live state when the restore cannot complete.
  SnapshotManifest RestoreBackup(const std::string& snapshot_id_or_label);
  [[nodiscard]] std::vector<SnapshotManifest> ListBackups() const;

  [[nodiscard]] std::vector<DocumentEntry> ListDocuments(const DocumentFilter& filter = {}) const;
  [[nodiscard]] StoreStats Stats() const;
  [[nodiscard]] IntegrityReport Verify() const;
  [[nodiscard]] const RecoveryReport& LastRecovery() const { return last_recovery_; }
  [[nodiscard]] const ManagerConfig& config() const { return config_; }

 private:
  struct PreparedDocument {
    std::string filename;
    FileType file_type = FileType::kTxt;
    std::uint64_t byte_size = 0;
    Fingerprint fingerprint{};
    Metadata source_metadata;
    std::vector<TextWindow> windows;
  };

  enum class EmbedPurpose {
    kIngest,
    kQuery,
  };

  void OpenState();
  void RecoverFromSnapshots(const std::string& failure);
  void RepairOrphans(const IntegrityReport& report);

  [[nodiscard]] PreparedDocument Prepare(const FileUpload& upload) const;
  [[nodiscard]] std::vector<std::vector<float>> EmbedWithRetry(const std::vector<std::string>& texts,
                                                               EmbedPurpose purpose);
  [[nodiscard]] IngestOutcome DuplicateOutcome(const PreparedDocument& doc, const std::string& existing) const;
  // Requires exclusive state access.
  IngestOutcome CommitLocked(const PreparedDocument& doc, std::vector<std::vector<float>> vectors);
  void PersistRegistryLocked();
  std::string SnapshotLocked(const std::string& label);
  void WipeLocked(const std::string& snapshot_id);
  [[nodiscard]] IntegrityReport VerifyLocked() const;
  [[nodiscard]] std::vector<QueryHit> AttachMetadataLocked(const std::vector<ScoredChunk>& scored) const;

  ManagerConfig config_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<TextExtractor> extractor_;
  Chunker chunker_;
  std::filesystem::path registry_path_;
  std::unique_ptr<BackupStore> backups_;
  std::unique_ptr<IndexBackend> index_;
  DocumentRegistry registry_;
  RecoveryReport last_recovery_{};

  std::mutex writer_mutex_{};
  mutable std::shared_mutex state_mutex_{};
};

}  // namespace docmem
