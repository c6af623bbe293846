#include "docmem/memory_manager.hpp"

#include "../core/file_io.hpp"
#include "docmem/config.hpp"
#include "docmem/errors.hpp"
#include "docmem/fingerprint.hpp"
#include "docmem/log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <optional>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace docmem {
namespace {

constexpr char kRegistryFile[] = "registry.bin";
constexpr char kSnapshotDir[] = "snapshots";

ManagerConfig CheckedConfig(ManagerConfig config) {
  ValidateConfig(config);
  return config;
}

bool IsBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isspace(ch) != 0; });
}

std::vector<std::string> TextsOf(const std::vector<TextWindow>& windows) {
  std::vector<std::string> texts{};
  texts.reserve(windows.size());
  for (const auto& window : windows) {
    texts.push_back(window.text);
  }
  return texts;
}

std::string ImplicitLabel(const char* prefix) {
  return std::string(prefix) + "-" + UtcTimestamp(NowMillis());
}

// Moves a damaged file or directory aside so a fresh one can be created.
// Renames a damaged file or directory aside. Returns the new path, or nothing
// when `path` does not exist.
std::optional<std::filesystem::path> Quarantine(const std::filesystem::path& path, const std::string& stamp) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  auto target = path;
  target += ".corrupt-" + stamp;
  std::filesystem::rename(path, target, ec);
  if (ec) {
    throw IndexCorrupted("cannot move aside " + path.string() + ": " + ec.message());
  }
  log::Logger()->warn("moved damaged {} to {}", path.string(), target.string());
  return target;
}

// Puts a quarantined path back so the next open detects the same damage.
void Unquarantine(const std::filesystem::path& path, const std::optional<std::filesystem::path>& moved) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec) {
    log::Logger()->error("cannot clear {} before putting the damaged copy back: {}", path.string(), ec.message());
    return;
  }
  if (!moved.has_value()) {
    return;
  }
  std::filesystem::rename(*moved, path, ec);
  if (ec) {
    log::Logger()->error("cannot move {} back to {}: {}", moved->string(), path.string(), ec.message());
  }
}

}  // namespace

MemoryManager::MemoryManager(ManagerConfig config,
                             std::shared_ptr<EmbeddingProvider> embedder,
                             std::shared_ptr<TextExtractor> extractor)
    : config_(CheckedConfig(std::move(config))),
      embedder_(std::move(embedder)),
      extractor_(extractor != nullptr ? std::move(extractor) : std::make_shared<PlainTextExtractor>()),
      chunker_(config_.chunking),
      registry_path_(config_.data_dir / kRegistryFile) {
  if (embedder_ == nullptr) {
    throw ValidationError("an embedding provider is required");
  }
  if (embedder_->dimensions() <= 0) {
    throw ValidationError("embedding provider reports non-positive dimensions");
  }
  (void)log::SetLevel(config_.log_level);

  std::error_code ec;
  std::filesystem::create_directories(config_.data_dir, ec);
  if (ec) {
    throw IndexOperationError("cannot create data directory " + config_.data_dir.string() + ": " + ec.message());
  }
  backups_ = std::make_unique<BackupStore>(config_.data_dir / kSnapshotDir, config_.backup);
  OpenState();
}

MemoryManager::~MemoryManager() = default;

void MemoryManager::OpenState() {
  std::string failure{};
  try {
    index_ = OpenIndexBackend(config_.backend, embedder_->dimensions(), config_.data_dir);
    registry_ = DocumentRegistry::Load(registry_path_);
    const auto report = VerifyLocked();
    if (!report.missing_chunk_ids.empty()) {
      throw IndexCorrupted(std::to_string(report.missing_chunk_ids.size()) +
                           " chunks referenced by the registry are missing from the index, first " +
                           report.missing_chunk_ids.front());
    }
    RepairOrphans(report);
    log::Logger()->info("opened {} store at {}: {} documents, {} chunks",
                        ToString(config_.backend), config_.data_dir.string(), registry_.size(), index_->ChunkCount());
    return;
  } catch (const IndexCorrupted& ex) {
    failure = ex.what();
  } catch (const RegistryError& ex) {
    failure = ex.what();
  }
  RecoverFromSnapshots(failure);
}

void MemoryManager::RecoverFromSnapshots(const std::string& failure) {
  last_recovery_.corruption_detected = true;
  last_recovery_.detail = failure;
  log::Logger()->error("corruption detected in {}: {}", config_.data_dir.string(), failure);

  index_.reset();
  const auto stamp = UtcTimestamp(NowMillis());
  const auto index_path = IndexStoragePath(config_.backend, config_.data_dir);
  const auto moved_index = Quarantine(index_path, stamp);
  const auto moved_registry = Quarantine(registry_path_, stamp);
  index_ = OpenIndexBackend(config_.backend, embedder_->dimensions(), config_.data_dir);
  registry_ = DocumentRegistry{};

  for (const auto& manifest : backups_->List()) {
    if (manifest.backend != config_.backend || manifest.dimensions != embedder_->dimensions()) {
      continue;
    }
    try {
      (void)backups_->Restore(manifest.id, *index_, registry_);
      PersistRegistryLocked();
      last_recovery_.restored = true;
      last_recovery_.snapshot_id = manifest.id;
      log::Logger()->info("recovered from snapshot {}: {} documents, {} chunks",
                          manifest.id, registry_.size(), index_->ChunkCount());
      return;
    } catch (const DocMemError& ex) {
      log::Logger()->warn("snapshot {} unusable for recovery: {}", manifest.id, ex.what());
      registry_ = DocumentRegistry{};
      index_->Clear();
    }
  }
  log::Logger()->error("no usable snapshot in {}; store is unrecoverable", backups_->root().string());
  index_.reset();
  registry_ = DocumentRegistry{};
  Unquarantine(index_path, moved_index);
  Unquarantine(registry_path_, moved_registry);
  throw IndexCorrupted("unrecoverable store at " + config_.data_dir.string() + ": " + failure, false);
}

void MemoryManager::RepairOrphans(const IntegrityReport& report) {
  if (report.orphan_chunk_ids.empty()) {
    return;
  }
  const auto result = index_->Delete(report.orphan_chunk_ids);
  last_recovery_.orphan_chunks_removed = result.deleted.size();
  log::Logger()->warn("removed {} orphan chunks left by an interrupted ingest", result.deleted.size());
  if (!result.failed.empty()) {
    log::Logger()->warn("{} orphan chunks could not be removed: {}", result.failed.size(), result.failed.front().reason);
  }
}

MemoryManager::PreparedDocument MemoryManager::Prepare(const FileUpload& upload) const {
  if (upload.filename.empty()) {
    throw ValidationError("filename must be non-empty");
  }
  if (upload.bytes.empty()) {
    throw ValidationError("file '" + upload.filename + "' is empty");
  }
  const auto type = upload.file_type.has_value() ? upload.file_type : FileTypeFromFilename(upload.filename);
  if (!type.has_value()) {
    throw ValidationError("unsupported file type: '" + upload.filename + "'");
  }

  ExtractedText extracted{};
  try {
    extracted = extractor_->Extract(upload.bytes, *type, upload.filename);
  } catch (const DocMemError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ExtractionError("extracting '" + upload.filename + "' failed: " + ex.what());
  }

  PreparedDocument doc{};
  doc.filename = upload.filename;
  doc.file_type = *type;
  doc.byte_size = upload.bytes.size();
  doc.source_metadata = std::move(extracted.source_metadata);
  try {
    doc.windows = chunker_.Split(extracted.text).Collect();
  } catch (const ChunkingError& ex) {
    throw ChunkingError("'" + upload.filename + "': " + ex.what());
  }
  doc.fingerprint = ComputeFingerprint(extracted.text);
  return doc;
}

std::vector<std::vector<float>> MemoryManager::EmbedWithRetry(const std::vector<std::string>& texts,
                                                              EmbedPurpose purpose) {
  const auto batch_size = static_cast<std::size_t>(config_.embed_batch_size);
  const auto dims = static_cast<std::size_t>(embedder_->dimensions());
  std::vector<std::vector<float>> out{};
  out.reserve(texts.size());

  for (std::size_t start = 0; start < texts.size(); start += batch_size) {
    const auto end = std::min(texts.size(), start + batch_size);
    const std::vector<std::string> slice(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                         texts.begin() + static_cast<std::ptrdiff_t>(end));
    auto attempt = [&]() {
      auto vectors = embedder_->Embed(slice);
      if (vectors.size() != slice.size()) {
        throw EmbeddingError("embedder returned " + std::to_string(vectors.size()) + " vectors for " +
                             std::to_string(slice.size()) + " texts");
      }
      for (const auto& vector : vectors) {
        if (vector.size() != dims) {
          throw EmbeddingError("embedder returned a vector of " + std::to_string(vector.size()) +
                               " dimensions, expected " + std::to_string(dims));
        }
      }
      return vectors;
    };

    std::vector<std::vector<float>> vectors{};
    try {
      vectors = attempt();
    } catch (const std::exception& first) {
      log::Logger()->warn("embedding failed, retrying in {} ms: {}", config_.embed_retry_backoff.count(), first.what());
      std::this_thread::sleep_for(config_.embed_retry_backoff);
      try {
        vectors = attempt();
      } catch (const std::exception& second) {
        const auto message = std::string("embedding failed after retry: ") + second.what();
        if (purpose == EmbedPurpose::kQuery) {
          throw RetrievalUnavailable(message);
        }
        throw EmbeddingError(message);
      }
    }
    out.insert(out.end(), std::make_move_iterator(vectors.begin()), std::make_move_iterator(vectors.end()));
  }
  return out;
}

IngestOutcome MemoryManager::DuplicateOutcome(const PreparedDocument& doc, const std::string& existing) const {
  log::Logger()->info("ingest '{}': duplicate of {}, rejected", doc.filename, existing);
  return IngestOutcome{
      .status = IngestStatus::kDuplicateRejected,
      .filename = doc.filename,
      .doc_id = {},
      .chunk_count = 0,
      .duplicate_of = existing,
  };
}

IngestOutcome MemoryManager::CommitLocked(const PreparedDocument& doc, std::vector<std::vector<float>> vectors) {
  const auto doc_id = registry_.AllocateDocId(doc.fingerprint);
  std::vector<Chunk> chunks{};
  std::vector<std::string> chunk_ids{};
  chunks.reserve(doc.windows.size());
  chunk_ids.reserve(doc.windows.size());
  for (std::size_t i = 0; i < doc.windows.size(); ++i) {
    const auto& window = doc.windows[i];
    chunk_ids.push_back(doc_id + "#" + std::to_string(i));
    chunks.push_back(Chunk{
        .id = chunk_ids.back(),
        .text = window.text,
        .vector = std::move(vectors[i]),
        .source_doc_id = doc_id,
        .offset_start = window.start,
        .offset_end = window.end,
    });
  }

  try {
    index_->Add(chunks);
  } catch (const DocMemError& ex) {
    registry_.RollbackStaged();
    log::Logger()->error("ingest '{}': index add failed: {}", doc.filename, ex.what());
    throw;
  }

  DocumentEntry entry{};
  entry.doc_id = doc_id;
  entry.original_filename = doc.filename;
  entry.fingerprint = doc.fingerprint;
  entry.file_type = doc.file_type;
  entry.chunk_ids = chunk_ids;
  entry.ingested_at_ms = NowMillis();
  entry.byte_size = doc.byte_size;
  entry.source_metadata = doc.source_metadata;
  try {
    registry_.StageRecord(std::move(entry));
    PersistRegistryLocked();
  } catch (const RegistryError& ex) {
    registry_.RollbackStaged();
    log::Logger()->error("ingest '{}': registry update failed, removing {} chunks: {}",
                         doc.filename, chunk_ids.size(), ex.what());
    const auto undo = index_->Delete(chunk_ids);
    if (!undo.failed.empty()) {
      log::Logger()->error("ingest '{}': {} chunks could not be removed and will be repaired on next open",
                           doc.filename, undo.failed.size());
    }
    throw;
  }

  log::Logger()->info("ingest '{}': committed {} with {} chunks", doc.filename, doc_id, chunk_ids.size());
  return IngestOutcome{
      .status = IngestStatus::kCommitted,
      .filename = doc.filename,
      .doc_id = doc_id,
      .chunk_count = chunk_ids.size(),
      .duplicate_of = std::nullopt,
  };
}

void MemoryManager::PersistRegistryLocked() {
  registry_.PersistStaged(registry_path_);
  registry_.CommitStaged();
}

std::string MemoryManager::SnapshotLocked(const std::string& label) {
  return backups_->Snapshot(label, *index_, registry_).id;
}

void MemoryManager::WipeLocked(const std::string& snapshot_id) {
  index_->Clear();
  registry_.StageClear();
  try {
    PersistRegistryLocked();
  } catch (const RegistryError& ex) {
    registry_.RollbackStaged();
    log::Logger()->error("wipe: registry persist failed, restoring index from {}: {}", snapshot_id, ex.what());
    try {
      index_->Restore(backups_->Load(snapshot_id).index_blob);
    } catch (const DocMemError& restore_ex) {
      log::Logger()->error("wipe: index restore from {} failed, next open will recover: {}",
                           snapshot_id, restore_ex.what());
    }
    throw;
  }
}

IngestOutcome MemoryManager::Ingest(const FileUpload& upload) {
  const auto doc = Prepare(upload);
  std::lock_guard<std::mutex> writer(writer_mutex_);
  if (const auto existing = registry_.FindByFingerprint(doc.fingerprint); existing.has_value()) {
    return DuplicateOutcome(doc, *existing);
  }
  log::Logger()->debug("ingest '{}': embedding {} chunks", doc.filename, doc.windows.size());
  auto vectors = EmbedWithRetry(TextsOf(doc.windows), EmbedPurpose::kIngest);
  std::unique_lock<std::shared_mutex> state(state_mutex_);
  return CommitLocked(doc, std::move(vectors));
}

std::vector<QueryHit> MemoryManager::Query(const std::string& text, std::optional<int> top_k) {
  if (IsBlank(text)) {
    throw ValidationError("query text must be non-empty");
  }
  const int k = top_k.value_or(config_.default_top_k);
  if (k <= 0) {
    throw ValidationError("top_k must be positive");
  }
  {
    std::shared_lock<std::shared_mutex> state(state_mutex_);
    if (index_->ChunkCount() == 0) {
      return {};
    }
  }
  const auto vectors = EmbedWithRetry({text}, EmbedPurpose::kQuery);
  std::shared_lock<std::shared_mutex> state(state_mutex_);
  return AttachMetadataLocked(index_->Search(vectors.front(), k));
}

std::vector<QueryHit> MemoryManager::AttachMetadataLocked(const std::vector<ScoredChunk>& scored) const {
  std::vector<QueryHit> hits{};
  hits.reserve(scored.size());
  for (const auto& item : scored) {
    const auto& chunk = item.chunk;
    const auto entry = registry_.Get(chunk.source_doc_id);
    if (!entry.has_value()) {
      log::Logger()->warn("query: chunk {} has no owning document", chunk.id);
      continue;
    }
    const auto position = std::find(entry->chunk_ids.begin(), entry->chunk_ids.end(), chunk.id);
    hits.push_back(QueryHit{
        .chunk_id = chunk.id,
        .chunk_text = chunk.text,
        .score = item.score,
        .doc_id = entry->doc_id,
        .filename = entry->original_filename,
        .file_type = entry->file_type,
        .offset_start = chunk.offset_start,
        .offset_end = chunk.offset_end,
        .chunk_ordinal = static_cast<std::size_t>(std::distance(entry->chunk_ids.begin(), position)),
        .total_chunks = entry->chunk_ids.size(),
        .approx_tokens = EstimateTokens(chunk.text),
    });
  }
  return hits;
}

RemoveReport MemoryManager::RemoveDocuments(const std::vector<std::string>& doc_ids) {
  if (doc_ids.empty()) {
    throw ValidationError("no document ids given");
  }
  std::lock_guard<std::mutex> writer(writer_mutex_);
  std::unique_lock<std::shared_mutex> state(state_mutex_);

  RemoveReport report{};
  std::vector<DocumentEntry> targets{};
  std::unordered_set<std::string> seen{};
  for (const auto& doc_id : doc_ids) {
    if (!seen.insert(doc_id).second) {
      continue;
    }
    auto entry = registry_.Get(doc_id);
    if (!entry.has_value()) {
      report.failed.push_back(RemoveFailure{.doc_id = doc_id, .kind = ErrorKind::kNotFound, .reason = "unknown document"});
      continue;
    }
    targets.push_back(std::move(*entry));
  }
  if (targets.empty()) {
    return report;
  }

  report.snapshot_id = SnapshotLocked(ImplicitLabel("pre-remove"));

  std::vector<std::string> all_chunk_ids{};
  for (const auto& entry : targets) {
    all_chunk_ids.insert(all_chunk_ids.end(), entry.chunk_ids.begin(), entry.chunk_ids.end());
  }
  const auto saved = index_->Fetch(all_chunk_ids);
  std::unordered_map<std::string, const Chunk*> saved_by_id{};
  for (const auto& chunk : saved) {
    saved_by_id.emplace(chunk.id, &chunk);
  }
  const auto result = index_->Delete(all_chunk_ids);
  std::unordered_map<std::string, std::string> failed_reason{};
  for (const auto& failure : result.failed) {
    failed_reason.emplace(failure.chunk_id, failure.reason);
  }

  // Deleted chunks whose registry change is staged, put back if the registry
  // cannot be saved.
  std::vector<Chunk> removed_chunks{};
  for (const auto& entry : targets) {
    std::vector<std::string> kept{};
    std::vector<Chunk> deleted{};
    std::string reason{};
    for (const auto& chunk_id : entry.chunk_ids) {
      const auto failed = failed_reason.find(chunk_id);
      if (failed != failed_reason.end()) {
        kept.push_back(chunk_id);
        reason = failed->second;
      } else if (const auto it = saved_by_id.find(chunk_id); it != saved_by_id.end()) {
        deleted.push_back(*it->second);
      }
    }
    if (kept.empty()) {
      (void)registry_.StageRemove(entry.doc_id);
      report.removed.push_back(entry.doc_id);
      removed_chunks.insert(removed_chunks.end(), deleted.begin(), deleted.end());
      continue;
    }

    // The registry keeps the document; put back what was already deleted.
    try {
      index_->Add(deleted);
    } catch (const DocMemError& ex) {
      log::Logger()->error("remove {}: could not re-add {} chunks, trimming entry: {}",
                           entry.doc_id, deleted.size(), ex.what());
      registry_.StageReplaceChunks(entry.doc_id, kept);
      removed_chunks.insert(removed_chunks.end(), deleted.begin(), deleted.end());
    }
    report.failed.push_back(RemoveFailure{
        .doc_id = entry.doc_id,
        .kind = ErrorKind::kIndexOperation,
        .reason = std::to_string(kept.size()) + " of " + std::to_string(entry.chunk_ids.size()) +
                  " chunks could not be deleted: " + reason,
    });
    log::Logger()->warn("remove {}: {} chunks survived: {}", entry.doc_id, kept.size(), reason);
  }

  try {
    PersistRegistryLocked();
  } catch (const RegistryError& ex) {
    registry_.RollbackStaged();
    log::Logger()->error("remove: registry persist failed, re-adding {} chunks: {}", removed_chunks.size(), ex.what());
    try {
      index_->Add(removed_chunks);
    } catch (const DocMemError& readd_ex) {
      log::Logger()->error("remove: re-add failed, next open will restore {}: {}", *report.snapshot_id, readd_ex.what());
    }
    throw;
  }
  log::Logger()->info("removed {} documents ({} failed), snapshot {}",
                      report.removed.size(), report.failed.size(), *report.snapshot_id);
  return report;
}

std::string MemoryManager::ClearAll() {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  std::unique_lock<std::shared_mutex> state(state_mutex_);
  const auto snapshot_id = SnapshotLocked(ImplicitLabel("clear-all"));
  WipeLocked(snapshot_id);
  log::Logger()->info("cleared store, snapshot {}", snapshot_id);
  return snapshot_id;
}

ReplaceReport MemoryManager::ReplaceAll(const std::vector<FileUpload>& files, std::stop_token stop) {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  std::unique_lock<std::shared_mutex> state(state_mutex_);

  ReplaceReport report{};
  report.snapshot_id = SnapshotLocked(ImplicitLabel("replace-all"));
  WipeLocked(report.snapshot_id);

  for (std::size_t i = 0; i < files.size(); ++i) {
    const auto& file = files[i];
    if (stop.stop_requested()) {
      report.cancelled = true;
      for (std::size_t j = i; j < files.size(); ++j) {
        report.skipped.push_back(files[j].filename);
      }
      log::Logger()->warn("replace: cancelled with {} files left", report.skipped.size());
      break;
    }
    try {
      const auto doc = Prepare(file);
      if (const auto existing = registry_.FindByFingerprint(doc.fingerprint); existing.has_value()) {
        (void)DuplicateOutcome(doc, *existing);
        report.duplicates.push_back(file.filename);
        continue;
      }
      auto vectors = EmbedWithRetry(TextsOf(doc.windows), EmbedPurpose::kIngest);
      const auto outcome = CommitLocked(doc, std::move(vectors));
      report.ingested.push_back(IngestedFile{
          .filename = outcome.filename,
          .doc_id = outcome.doc_id,
          .chunk_count = outcome.chunk_count,
      });
    } catch (const DocMemError& ex) {
      log::Logger()->warn("replace: '{}' failed ({}): {}", file.filename, ToString(ex.kind()), ex.what());
      report.failed.push_back(FailedFile{.filename = file.filename, .kind = ex.kind(), .message = ex.what()});
    }
  }
  log::Logger()->info("replaced store: {} ingested, {} failed, {} duplicates, snapshot {}",
                      report.ingested.size(), report.failed.size(), report.duplicates.size(), report.snapshot_id);
  return report;
}

std::vector<ProbeResult> MemoryManager::HealthCheck(const std::vector<std::string>& probes) {
  std::vector<ProbeResult> results{};
  results.reserve(probes.size());
  for (const auto& probe : probes) {
    if (IsBlank(probe)) {
      throw ValidationError("health probes must be non-empty");
    }
    results.push_back(ProbeResult{.probe = probe});
  }
  if (probes.empty()) {
    return results;
  }
  {
    std::shared_lock<std::shared_mutex> state(state_mutex_);
    if (index_->ChunkCount() == 0) {
      return results;
    }
  }

  const auto vectors = EmbedWithRetry(probes, EmbedPurpose::kQuery);
  std::shared_lock<std::shared_mutex> state(state_mutex_);
  for (std::size_t i = 0; i < probes.size(); ++i) {
    const auto hits = AttachMetadataLocked(index_->Search(vectors[i], config_.health_top_k));
    if (hits.empty()) {
      continue;
    }
    auto& result = results[i];
    result.best_score = hits.front().score;
    result.passed = hits.front().score >= config_.health_threshold;
    result.matched_filename = hits.front().filename;
  }
  return results;
}

std::string MemoryManager::CreateBackup(const std::string& label) {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  std::shared_lock<std::shared_mutex> state(state_mutex_);
  return SnapshotLocked(label.empty() ? ImplicitLabel("backup") : label);
}

SnapshotManifest MemoryManager::RestoreBackup(const std::string& snapshot_id_or_label) {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  std::unique_lock<std::shared_mutex> state(state_mutex_);

  const auto target = backups_->Resolve(snapshot_id_or_label);
  if (!target.has_value()) {
    throw SnapshotError("no snapshot with id or label '" + snapshot_id_or_label + "'");
  }
  const auto previous_registry = registry_;
  const auto previous_index = index_->Snapshot();

  auto manifest = backups_->Restore(target->id, *index_, registry_);
  try {
    PersistRegistryLocked();
  } catch (const RegistryError& ex) {
    registry_ = previous_registry;
    try {
      index_->Restore(previous_index);
    } catch (const DocMemError& revert_ex) {
      log::Logger()->error("restore: could not revert index, next open will recover: {}", revert_ex.what());
    }
    throw SnapshotError("restore of " + target->id + " could not be saved: " + ex.what());
  }
  return manifest;
}

std::vector<SnapshotManifest> MemoryManager::ListBackups() const {
  return backups_->List();
}

std::vector<DocumentEntry> MemoryManager::ListDocuments(const DocumentFilter& filter) const {
  std::shared_lock<std::shared_mutex> state(state_mutex_);
  return registry_.List(filter);
}

StoreStats MemoryManager::Stats() const {
  std::shared_lock<std::shared_mutex> state(state_mutex_);
  return StoreStats{
      .doc_count = registry_.size(),
      .chunk_count = index_->ChunkCount(),
      .backend_type = index_->kind(),
      .storage_bytes = index_->StorageBytes() + core::FileSizeOrZero(registry_path_),
  };
}

IntegrityReport MemoryManager::Verify() const {
  std::shared_lock<std::shared_mutex> state(state_mutex_);
  return VerifyLocked();
}

IntegrityReport MemoryManager::VerifyLocked() const {
  IntegrityReport report{};
  report.doc_count = registry_.size();
  const auto indexed = index_->ChunkIds();
  report.chunk_count = indexed.size();
  const std::unordered_set<std::string> indexed_set(indexed.begin(), indexed.end());
  const auto referenced = registry_.ReferencedChunkIds();
  for (const auto& chunk_id : referenced) {
    if (!indexed_set.contains(chunk_id)) {
      report.missing_chunk_ids.push_back(chunk_id);
    }
  }
  for (const auto& chunk_id : indexed) {
    if (!referenced.contains(chunk_id)) {
      report.orphan_chunk_ids.push_back(chunk_id);
    }
  }
  std::sort(report.missing_chunk_ids.begin(), report.missing_chunk_ids.end());
  return report;
}

}  // namespace docmem
