#pragma once

#include "docmem/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <unordered_set>
#include <vector>

namespace docmem {

// Authoritative table of ingested documents. Mutations are staged on a copy of
// the committed state and only become visible through CommitStaged(); queries
// always read the committed state.
class DocumentRegistry {
 public:
  // Reserves the next "doc-NNNNNN-xxxxxxxx" id. The sequence only moves
  // forward once committed.
  std::string AllocateDocId(const Fingerprint& fingerprint);
  // Throws RegistryError if the id or the fingerprint is already active.
  void StageRecord(DocumentEntry entry);
  bool StageRemove(const std::string& doc_id);
  // Keeps doc_id active with a reduced chunk list.
  void StageReplaceChunks(const std::string& doc_id, std::vector<std::string> chunk_ids);
  void StageClear();
  // Writes the staged view (the committed one when nothing is staged) to path.
  // Throws RegistryError; staged and committed state are unchanged either way.
  void PersistStaged(const std::filesystem::path& path) const;
  void CommitStaged();
  void RollbackStaged();
  [[nodiscard]] std::size_t PendingMutationCount() const { return pending_mutations_; }

  [[nodiscard]] std::optional<DocumentEntry> Get(const std::string& doc_id) const;
  [[nodiscard]] std::optional<std::string> FindByFingerprint(const Fingerprint& fingerprint) const;
  // Sorted by ingestion time, then doc id.
  [[nodiscard]] std::vector<DocumentEntry> List(const DocumentFilter& filter = {}) const;
  [[nodiscard]] std::unordered_set<std::string> ReferencedChunkIds() const;
  [[nodiscard]] std::size_t size() const { return committed_.entries.size(); }
  [[nodiscard]] std::size_t ChunkCount() const;
  [[nodiscard]] std::uint64_t next_sequence() const { return committed_.next_sequence; }
  // Raises the committed sequence so ids issued before a restore are not reissued.
  void EnsureSequenceAtLeast(std::uint64_t next_sequence);

  [[nodiscard]] std::vector<std::byte> Serialize() const;
  // Throws RegistryError on malformed input.
  [[nodiscard]] static DocumentRegistry Deserialize(std::span<const std::byte> bytes);

  void Save(const std::filesystem::path& path) const;
  // A missing file yields an empty registry.
  [[nodiscard]] static DocumentRegistry Load(const std::filesystem::path& path);

 private:
  struct State {
    std::map<std::string, DocumentEntry> entries;
    std::map<Fingerprint, std::string> by_fingerprint;
    std::uint64_t next_sequence = 1;
  };

  void EnsureStagingState();
  static std::vector<std::byte> Encode(const State& state);

  State committed_{};
  State staged_{};
  std::size_t pending_mutations_ = 0;
};

namespace registry::testing {

// The next `countdown` persists fail with RegistryError.
void SetPersistFailCountdown(std::uint32_t countdown);
void ClearPersistFailCountdown();

}  // namespace registry::testing

}  // namespace docmem
