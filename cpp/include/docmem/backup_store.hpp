#pragma once

#include "docmem/document_registry.hpp"
#include "docmem/index_backend.hpp"
#include "docmem/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace docmem {

struct LoadedSnapshot {
  SnapshotManifest manifest;
  std::vector<std::byte> index_blob;
  std::vector<std::byte> registry_blob;
};

// Snapshot directories under root, one per snapshot:
//   <root>/snap-000012-20240101T120000Z/{index.bin, registry.bin, MANIFEST}
// A snapshot is written into ".staging-<id>" and renamed into place only once
// complete, so a listed snapshot is always whole.
class BackupStore {
 public:
  // Removes leftover staging directories.
  BackupStore(std::filesystem::path root, BackupConfig config);

  // Captures index and registry together. Throws SnapshotError; nothing is
  // listed on failure. Prunes afterwards per retention.
  SnapshotManifest Snapshot(const std::string& label, const IndexBackend& index, const DocumentRegistry& registry);

  // Newest first. Directories with a missing or damaged manifest are skipped.
  [[nodiscard]] std::vector<SnapshotManifest> List() const;
  [[nodiscard]] std::optional<SnapshotManifest> Latest() const;
  // Exact id match first, otherwise the newest snapshot carrying that label.
  [[nodiscard]] std::optional<SnapshotManifest> Resolve(const std::string& id_or_label) const;

  // Reads and checksum-verifies both blobs. Throws SnapshotError.
  [[nodiscard]] LoadedSnapshot Load(const std::string& snapshot_id) const;

  // Replaces index and registry from the snapshot. Backend type and dimensions
  // must match the live index. Throws SnapshotError and leaves both untouched
  // when anything fails before the swap.
  SnapshotManifest Restore(const std::string& snapshot_id, IndexBackend& index, DocumentRegistry& registry) const;

  // Applies retention; returns the ids removed. The newest snapshot is kept.
  std::vector<std::string> Prune();

  [[nodiscard]] const std::filesystem::path& root() const { return root_; }

 private:
  [[nodiscard]] std::string NextSnapshotId() const;

  std::filesystem::path root_;
  BackupConfig config_;
  std::uint64_t next_sequence_ = 1;
};

namespace backup::testing {

// The next `countdown` snapshots fail after capture, before the rename.
void SetWriteFailCountdown(std::uint32_t countdown);
void ClearWriteFailCountdown();

}  // namespace backup::testing

}  // namespace docmem
