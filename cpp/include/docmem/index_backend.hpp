#pragma once

#include "docmem/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace docmem {

struct DeleteFailure {
  std::string chunk_id;
  std::string reason;
};

struct DeleteResult {
  std::vector<std::string> deleted;
  std::vector<DeleteFailure> failed;
};

// Storage for embedded chunks. Both variants rank by cosine similarity, keep
// equal scores in insertion order and return the same result schema.
class IndexBackend {
 public:
  virtual ~IndexBackend() = default;

  [[nodiscard]] virtual BackendKind kind() const = 0;
  [[nodiscard]] virtual int dimensions() const = 0;

  // All chunks of one call become visible together or not at all.
  // Throws IndexOperationError; state is unchanged on failure.
  virtual void Add(const std::vector<Chunk>& chunks) = 0;

  // top_k is clamped to ChunkCount(); top_k <= 0 yields no results.
  [[nodiscard]] virtual std::vector<ScoredChunk> Search(const std::vector<float>& query, int top_k) const = 0;

  // Ids not present count as deleted. Ids that could not be removed are
  // reported in failed and stay searchable.
  virtual DeleteResult Delete(const std::vector<std::string>& chunk_ids) = 0;

  // Returns the stored chunks among chunk_ids, in insertion order.
  [[nodiscard]] virtual std::vector<Chunk> Fetch(const std::vector<std::string>& chunk_ids) const = 0;
  [[nodiscard]] virtual std::vector<std::string> ChunkIds() const = 0;
  [[nodiscard]] virtual std::size_t ChunkCount() const = 0;

  virtual void Clear() = 0;

  [[nodiscard]] virtual std::vector<std::byte> Snapshot() const = 0;
  // Replaces the whole content with a Snapshot() blob. Throws IndexCorrupted
  // for undecodable blobs and IndexOperationError for incompatible ones; state
  // is unchanged on failure.
  virtual void Restore(std::span<const std::byte> blob) = 0;

  [[nodiscard]] virtual std::uint64_t StorageBytes() const = 0;
};

// Opens the persisted backend under data_dir, or an empty one on first use.
// Throws IndexCorrupted when persisted state cannot be decoded.
[[nodiscard]] std::unique_ptr<IndexBackend> OpenIndexBackend(BackendKind kind,
                                                            int dimensions,
                                                            const std::filesystem::path& data_dir);

// Paths of the files each backend keeps under data_dir.
[[nodiscard]] std::filesystem::path IndexStoragePath(BackendKind kind, const std::filesystem::path& data_dir);

namespace index::testing {

// The next `countdown` Add calls fail before touching state.
void SetAddFailCountdown(std::uint32_t countdown);
// The next `countdown` per-chunk deletions fail (DocumentIndex), or the next
// `countdown` rebuilds fail (FlatIndex).
void SetDeleteFailCountdown(std::uint32_t countdown);
void ClearFailCountdowns();

}  // namespace index::testing

}  // namespace docmem
