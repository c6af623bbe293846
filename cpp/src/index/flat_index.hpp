#pragma once

#include "docmem/index_backend.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace docmem::index {

// In-memory chunk list scanned on every search. There is no delete primitive:
// removals rebuild the list from the survivors. When persist_path is set the
// whole list is written there (atomically) before each change becomes visible.
class FlatIndex final : public IndexBackend {
 public:
  FlatIndex(int dimensions, std::optional<std::filesystem::path> persist_path);

  [[nodiscard]] BackendKind kind() const override { return BackendKind::kFlat; }
  [[nodiscard]] int dimensions() const override { return dimensions_; }
  void Add(const std::vector<Chunk>& chunks) override;
  [[nodiscard]] std::vector<ScoredChunk> Search(const std::vector<float>& query, int top_k) const override;
  DeleteResult Delete(const std::vector<std::string>& chunk_ids) override;
  [[nodiscard]] std::vector<Chunk> Fetch(const std::vector<std::string>& chunk_ids) const override;
  [[nodiscard]] std::vector<std::string> ChunkIds() const override;
  [[nodiscard]] std::size_t ChunkCount() const override { return chunks_.size(); }
  void Clear() override;
  [[nodiscard]] std::vector<std::byte> Snapshot() const override;
  void Restore(std::span<const std::byte> blob) override;
  [[nodiscard]] std::uint64_t StorageBytes() const override;

 private:
  void Load();
  void Install(std::vector<Chunk> chunks);

  int dimensions_ = 0;
  std::optional<std::filesystem::path> persist_path_;
  std::vector<Chunk> chunks_;
  std::unordered_map<std::string, std::size_t> positions_;
};

}  // namespace docmem::index
