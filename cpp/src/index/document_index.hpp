#pragma once

#include "docmem/index_backend.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace docmem::index {

// Chunks persisted in a SQLite database under `directory`, with native
// delete-by-id. Searches run against an in-memory mirror that is updated only
// after the matching transaction commits.
class DocumentIndex final : public IndexBackend {
 public:
  DocumentIndex(int dimensions, std::filesystem::path directory);
  ~DocumentIndex() override;

  DocumentIndex(const DocumentIndex&) = delete;
  DocumentIndex& operator=(const DocumentIndex&) = delete;

  [[nodiscard]] BackendKind kind() const override { return BackendKind::kDocument; }
  [[nodiscard]] int dimensions() const override { return dimensions_; }
  void Add(const std::vector<Chunk>& chunks) override;
  [[nodiscard]] std::vector<ScoredChunk> Search(const std::vector<float>& query, int top_k) const override;
  DeleteResult Delete(const std::vector<std::string>& chunk_ids) override;
  [[nodiscard]] std::vector<Chunk> Fetch(const std::vector<std::string>& chunk_ids) const override;
  [[nodiscard]] std::vector<std::string> ChunkIds() const override;
  [[nodiscard]] std::size_t ChunkCount() const override { return by_seq_.size(); }
  void Clear() override;
  [[nodiscard]] std::vector<std::byte> Snapshot() const override;
  void Restore(std::span<const std::byte> blob) override;
  [[nodiscard]] std::uint64_t StorageBytes() const override;

  [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }

 private:
  struct SQLiteState;

  void Open();
  void LoadMirror();
  // Inserts chunks inside the caller's transaction; returns their row sequence.
  std::vector<std::int64_t> InsertRows(const std::vector<Chunk>& chunks);

  int dimensions_ = 0;
  std::filesystem::path directory_;
  std::unique_ptr<SQLiteState> sqlite_;
  std::map<std::int64_t, Chunk> by_seq_;
  std::unordered_map<std::string, std::int64_t> seq_by_id_;
};

}  // namespace docmem::index
