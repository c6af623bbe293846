#include "flat_index.hpp"

#include "../core/file_io.hpp"
#include "chunk_set_codec.hpp"
#include "docmem/errors.hpp"
#include "docmem/log.hpp"
#include "fault_injection.hpp"
#include "ranking.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace docmem::index {

FlatIndex::FlatIndex(int dimensions, std::optional<std::filesystem::path> persist_path)
    : dimensions_(dimensions), persist_path_(std::move(persist_path)) {
  if (dimensions_ <= 0) {
    throw IndexOperationError("flat index dimensions must be positive");
  }
  Load();
}

void FlatIndex::Load() {
  if (!persist_path_.has_value()) {
    return;
  }
  std::error_code ec;
  if (!std::filesystem::exists(*persist_path_, ec)) {
    log::Logger()->info("flat index: starting empty at {}", persist_path_->string());
    return;
  }
  std::vector<std::byte> bytes{};
  try {
    bytes = core::ReadFileBytes(*persist_path_);
  } catch (const std::runtime_error& ex) {
    throw IndexCorrupted(std::string("flat index unreadable: ") + ex.what());
  }
  auto set = DecodeChunkSet(bytes);
  if (set.backend != BackendKind::kFlat) {
    throw IndexCorrupted("flat index file " + persist_path_->string() + " holds another backend's data");
  }
  if (set.dimensions != dimensions_) {
    throw IndexOperationError("flat index at " + persist_path_->string() + " has " +
                              std::to_string(set.dimensions) + " dimensions, embedder has " +
                              std::to_string(dimensions_));
  }
  chunks_ = std::move(set.chunks);
  positions_.clear();
  for (std::size_t i = 0; i < chunks_.size(); ++i) {
    positions_.emplace(chunks_[i].id, i);
  }
  log::Logger()->info("flat index: loaded {} chunks from {}", chunks_.size(), persist_path_->string());
}

void FlatIndex::Install(std::vector<Chunk> chunks) {
  if (persist_path_.has_value()) {
    const auto bytes = EncodeChunkSet(ChunkSet{.backend = BackendKind::kFlat, .dimensions = dimensions_, .chunks = chunks});
    try {
      core::WriteFileAtomic(*persist_path_, bytes);
    } catch (const std::runtime_error& ex) {
      throw IndexOperationError(std::string("flat index persist failed: ") + ex.what());
    }
  }
  std::unordered_map<std::string, std::size_t> positions{};
  positions.reserve(chunks.size());
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    positions.emplace(chunks[i].id, i);
  }
  chunks_ = std::move(chunks);
  positions_ = std::move(positions);
}

void FlatIndex::Add(const std::vector<Chunk>& chunks) {
  if (chunks.empty()) {
    return;
  }
  std::unordered_set<std::string> batch_ids{};
  for (const auto& chunk : chunks) {
    if (chunk.id.empty()) {
      throw IndexOperationError("chunk id must not be empty");
    }
    if (chunk.vector.size() != static_cast<std::size_t>(dimensions_)) {
      throw IndexOperationError("chunk " + chunk.id + " dimension mismatch");
    }
    if (positions_.contains(chunk.id) || !batch_ids.insert(chunk.id).second) {
      throw IndexOperationError("chunk id already indexed: " + chunk.id);
    }
  }
  detail::MaybeInjectAddFailure("FlatIndex::Add");

  auto next = chunks_;
  next.insert(next.end(), chunks.begin(), chunks.end());
  Install(std::move(next));
}

std::vector<ScoredChunk> FlatIndex::Search(const std::vector<float>& query, int top_k) const {
  if (query.size() != static_cast<std::size_t>(dimensions_)) {
    throw IndexOperationError("flat index search dimension mismatch");
  }
  std::vector<const Chunk*> ordered{};
  ordered.reserve(chunks_.size());
  for (const auto& chunk : chunks_) {
    ordered.push_back(&chunk);
  }
  return RankByCosine(ordered, query, top_k);
}

DeleteResult FlatIndex::Delete(const std::vector<std::string>& chunk_ids) {
  DeleteResult result{};
  std::unordered_set<std::string> doomed{};
  for (const auto& id : chunk_ids) {
    if (positions_.contains(id)) {
      doomed.insert(id);
    } else {
      result.deleted.push_back(id);
    }
  }
  if (doomed.empty()) {
    return result;
  }

  auto fail_all = [&](const std::string& reason) {
    for (const auto& id : chunk_ids) {
      if (doomed.contains(id)) {
        result.failed.push_back(DeleteFailure{.chunk_id = id, .reason = reason});
      }
    }
    log::Logger()->warn("flat index: rebuild failed, {} chunks kept: {}", doomed.size(), reason);
    return result;
  };

  if (detail::ConsumeDeleteFailure()) {
    return fail_all("injected rebuild failure");
  }

  std::vector<Chunk> survivors{};
  survivors.reserve(chunks_.size() - doomed.size());
  for (const auto& chunk : chunks_) {
    if (!doomed.contains(chunk.id)) {
      survivors.push_back(chunk);
    }
  }
  try {
    Install(std::move(survivors));
  } catch (const IndexOperationError& ex) {
    return fail_all(ex.what());
  }
  for (const auto& id : chunk_ids) {
    if (doomed.contains(id)) {
      result.deleted.push_back(id);
    }
  }
  return result;
}

std::vector<Chunk> FlatIndex::Fetch(const std::vector<std::string>& chunk_ids) const {
  std::vector<std::size_t> found{};
  for (const auto& id : chunk_ids) {
    const auto it = positions_.find(id);
    if (it != positions_.end()) {
      found.push_back(it->second);
    }
  }
  std::sort(found.begin(), found.end());
  found.erase(std::unique(found.begin(), found.end()), found.end());
  std::vector<Chunk> out{};
  out.reserve(found.size());
  for (const auto position : found) {
    out.push_back(chunks_[position]);
  }
  return out;
}

std::vector<std::string> FlatIndex::ChunkIds() const {
  std::vector<std::string> out{};
  out.reserve(chunks_.size());
  for (const auto& chunk : chunks_) {
    out.push_back(chunk.id);
  }
  return out;
}

void FlatIndex::Clear() {
  Install({});
}

std::vector<std::byte> FlatIndex::Snapshot() const {
  return EncodeChunkSet(ChunkSet{.backend = BackendKind::kFlat, .dimensions = dimensions_, .chunks = chunks_});
}

void FlatIndex::Restore(std::span<const std::byte> blob) {
  auto set = DecodeChunkSet(blob);
  if (set.backend != BackendKind::kFlat) {
    throw IndexOperationError("snapshot was taken from the " + std::string(ToString(set.backend)) + " backend");
  }
  if (set.dimensions != dimensions_) {
    throw IndexOperationError("snapshot has " + std::to_string(set.dimensions) + " dimensions, index has " +
                              std::to_string(dimensions_));
  }
  Install(std::move(set.chunks));
}

std::uint64_t FlatIndex::StorageBytes() const {
  if (persist_path_.has_value()) {
    return core::FileSizeOrZero(*persist_path_);
  }
  std::uint64_t total = 0;
  for (const auto& chunk : chunks_) {
    total += chunk.id.size() + chunk.text.size() + chunk.source_doc_id.size() + chunk.vector.size() * sizeof(float);
  }
  return total;
}

}  // namespace docmem::index
