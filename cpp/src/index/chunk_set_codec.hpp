#pragma once

#include "docmem/types.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace docmem::index {

struct ChunkSet {
  BackendKind backend = BackendKind::kFlat;
  int dimensions = 0;
  std::vector<Chunk> chunks;
};

// Layout: "DMCS" | u16 version | u8 backend | u8 reserved | u32 dims | u64 count
// | count x (id, doc id, u64 start, u64 end, text, dims x f32) | sha256.
[[nodiscard]] std::vector<std::byte> EncodeChunkSet(const ChunkSet& set);

// Throws IndexCorrupted on any structural or checksum error.
[[nodiscard]] ChunkSet DecodeChunkSet(std::span<const std::byte> bytes);

}  // namespace docmem::index
