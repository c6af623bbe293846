#include "chunk_set_codec.hpp"

#include "../core/byte_codec.hpp"
#include "docmem/errors.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace docmem::index {
namespace {

constexpr auto kMagic = core::MakeMagic("DMCS");
constexpr std::uint16_t kVersion = 1;
constexpr char kContext[] = "chunk_set";

}  // namespace

std::vector<std::byte> EncodeChunkSet(const ChunkSet& set) {
  core::ByteWriter writer{};
  writer.AppendRaw(kMagic);
  writer.AppendU16(kVersion);
  writer.AppendU8(static_cast<std::uint8_t>(set.backend));
  writer.AppendU8(0);
  writer.AppendU32(static_cast<std::uint32_t>(set.dimensions));
  writer.AppendU64(set.chunks.size());
  for (const auto& chunk : set.chunks) {
    if (chunk.vector.size() != static_cast<std::size_t>(set.dimensions)) {
      throw IndexOperationError("chunk " + chunk.id + " has " + std::to_string(chunk.vector.size()) +
                                " dimensions, expected " + std::to_string(set.dimensions));
    }
    writer.AppendString(chunk.id);
    writer.AppendString(chunk.source_doc_id);
    writer.AppendU64(chunk.offset_start);
    writer.AppendU64(chunk.offset_end);
    writer.AppendString(chunk.text);
    for (const float x : chunk.vector) {
      writer.AppendF32(x);
    }
  }
  writer.AppendChecksum();
  return writer.Take();
}

ChunkSet DecodeChunkSet(std::span<const std::byte> bytes) {
  try {
    if (!core::HasMagic(bytes, kMagic)) {
      throw std::runtime_error("chunk_set: magic mismatch");
    }
    const auto body = core::VerifyChecksum(bytes, kContext);
    core::ByteReader reader(body, kContext);
    (void)reader.ReadRaw(kMagic.size());
    if (reader.ReadU16() != kVersion) {
      throw std::runtime_error("chunk_set: unsupported version");
    }
    ChunkSet set{};
    const auto backend_raw = reader.ReadU8();
    if (backend_raw != static_cast<std::uint8_t>(BackendKind::kFlat) &&
        backend_raw != static_cast<std::uint8_t>(BackendKind::kDocument)) {
      throw std::runtime_error("chunk_set: unknown backend kind");
    }
    set.backend = static_cast<BackendKind>(backend_raw);
    if (reader.ReadU8() != 0) {
      throw std::runtime_error("chunk_set: reserved byte must be zero");
    }
    set.dimensions = static_cast<int>(reader.ReadU32());
    if (set.dimensions <= 0) {
      throw std::runtime_error("chunk_set: dimensions must be positive");
    }
    const auto count = reader.ReadU64();
    // Each chunk needs at least its fixed-size fields and vector.
    const auto min_chunk_bytes = 3 * 4 + 2 * 8 + static_cast<std::uint64_t>(set.dimensions) * 4;
    if (count > reader.remaining() / min_chunk_bytes) {
      throw std::runtime_error("chunk_set: chunk count exceeds payload");
    }
    set.chunks.reserve(static_cast<std::size_t>(count));
    std::unordered_set<std::string> seen{};
    for (std::uint64_t i = 0; i < count; ++i) {
      Chunk chunk{};
      chunk.id = reader.ReadString();
      chunk.source_doc_id = reader.ReadString();
      chunk.offset_start = reader.ReadU64();
      chunk.offset_end = reader.ReadU64();
      chunk.text = reader.ReadString();
      chunk.vector.resize(static_cast<std::size_t>(set.dimensions));
      for (auto& x : chunk.vector) {
        x = reader.ReadF32();
      }
      if (!seen.insert(chunk.id).second) {
        throw std::runtime_error("chunk_set: duplicate chunk id " + chunk.id);
      }
      set.chunks.push_back(std::move(chunk));
    }
    reader.ExpectEnd();
    return set;
  } catch (const DocMemError&) {
    throw;
  } catch (const std::runtime_error& ex) {
    throw IndexCorrupted(ex.what());
  }
}

}  // namespace docmem::index
