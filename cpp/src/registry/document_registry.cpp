#include "docmem/document_registry.hpp"

#include "../core/byte_codec.hpp"
#include "../core/file_io.hpp"
#include "docmem/errors.hpp"
#include "docmem/fingerprint.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace docmem {
namespace {

constexpr auto kMagic = core::MakeMagic("DMRG");
constexpr std::uint16_t kVersion = 1;
constexpr char kContext[] = "registry";

std::atomic<std::uint32_t> g_test_persist_fail_countdown{0};

void MaybeInjectPersistFailure() {
  auto remaining = g_test_persist_fail_countdown.load(std::memory_order_relaxed);
  while (remaining > 0) {
    if (g_test_persist_fail_countdown.compare_exchange_weak(remaining,
                                                            remaining - 1,
                                                            std::memory_order_relaxed,
                                                            std::memory_order_relaxed)) {
      throw RegistryError("DocumentRegistry::PersistStaged injected failure");
    }
  }
}

std::string LowerAscii(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return out;
}

bool EntryLess(const DocumentEntry& lhs, const DocumentEntry& rhs) {
  if (lhs.ingested_at_ms != rhs.ingested_at_ms) {
    return lhs.ingested_at_ms < rhs.ingested_at_ms;
  }
  return lhs.doc_id < rhs.doc_id;
}

}  // namespace

void DocumentRegistry::EnsureStagingState() {
  if (pending_mutations_ != 0) {
    return;
  }
  staged_ = committed_;
}

std::string DocumentRegistry::AllocateDocId(const Fingerprint& fingerprint) {
  EnsureStagingState();
  const auto sequence = staged_.next_sequence++;
  ++pending_mutations_;
  char prefix[32];
  std::snprintf(prefix, sizeof(prefix), "doc-%06llu-", static_cast<unsigned long long>(sequence));
  return std::string(prefix) + FingerprintToHex(fingerprint).substr(0, 8);
}

void DocumentRegistry::StageRecord(DocumentEntry entry) {
  if (entry.doc_id.empty()) {
    throw RegistryError("document id must be non-empty");
  }
  EnsureStagingState();
  if (staged_.entries.contains(entry.doc_id)) {
    throw RegistryError("document id already recorded: " + entry.doc_id, {entry.doc_id});
  }
  const auto existing = staged_.by_fingerprint.find(entry.fingerprint);
  if (existing != staged_.by_fingerprint.end()) {
    throw RegistryError("fingerprint already recorded by " + existing->second, {existing->second, entry.doc_id});
  }
  const auto doc_id = entry.doc_id;
  staged_.by_fingerprint.emplace(entry.fingerprint, doc_id);
  staged_.entries.emplace(doc_id, std::move(entry));
  ++pending_mutations_;
}

bool DocumentRegistry::StageRemove(const std::string& doc_id) {
  EnsureStagingState();
  ++pending_mutations_;
  const auto it = staged_.entries.find(doc_id);
  if (it == staged_.entries.end()) {
    return false;
  }
  staged_.by_fingerprint.erase(it->second.fingerprint);
  staged_.entries.erase(it);
  return true;
}

void DocumentRegistry::StageReplaceChunks(const std::string& doc_id, std::vector<std::string> chunk_ids) {
  EnsureStagingState();
  const auto it = staged_.entries.find(doc_id);
  if (it == staged_.entries.end()) {
    throw RegistryError("unknown document " + doc_id, {doc_id});
  }
  it->second.chunk_ids = std::move(chunk_ids);
  ++pending_mutations_;
}

void DocumentRegistry::StageClear() {
  EnsureStagingState();
  staged_.entries.clear();
  staged_.by_fingerprint.clear();
  ++pending_mutations_;
}

void DocumentRegistry::PersistStaged(const std::filesystem::path& path) const {
  MaybeInjectPersistFailure();
  const auto bytes = Encode(pending_mutations_ != 0 ? staged_ : committed_);
  try {
    core::WriteFileAtomic(path, bytes);
  } catch (const std::runtime_error& ex) {
    throw RegistryError(std::string("registry persist failed: ") + ex.what());
  }
}

void DocumentRegistry::CommitStaged() {
  if (pending_mutations_ == 0) {
    return;
  }
  committed_ = std::move(staged_);
  staged_ = State{};
  pending_mutations_ = 0;
}

void DocumentRegistry::RollbackStaged() {
  staged_ = State{};
  pending_mutations_ = 0;
}

std::optional<DocumentEntry> DocumentRegistry::Get(const std::string& doc_id) const {
  const auto it = committed_.entries.find(doc_id);
  if (it == committed_.entries.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> DocumentRegistry::FindByFingerprint(const Fingerprint& fingerprint) const {
  const auto it = committed_.by_fingerprint.find(fingerprint);
  if (it == committed_.by_fingerprint.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<DocumentEntry> DocumentRegistry::List(const DocumentFilter& filter) const {
  const auto needle = filter.filename_contains.has_value() ? LowerAscii(*filter.filename_contains) : std::string{};
  std::vector<DocumentEntry> out{};
  out.reserve(committed_.entries.size());
  for (const auto& [_, entry] : committed_.entries) {
    if (filter.file_type.has_value() && entry.file_type != *filter.file_type) {
      continue;
    }
    if (!needle.empty() && LowerAscii(entry.original_filename).find(needle) == std::string::npos) {
      continue;
    }
    out.push_back(entry);
  }
  std::sort(out.begin(), out.end(), EntryLess);
  return out;
}

std::unordered_set<std::string> DocumentRegistry::ReferencedChunkIds() const {
  std::unordered_set<std::string> out{};
  for (const auto& [_, entry] : committed_.entries) {
    out.insert(entry.chunk_ids.begin(), entry.chunk_ids.end());
  }
  return out;
}

std::size_t DocumentRegistry::ChunkCount() const {
  std::size_t total = 0;
  for (const auto& [_, entry] : committed_.entries) {
    total += entry.chunk_ids.size();
  }
  return total;
}

void DocumentRegistry::EnsureSequenceAtLeast(std::uint64_t next_sequence) {
  committed_.next_sequence = std::max(committed_.next_sequence, next_sequence);
}

std::vector<std::byte> DocumentRegistry::Encode(const State& state) {
  core::ByteWriter writer{};
  writer.AppendRaw(kMagic);
  writer.AppendU16(kVersion);
  writer.AppendU64(state.next_sequence);
  writer.AppendU64(state.entries.size());
  for (const auto& [doc_id, entry] : state.entries) {
    writer.AppendString(doc_id);
    writer.AppendString(entry.original_filename);
    writer.AppendRaw(entry.fingerprint);
    writer.AppendU8(static_cast<std::uint8_t>(entry.file_type));
    writer.AppendI64(entry.ingested_at_ms);
    writer.AppendU64(entry.byte_size);
    writer.AppendU32(static_cast<std::uint32_t>(entry.chunk_ids.size()));
    for (const auto& chunk_id : entry.chunk_ids) {
      writer.AppendString(chunk_id);
    }
    const std::map<std::string, std::string> metadata(entry.source_metadata.begin(), entry.source_metadata.end());
    writer.AppendU32(static_cast<std::uint32_t>(metadata.size()));
    for (const auto& [key, value] : metadata) {
      writer.AppendString(key);
      writer.AppendString(value);
    }
  }
  writer.AppendChecksum();
  return writer.Take();
}

std::vector<std::byte> DocumentRegistry::Serialize() const {
  return Encode(committed_);
}

DocumentRegistry DocumentRegistry::Deserialize(std::span<const std::byte> bytes) {
  try {
    if (!core::HasMagic(bytes, kMagic)) {
      throw std::runtime_error("registry: magic mismatch");
    }
    const auto body = core::VerifyChecksum(bytes, kContext);
    core::ByteReader reader(body, kContext);
    (void)reader.ReadRaw(kMagic.size());
    if (reader.ReadU16() != kVersion) {
      throw std::runtime_error("registry: unsupported version");
    }
    DocumentRegistry registry{};
    auto& state = registry.committed_;
    state.next_sequence = reader.ReadU64();
    const auto count = reader.ReadU64();
    for (std::uint64_t i = 0; i < count; ++i) {
      DocumentEntry entry{};
      entry.doc_id = reader.ReadString();
      entry.original_filename = reader.ReadString();
      const auto fingerprint = reader.ReadRaw(entry.fingerprint.size());
      std::copy(fingerprint.begin(), fingerprint.end(), entry.fingerprint.begin());
      const auto file_type = reader.ReadU8();
      if (file_type < static_cast<std::uint8_t>(FileType::kPdf) || file_type > static_cast<std::uint8_t>(FileType::kDocx)) {
        throw std::runtime_error("registry: unknown file type for " + entry.doc_id);
      }
      entry.file_type = static_cast<FileType>(file_type);
      entry.ingested_at_ms = reader.ReadI64();
      entry.byte_size = reader.ReadU64();
      const auto chunk_count = reader.ReadU32();
      for (std::uint32_t c = 0; c < chunk_count; ++c) {
        entry.chunk_ids.push_back(reader.ReadString());
      }
      const auto metadata_count = reader.ReadU32();
      for (std::uint32_t m = 0; m < metadata_count; ++m) {
        auto key = reader.ReadString();
        entry.source_metadata[std::move(key)] = reader.ReadString();
      }
      if (!state.by_fingerprint.emplace(entry.fingerprint, entry.doc_id).second) {
        throw std::runtime_error("registry: duplicate fingerprint for " + entry.doc_id);
      }
      const auto doc_id = entry.doc_id;
      if (!state.entries.emplace(doc_id, std::move(entry)).second) {
        throw std::runtime_error("registry: duplicate document id " + doc_id);
      }
    }
    reader.ExpectEnd();
    return registry;
  } catch (const RegistryError&) {
    throw;
  } catch (const std::runtime_error& ex) {
    throw RegistryError(ex.what());
  }
}

void DocumentRegistry::Save(const std::filesystem::path& path) const {
  try {
    core::WriteFileAtomic(path, Serialize());
  } catch (const std::runtime_error& ex) {
    throw RegistryError(std::string("registry save failed: ") + ex.what());
  }
}

DocumentRegistry DocumentRegistry::Load(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return DocumentRegistry{};
  }
  std::vector<std::byte> bytes{};
  try {
    bytes = core::ReadFileBytes(path);
  } catch (const std::runtime_error& ex) {
    throw RegistryError(std::string("registry unreadable: ") + ex.what());
  }
  return Deserialize(bytes);
}

namespace registry::testing {

void SetPersistFailCountdown(std::uint32_t countdown) {
  g_test_persist_fail_countdown.store(countdown, std::memory_order_relaxed);
}

void ClearPersistFailCountdown() {
  g_test_persist_fail_countdown.store(0, std::memory_order_relaxed);
}

}  // namespace registry::testing

}  // namespace docmem
