#include "docmem/backup_store.hpp"

#include "../core/file_io.hpp"
#include "../core/sha256.hpp"
#include "docmem/errors.hpp"
#include "docmem/log.hpp"
#include "manifest.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>

namespace docmem {
namespace {

constexpr std::string_view kSnapshotPrefix = "snap-";
constexpr std::string_view kStagingPrefix = ".staging-";
constexpr char kIndexFile[] = "index.bin";
constexpr char kRegistryFile[] = "registry.bin";
constexpr char kManifestFile[] = "MANIFEST";

std::atomic<std::uint32_t> g_test_write_fail_countdown{0};

void MaybeInjectWriteFailure() {
  auto remaining = g_test_write_fail_countdown.load(std::memory_order_relaxed);
  while (remaining > 0) {
    if (g_test_write_fail_countdown.compare_exchange_weak(remaining,
                                                          remaining - 1,
                                                          std::memory_order_relaxed,
                                                          std::memory_order_relaxed)) {
      throw std::runtime_error("BackupStore::Snapshot injected write failure");
    }
  }
}

// "snap-000012-..." -> 12; nullopt for anything else.
std::optional<std::uint64_t> SequenceOf(std::string_view name) {
  if (!name.starts_with(kSnapshotPrefix) || name.size() < kSnapshotPrefix.size() + 7) {
    return std::nullopt;
  }
  const auto digits = name.substr(kSnapshotPrefix.size(), 6);
  std::uint64_t value = 0;
  for (const char ch : digits) {
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
    value = value * 10 + static_cast<std::uint64_t>(ch - '0');
  }
  if (name[kSnapshotPrefix.size() + 6] != '-') {
    return std::nullopt;
  }
  return value;
}

bool IsSafeSnapshotId(std::string_view id) {
  return SequenceOf(id).has_value() && id.find('/') == std::string_view::npos &&
         id.find('\\') == std::string_view::npos && id.find("..") == std::string_view::npos;
}

std::string ReadText(const std::filesystem::path& path) {
  const auto bytes = core::ReadFileBytes(path);
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::span<const std::byte> AsBytes(const std::string& text) {
  return std::as_bytes(std::span<const char>(text.data(), text.size()));
}

}  // namespace

BackupStore::BackupStore(std::filesystem::path root, BackupConfig config)
    : root_(std::move(root)), config_(config) {
  if (config_.retention_count == 0) {
    throw ValidationError("backup retention_count must be positive");
  }
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    throw SnapshotError("cannot create snapshot root " + root_.string() + ": " + ec.message());
  }
  for (std::filesystem::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (name.starts_with(kStagingPrefix)) {
      std::error_code remove_ec;
      std::filesystem::remove_all(it->path(), remove_ec);
      if (remove_ec) {
        log::Logger()->warn("backup: could not sweep {}: {}", it->path().string(), remove_ec.message());
      } else {
        log::Logger()->warn("backup: swept incomplete snapshot {}", name);
      }
      continue;
    }
    if (const auto sequence = SequenceOf(name); sequence.has_value()) {
      next_sequence_ = std::max(next_sequence_, *sequence + 1);
    }
  }
  if (ec) {
    throw SnapshotError("cannot scan snapshot root " + root_.string() + ": " + ec.message());
  }
}

std::string BackupStore::NextSnapshotId() const {
  char prefix[32];
  std::snprintf(prefix, sizeof(prefix), "snap-%06llu-", static_cast<unsigned long long>(next_sequence_));
  return std::string(prefix) + UtcTimestamp(NowMillis());
}

SnapshotManifest BackupStore::Snapshot(const std::string& label,
                                       const IndexBackend& index,
                                       const DocumentRegistry& registry) {
  if (std::any_of(label.begin(), label.end(), [](char ch) { return static_cast<unsigned char>(ch) < 0x20U; })) {
    throw ValidationError("snapshot label must not contain control characters");
  }
  SnapshotManifest manifest{};
  manifest.id = NextSnapshotId();
  manifest.label = label;
  manifest.created_at_ms = NowMillis();
  manifest.backend = index.kind();
  manifest.dimensions = index.dimensions();
  manifest.doc_count = registry.size();
  manifest.chunk_count = index.ChunkCount();

  const auto staging = root_ / (std::string(kStagingPrefix) + manifest.id);
  const auto final_dir = root_ / manifest.id;
  try {
    const auto index_blob = index.Snapshot();
    const auto registry_blob = registry.Serialize();
    manifest.index_sha256 = core::HashBytes(index_blob);
    manifest.registry_sha256 = core::HashBytes(registry_blob);

    std::filesystem::create_directories(staging);
    core::WriteFileAtomic(staging / kIndexFile, index_blob);
    core::WriteFileAtomic(staging / kRegistryFile, registry_blob);
    MaybeInjectWriteFailure();
    core::WriteFileAtomic(staging / kManifestFile, AsBytes(backup::EncodeManifest(manifest)));
    std::filesystem::rename(staging, final_dir);
  } catch (const std::exception& ex) {
    std::error_code cleanup_ec;
    std::filesystem::remove_all(staging, cleanup_ec);
    if (cleanup_ec) {
      log::Logger()->warn("backup: could not remove {}: {}", staging.string(), cleanup_ec.message());
    }
    throw SnapshotError("snapshot " + manifest.id + " failed: " + ex.what());
  }
  ++next_sequence_;
  log::Logger()->info("backup: created {} label='{}' docs={} chunks={}",
                      manifest.id, manifest.label, manifest.doc_count, manifest.chunk_count);
  Prune();
  return manifest;
}

std::vector<SnapshotManifest> BackupStore::List() const {
  std::vector<std::pair<std::uint64_t, SnapshotManifest>> found{};
  std::error_code ec;
  for (std::filesystem::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();
    const auto sequence = SequenceOf(name);
    if (!sequence.has_value()) {
      continue;
    }
    try {
      auto manifest = backup::DecodeManifest(ReadText(it->path() / kManifestFile));
      if (manifest.id != name) {
        log::Logger()->warn("backup: {} holds the manifest of {}", name, manifest.id);
        continue;
      }
      found.emplace_back(*sequence, std::move(manifest));
    } catch (const std::runtime_error& ex) {
      log::Logger()->warn("backup: skipping {}: {}", name, ex.what());
    }
  }
  std::sort(found.begin(), found.end(), [](const auto& lhs, const auto& rhs) { return lhs.first > rhs.first; });
  std::vector<SnapshotManifest> out{};
  out.reserve(found.size());
  for (auto& [_, manifest] : found) {
    out.push_back(std::move(manifest));
  }
  return out;
}

std::optional<SnapshotManifest> BackupStore::Latest() const {
  auto all = List();
  if (all.empty()) {
    return std::nullopt;
  }
  return std::move(all.front());
}

std::optional<SnapshotManifest> BackupStore::Resolve(const std::string& id_or_label) const {
  const auto all = List();
  for (const auto& manifest : all) {
    if (manifest.id == id_or_label) {
      return manifest;
    }
  }
  for (const auto& manifest : all) {
    if (manifest.label == id_or_label) {
      return manifest;
    }
  }
  return std::nullopt;
}

LoadedSnapshot BackupStore::Load(const std::string& snapshot_id) const {
  if (!IsSafeSnapshotId(snapshot_id)) {
    throw SnapshotError("not a snapshot id: " + snapshot_id);
  }
  const auto dir = root_ / snapshot_id;
  LoadedSnapshot loaded{};
  try {
    loaded.manifest = backup::DecodeManifest(ReadText(dir / kManifestFile));
    loaded.index_blob = core::ReadFileBytes(dir / kIndexFile);
    loaded.registry_blob = core::ReadFileBytes(dir / kRegistryFile);
  } catch (const SnapshotError&) {
    throw;
  } catch (const std::runtime_error& ex) {
    throw SnapshotError("snapshot " + snapshot_id + " unreadable: " + ex.what());
  }
  if (loaded.manifest.id != snapshot_id) {
    throw SnapshotError("snapshot " + snapshot_id + " carries the manifest of " + loaded.manifest.id);
  }
  if (core::HashBytes(loaded.index_blob) != loaded.manifest.index_sha256) {
    throw SnapshotError("snapshot " + snapshot_id + " index checksum mismatch");
  }
  if (core::HashBytes(loaded.registry_blob) != loaded.manifest.registry_sha256) {
    throw SnapshotError("snapshot " + snapshot_id + " registry checksum mismatch");
  }
  return loaded;
}

SnapshotManifest BackupStore::Restore(const std::string& snapshot_id,
                                      IndexBackend& index,
                                      DocumentRegistry& registry) const {
  auto loaded = Load(snapshot_id);
  const auto& manifest = loaded.manifest;
  if (manifest.backend != index.kind()) {
    throw SnapshotError("snapshot " + snapshot_id + " was taken from the " + std::string(ToString(manifest.backend)) +
                        " backend, live backend is " + std::string(ToString(index.kind())));
  }
  if (manifest.dimensions != index.dimensions()) {
    throw SnapshotError("snapshot " + snapshot_id + " has " + std::to_string(manifest.dimensions) +
                        " dimensions, live index has " + std::to_string(index.dimensions()));
  }
  DocumentRegistry restored{};
  try {
    restored = DocumentRegistry::Deserialize(loaded.registry_blob);
  } catch (const RegistryError& ex) {
    throw SnapshotError("snapshot " + snapshot_id + " registry unreadable: " + ex.what());
  }
  if (restored.size() != manifest.doc_count) {
    throw SnapshotError("snapshot " + snapshot_id + " registry does not match its manifest");
  }
  try {
    index.Restore(loaded.index_blob);
  } catch (const DocMemError& ex) {
    throw SnapshotError("snapshot " + snapshot_id + " index restore failed: " + ex.what());
  }
  restored.EnsureSequenceAtLeast(registry.next_sequence());
  registry = std::move(restored);
  log::Logger()->info("backup: restored {} docs={} chunks={}", snapshot_id, manifest.doc_count, manifest.chunk_count);
  return manifest;
}

std::vector<std::string> BackupStore::Prune() {
  const auto all = List();
  std::vector<std::string> removed{};
  const auto now = NowMillis();
  const auto max_age_ms = std::chrono::duration_cast<std::chrono::milliseconds>(config_.max_age).count();
  for (std::size_t i = 1; i < all.size(); ++i) {
    const bool over_count = i >= config_.retention_count;
    const bool too_old = max_age_ms > 0 && now - all[i].created_at_ms > max_age_ms;
    if (!over_count && !too_old) {
      continue;
    }
    std::error_code ec;
    std::filesystem::remove_all(root_ / all[i].id, ec);
    if (ec) {
      log::Logger()->warn("backup: could not prune {}: {}", all[i].id, ec.message());
      continue;
    }
    removed.push_back(all[i].id);
  }
  if (!removed.empty()) {
    log::Logger()->info("backup: pruned {} snapshots", removed.size());
  }
  return removed;
}

namespace backup::testing {

void SetWriteFailCountdown(std::uint32_t countdown) {
  g_test_write_fail_countdown.store(countdown, std::memory_order_relaxed);
}

void ClearWriteFailCountdown() {
  g_test_write_fail_countdown.store(0, std::memory_order_relaxed);
}

}  // namespace backup::testing

}  // namespace docmem
