#include "manifest.hpp"

#include "docmem/errors.hpp"
#include "docmem/fingerprint.hpp"

#include <charconv>
#include <map>
#include <string>

namespace docmem::backup {
namespace {

constexpr std::string_view kFormat = "1";

template <typename T>
T ParseNumber(const std::map<std::string, std::string, std::less<>>& fields, std::string_view key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    throw SnapshotError("manifest is missing " + std::string(key));
  }
  T value{};
  const auto& text = it->second;
  const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size()) {
    throw SnapshotError("manifest has a bad " + std::string(key) + ": " + text);
  }
  return value;
}

const std::string& Field(const std::map<std::string, std::string, std::less<>>& fields, std::string_view key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    throw SnapshotError("manifest is missing " + std::string(key));
  }
  return it->second;
}

Fingerprint ParseDigest(const std::map<std::string, std::string, std::less<>>& fields, std::string_view key) {
  const auto digest = FingerprintFromHex(Field(fields, key));
  if (!digest.has_value()) {
    throw SnapshotError("manifest has a bad " + std::string(key));
  }
  return *digest;
}

}  // namespace

std::string EncodeManifest(const SnapshotManifest& manifest) {
  std::string out{};
  out += "format=" + std::string(kFormat) + "\n";
  out += "id=" + manifest.id + "\n";
  out += "label=" + manifest.label + "\n";
  out += "created_at_ms=" + std::to_string(manifest.created_at_ms) + "\n";
  out += "backend=" + std::string(ToString(manifest.backend)) + "\n";
  out += "dimensions=" + std::to_string(manifest.dimensions) + "\n";
  out += "doc_count=" + std::to_string(manifest.doc_count) + "\n";
  out += "chunk_count=" + std::to_string(manifest.chunk_count) + "\n";
  out += "index_sha256=" + FingerprintToHex(manifest.index_sha256) + "\n";
  out += "registry_sha256=" + FingerprintToHex(manifest.registry_sha256) + "\n";
  return out;
}

SnapshotManifest DecodeManifest(std::string_view text) {
  std::map<std::string, std::string, std::less<>> fields{};
  while (!text.empty()) {
    const auto newline = text.find('\n');
    const auto line = text.substr(0, newline);
    text.remove_prefix(newline == std::string_view::npos ? text.size() : newline + 1);
    if (line.empty()) {
      continue;
    }
    const auto eq = line.find('=');
    if (eq == std::string_view::npos) {
      throw SnapshotError("manifest line without '=': " + std::string(line));
    }
    fields[std::string(line.substr(0, eq))] = std::string(line.substr(eq + 1));
  }

  if (Field(fields, "format") != kFormat) {
    throw SnapshotError("unsupported manifest format " + Field(fields, "format"));
  }
  SnapshotManifest manifest{};
  manifest.id = Field(fields, "id");
  manifest.label = Field(fields, "label");
  manifest.created_at_ms = ParseNumber<std::int64_t>(fields, "created_at_ms");
  const auto backend = ParseBackendKind(Field(fields, "backend"));
  if (!backend.has_value()) {
    throw SnapshotError("manifest names an unknown backend " + Field(fields, "backend"));
  }
  manifest.backend = *backend;
  manifest.dimensions = ParseNumber<int>(fields, "dimensions");
  manifest.doc_count = ParseNumber<std::uint64_t>(fields, "doc_count");
  manifest.chunk_count = ParseNumber<std::uint64_t>(fields, "chunk_count");
  manifest.index_sha256 = ParseDigest(fields, "index_sha256");
  manifest.registry_sha256 = ParseDigest(fields, "registry_sha256");
  return manifest;
}

}  // namespace docmem::backup
