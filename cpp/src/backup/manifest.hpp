#pragma once

#include "docmem/types.hpp"

#include <string>
#include <string_view>

namespace docmem::backup {

// One "key=value" per line, starting with "format=1".
[[nodiscard]] std::string EncodeManifest(const SnapshotManifest& manifest);

// Throws SnapshotError on a missing key, unknown format or bad value.
[[nodiscard]] SnapshotManifest DecodeManifest(std::string_view text);

}  // namespace docmem::backup
