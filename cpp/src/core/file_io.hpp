#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace docmem::core {

[[nodiscard]] std::vector<std::byte> ReadFileBytes(const std::filesystem::path& path);

// Writes to "<path>.tmp" then renames over path, so readers see either the old
// or the new contents.
void WriteFileAtomic(const std::filesystem::path& path, std::span<const std::byte> bytes);

[[nodiscard]] std::uint64_t FileSizeOrZero(const std::filesystem::path& path);
[[nodiscard]] std::uint64_t DirectorySize(const std::filesystem::path& path);

}  // namespace docmem::core
