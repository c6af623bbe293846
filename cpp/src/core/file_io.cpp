#include "file_io.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace docmem::core {
namespace {

std::runtime_error FileError(const std::string& message) {
  return std::runtime_error("file_io: " + message);
}

}  // namespace

std::vector<std::byte> ReadFileBytes(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in) {
    throw FileError("failed to open file for read: " + path.string());
  }
  const auto size = in.tellg();
  if (size < 0) {
    throw FileError("failed to read file size: " + path.string());
  }
  in.seekg(0, std::ios::beg);
  std::vector<std::byte> out(static_cast<std::size_t>(size));
  if (!out.empty()) {
    in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    if (in.gcount() != static_cast<std::streamsize>(out.size())) {
      throw FileError("short read: " + path.string());
    }
  }
  return out;
}

void WriteFileAtomic(const std::filesystem::path& path, std::span<const std::byte> bytes) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw FileError("failed to create directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  auto temp_path = path;
  temp_path += ".tmp";
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw FileError("failed to open file for write: " + temp_path.string());
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      throw FileError("failed to write bytes: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw FileError("failed to rename " + temp_path.string() + ": " + ec.message());
  }
}

std::uint64_t FileSizeOrZero(const std::filesystem::path& path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<std::uint64_t>(size);
}

std::uint64_t DirectorySize(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    return 0;
  }
  std::uint64_t total = 0;
  for (std::filesystem::recursive_directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec)) {
      total += FileSizeOrZero(it->path());
    }
  }
  return total;
}

}  // namespace docmem::core
