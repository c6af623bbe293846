#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace docmem::core {

using Sha256Digest = std::array<std::byte, 32>;

class Sha256 {
 public:
  Sha256();

  void Update(std::span<const std::byte> bytes);
  void Update(std::string_view text);
  [[nodiscard]] Sha256Digest Finalize();

 private:
  void Absorb(const std::uint8_t* data, std::size_t length);

  std::array<std::uint32_t, 8> state_{};
  std::array<std::uint8_t, 64> block_{};
  std::size_t block_fill_ = 0;
  std::uint64_t total_bytes_ = 0;
  bool finalized_ = false;
};

[[nodiscard]] Sha256Digest HashBytes(std::span<const std::byte> bytes);
[[nodiscard]] Sha256Digest HashText(std::string_view text);
[[nodiscard]] std::string ToHex(std::span<const std::byte> bytes);

}  // namespace docmem::core
