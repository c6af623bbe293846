#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace docmem::core {

// Little-endian record writer; strings are u32 length-prefixed.
class ByteWriter {
 public:
  void AppendU8(std::uint8_t value);
  void AppendU16(std::uint16_t value);
  void AppendU32(std::uint32_t value);
  void AppendU64(std::uint64_t value);
  void AppendI64(std::int64_t value);
  void AppendF32(float value);
  void AppendString(std::string_view value);
  void AppendRaw(std::span<const std::byte> bytes);

  // Appends SHA-256 of everything written so far.
  void AppendChecksum();

  [[nodiscard]] const std::vector<std::byte>& bytes() const { return out_; }
  [[nodiscard]] std::vector<std::byte> Take() { return std::move(out_); }

 private:
  std::vector<std::byte> out_;
};

class ByteReader {
 public:
  ByteReader(std::span<const std::byte> bytes, std::string context);

  std::uint8_t ReadU8();
  std::uint16_t ReadU16();
  std::uint32_t ReadU32();
  std::uint64_t ReadU64();
  std::int64_t ReadI64();
  float ReadF32();
  std::string ReadString();
  std::vector<std::byte> ReadRaw(std::size_t length);

  [[nodiscard]] std::size_t remaining() const { return bytes_.size() - cursor_; }
  void ExpectEnd() const;

 private:
  void Require(std::size_t length, const char* what) const;

  std::span<const std::byte> bytes_;
  std::size_t cursor_ = 0;
  std::string context_;
};

// Verifies the trailing SHA-256 written by AppendChecksum and returns the body.
// Throws std::runtime_error on mismatch or truncation.
std::span<const std::byte> VerifyChecksum(std::span<const std::byte> bytes, const std::string& context);

bool HasMagic(std::span<const std::byte> bytes, std::span<const std::byte> magic);

template <std::size_t N>
constexpr std::array<std::byte, N - 1> MakeMagic(const char (&text)[N]) {
  std::array<std::byte, N - 1> out{};
  for (std::size_t i = 0; i + 1 < N; ++i) {
    out[i] = static_cast<std::byte>(text[i]);
  }
  return out;
}

}  // namespace docmem::core
