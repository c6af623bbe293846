#include "byte_codec.hpp"

#include "sha256.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <utility>

namespace docmem::core {

void ByteWriter::AppendU8(std::uint8_t value) {
  out_.push_back(static_cast<std::byte>(value));
}

void ByteWriter::AppendU16(std::uint16_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out_.push_back(static_cast<std::byte>((value >> (8U * i)) & 0xFFU));
  }
}

void ByteWriter::AppendU32(std::uint32_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out_.push_back(static_cast<std::byte>((value >> (8U * i)) & 0xFFU));
  }
}

void ByteWriter::AppendU64(std::uint64_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out_.push_back(static_cast<std::byte>((value >> (8U * i)) & 0xFFU));
  }
}

void ByteWriter::AppendI64(std::int64_t value) {
  AppendU64(static_cast<std::uint64_t>(value));
}

void ByteWriter::AppendF32(float value) {
  std::uint32_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  AppendU32(bits);
}

void ByteWriter::AppendString(std::string_view value) {
  if (value.size() > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
    throw std::runtime_error("byte_codec: string exceeds uint32 length");
  }
  AppendU32(static_cast<std::uint32_t>(value.size()));
  for (const char ch : value) {
    out_.push_back(static_cast<std::byte>(static_cast<unsigned char>(ch)));
  }
}

void ByteWriter::AppendRaw(std::span<const std::byte> bytes) {
  out_.insert(out_.end(), bytes.begin(), bytes.end());
}

void ByteWriter::AppendChecksum() {
  const auto digest = HashBytes(out_);
  out_.insert(out_.end(), digest.begin(), digest.end());
}

ByteReader::ByteReader(std::span<const std::byte> bytes, std::string context)
    : bytes_(bytes), context_(std::move(context)) {}

void ByteReader::Require(std::size_t length, const char* what) const {
  if (length > remaining()) {
    throw std::runtime_error(context_ + ": truncated " + what);
  }
}

std::uint8_t ByteReader::ReadU8() {
  Require(1, "u8");
  return std::to_integer<std::uint8_t>(bytes_[cursor_++]);
}

std::uint16_t ByteReader::ReadU16() {
  Require(sizeof(std::uint16_t), "u16");
  std::uint16_t out = 0;
  for (std::size_t i = 0; i < sizeof(out); ++i) {
    out |= static_cast<std::uint16_t>(std::to_integer<std::uint8_t>(bytes_[cursor_ + i]) << (8U * i));
  }
  cursor_ += sizeof(out);
  return out;
}

std::uint32_t ByteReader::ReadU32() {
  Require(sizeof(std::uint32_t), "u32");
  std::uint32_t out = 0;
  for (std::size_t i = 0; i < sizeof(out); ++i) {
    out |= static_cast<std::uint32_t>(std::to_integer<std::uint8_t>(bytes_[cursor_ + i])) << (8U * i);
  }
  cursor_ += sizeof(out);
  return out;
}

std::uint64_t ByteReader::ReadU64() {
  Require(sizeof(std::uint64_t), "u64");
  std::uint64_t out = 0;
  for (std::size_t i = 0; i < sizeof(out); ++i) {
    out |= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(bytes_[cursor_ + i])) << (8U * i);
  }
  cursor_ += sizeof(out);
  return out;
}

std::int64_t ByteReader::ReadI64() {
  return static_cast<std::int64_t>(ReadU64());
}

float ByteReader::ReadF32() {
  const auto bits = ReadU32();
  float value = 0.0F;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

std::string ByteReader::ReadString() {
  const auto length = ReadU32();
  Require(length, "string body");
  std::string out{};
  out.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    out.push_back(static_cast<char>(std::to_integer<unsigned char>(bytes_[cursor_ + i])));
  }
  cursor_ += length;
  return out;
}

std::vector<std::byte> ByteReader::ReadRaw(std::size_t length) {
  Require(length, "raw bytes");
  std::vector<std::byte> out(bytes_.begin() + static_cast<std::ptrdiff_t>(cursor_),
                             bytes_.begin() + static_cast<std::ptrdiff_t>(cursor_ + length));
  cursor_ += length;
  return out;
}

void ByteReader::ExpectEnd() const {
  if (remaining() != 0) {
    throw std::runtime_error(context_ + ": trailing bytes");
  }
}

std::span<const std::byte> VerifyChecksum(std::span<const std::byte> bytes, const std::string& context) {
  constexpr std::size_t kDigestSize = 32;
  if (bytes.size() < kDigestSize) {
    throw std::runtime_error(context + ": too small for checksum");
  }
  const auto body = bytes.first(bytes.size() - kDigestSize);
  const auto expected = bytes.last(kDigestSize);
  const auto actual = HashBytes(body);
  if (!std::equal(actual.begin(), actual.end(), expected.begin())) {
    throw std::runtime_error(context + ": checksum mismatch");
  }
  return body;
}

bool HasMagic(std::span<const std::byte> bytes, std::span<const std::byte> magic) {
  return bytes.size() >= magic.size() && std::equal(magic.begin(), magic.end(), bytes.begin());
}

}  // namespace docmem::core
