#include "sha256.hpp"

#include <algorithm>
#include <stdexcept>

namespace docmem::core {
namespace {

constexpr std::array<std::uint32_t, 64> kK = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

constexpr std::uint32_t Rotr(std::uint32_t value, std::uint32_t bits) {
  return (value >> bits) | (value << (32U - bits));
}

void CompressBlock(std::array<std::uint32_t, 8>& state, const std::uint8_t* block) {
  std::array<std::uint32_t, 64> w{};
  for (std::size_t i = 0; i < 16; ++i) {
    w[i] = (static_cast<std::uint32_t>(block[i * 4]) << 24U) |
           (static_cast<std::uint32_t>(block[i * 4 + 1]) << 16U) |
           (static_cast<std::uint32_t>(block[i * 4 + 2]) << 8U) |
           static_cast<std::uint32_t>(block[i * 4 + 3]);
  }
  for (std::size_t i = 16; i < w.size(); ++i) {
    const auto sigma0 = Rotr(w[i - 15], 7) ^ Rotr(w[i - 15], 18) ^ (w[i - 15] >> 3U);
    const auto sigma1 = Rotr(w[i - 2], 17) ^ Rotr(w[i - 2], 19) ^ (w[i - 2] >> 10U);
    w[i] = w[i - 16] + sigma0 + w[i - 7] + sigma1;
  }

  auto working = state;
  for (std::size_t i = 0; i < w.size(); ++i) {
    auto& [a, b, c, d, e, f, g, h] = working;
    const auto big_sigma1 = Rotr(e, 6) ^ Rotr(e, 11) ^ Rotr(e, 25);
    const auto choose = (e & f) ^ (~e & g);
    const auto t1 = h + big_sigma1 + choose + kK[i] + w[i];
    const auto big_sigma0 = Rotr(a, 2) ^ Rotr(a, 13) ^ Rotr(a, 22);
    const auto majority = (a & b) ^ (a & c) ^ (b & c);
    const auto t2 = big_sigma0 + majority;
    h = g;
    g = f;
    f = e;
    e = d + t1;
    d = c;
    c = b;
    b = a;
    a = t1 + t2;
  }
  for (std::size_t i = 0; i < state.size(); ++i) {
    state[i] += working[i];
  }
}

}  // namespace

Sha256::Sha256()
    : state_({0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19}) {}

void Sha256::Update(std::span<const std::byte> bytes) {
  Absorb(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
}

void Sha256::Update(std::string_view text) {
  Absorb(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

void Sha256::Absorb(const std::uint8_t* data, std::size_t length) {
  if (finalized_) {
    throw std::logic_error("Sha256::Update after Finalize");
  }
  total_bytes_ += length;
  for (std::size_t i = 0; i < length; ++i) {
    block_[block_fill_++] = data[i];
    if (block_fill_ == block_.size()) {
      CompressBlock(state_, block_.data());
      block_fill_ = 0;
    }
  }
}

Sha256Digest Sha256::Finalize() {
  if (!finalized_) {
    const std::uint64_t bit_count = total_bytes_ * 8U;
    block_[block_fill_++] = 0x80;
    if (block_fill_ > 56) {
      std::fill(block_.begin() + static_cast<std::ptrdiff_t>(block_fill_), block_.end(), std::uint8_t{0});
      CompressBlock(state_, block_.data());
      block_fill_ = 0;
    }
    std::fill(block_.begin() + static_cast<std::ptrdiff_t>(block_fill_), block_.begin() + 56, std::uint8_t{0});
    for (std::size_t i = 0; i < 8; ++i) {
      block_[56 + i] = static_cast<std::uint8_t>((bit_count >> (8U * (7 - i))) & 0xFFU);
    }
    CompressBlock(state_, block_.data());
    block_fill_ = 0;
    finalized_ = true;
  }

  Sha256Digest digest{};
  for (std::size_t i = 0; i < state_.size(); ++i) {
    for (std::size_t j = 0; j < 4; ++j) {
      digest[i * 4 + j] = static_cast<std::byte>((state_[i] >> (8U * (3 - j))) & 0xFFU);
    }
  }
  return digest;
}

Sha256Digest HashBytes(std::span<const std::byte> bytes) {
  Sha256 hasher;
  hasher.Update(bytes);
  return hasher.Finalize();
}

Sha256Digest HashText(std::string_view text) {
  Sha256 hasher;
  hasher.Update(text);
  return hasher.Finalize();
}

std::string ToHex(std::span<const std::byte> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out{};
  out.reserve(bytes.size() * 2);
  for (const auto b : bytes) {
    const auto value = std::to_integer<std::uint8_t>(b);
    out.push_back(kDigits[value >> 4U]);
    out.push_back(kDigits[value & 0x0FU]);
  }
  return out;
}

}  // namespace docmem::core
