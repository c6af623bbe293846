#include "docmem/fingerprint.hpp"

#include "../core/sha256.hpp"

#include <cctype>
#include <cstdint>
#include <string>

namespace docmem {
namespace {

int HexValue(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string NormalizeForFingerprint(std::string_view text) {
  std::string out{};
  out.reserve(text.size());
  bool pending_space = false;
  for (const unsigned char ch : text) {
    if (std::isspace(ch) != 0) {
      pending_space = !out.empty();
      continue;
    }
    if (ch < 0x20U || ch == 0x7FU) {
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(std::tolower(ch)));
  }
  return out;
}

Fingerprint ComputeFingerprint(std::string_view text) {
  return core::HashText(NormalizeForFingerprint(text));
}

std::string FingerprintToHex(const Fingerprint& fingerprint) {
  return core::ToHex(fingerprint);
}

std::optional<Fingerprint> FingerprintFromHex(std::string_view hex) {
  Fingerprint out{};
  if (hex.size() != out.size() * 2) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < out.size(); ++i) {
    const int hi = HexValue(hex[2 * i]);
    const int lo = HexValue(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out[i] = static_cast<std::byte>((hi << 4) | lo);
  }
  return out;
}

}  // namespace docmem
