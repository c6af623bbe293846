#pragma once

#include "docmem/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace docmem {

// Collapses whitespace runs to one space, drops control characters, lowercases
// ASCII and trims both ends. Non-ASCII bytes pass through unchanged.
[[nodiscard]] std::string NormalizeForFingerprint(std::string_view text);

// SHA-256 of NormalizeForFingerprint(text).
[[nodiscard]] Fingerprint ComputeFingerprint(std::string_view text);

[[nodiscard]] std::string FingerprintToHex(const Fingerprint& fingerprint);
[[nodiscard]] std::optional<Fingerprint> FingerprintFromHex(std::string_view hex);

}  // namespace docmem
