#include "docmem/text_extractor.hpp"
#include "docmem/errors.hpp"

#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

namespace docmem {
namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

// Accepts well-formed UTF-8 only; overlong forms and surrogates are rejected.
bool IsValidUtf8(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t extra = 0;
    std::uint32_t code_point = 0;
    if (lead < 0x80U) {
      ++i;
      continue;
    }
    if ((lead & 0xE0U) == 0xC0U) {
      extra = 1;
      code_point = lead & 0x1FU;
    } else if ((lead & 0xF0U) == 0xE0U) {
      extra = 2;
      code_point = lead & 0x0FU;
    } else if ((lead & 0xF8U) == 0xF0U) {
      extra = 3;
      code_point = lead & 0x07U;
    } else {
      return false;
    }
    if (i + extra >= text.size()) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cont = static_cast<unsigned char>(text[i + k]);
      if ((cont & 0xC0U) != 0x80U) {
        return false;
      }
      code_point = (code_point << 6U) | (cont & 0x3FU);
    }
    static constexpr std::uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
    if (code_point < kMinForLength[extra] || code_point > 0x10FFFFU ||
        (code_point >= 0xD800U && code_point <= 0xDFFFU)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

std::string NormalizeNewlines(std::string_view text) {
  std::string out{};
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r') {
      out.push_back('\n');
      if (i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      continue;
    }
    out.push_back(text[i]);
  }
  return out;
}

std::string_view Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return text.substr(begin, end - begin);
}

}  // namespace

ExtractedText PlainTextExtractor::Extract(std::span<const std::byte> bytes,
                                          FileType type,
                                          const std::string& filename) {
  if (type != FileType::kTxt) {
    throw ExtractionError("no extractor installed for " + std::string(ToString(type)) + " file '" + filename + "'");
  }
  std::string_view raw(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  if (raw.starts_with(kUtf8Bom)) {
    raw.remove_prefix(kUtf8Bom.size());
  }
  if (!IsValidUtf8(raw)) {
    throw ExtractionError("file '" + filename + "' is not valid UTF-8 text");
  }
  const auto normalized = NormalizeNewlines(raw);
  ExtractedText out{};
  out.text = std::string(Trim(normalized));
  out.source_metadata["source"] = filename;
  out.source_metadata["file_type"] = std::string(ToString(type));
  out.source_metadata["encoding"] = "utf-8";
  return out;
}

}  // namespace docmem
