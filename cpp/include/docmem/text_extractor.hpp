#pragma once

#include "docmem/types.hpp"

#include <cstddef>
#include <span>
#include <string>

namespace docmem {

struct ExtractedText {
  std::string text;
  Metadata source_metadata;
};

// Turns raw upload bytes into text. Implementations throw ExtractionError for
// content they cannot read. Must be safe to call from several threads.
class TextExtractor {
 public:
  virtual ~TextExtractor() = default;

  virtual ExtractedText Extract(std::span<const std::byte> bytes, FileType type, const std::string& filename) = 0;
};

// Reads UTF-8 text files. PDF and DOCX are rejected with ExtractionError; hosts
// that need them inject their own extractor.
class PlainTextExtractor final : public TextExtractor {
 public:
  ExtractedText Extract(std::span<const std::byte> bytes, FileType type, const std::string& filename) override;
};

}  // namespace docmem
