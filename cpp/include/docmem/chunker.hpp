#pragma once

#include "docmem/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docmem {

struct TextWindow {
  std::string text;
  std::size_t start = 0;
  std::size_t end = 0;
};

// Lazily produced windows over one source text. Finite; Reset() restarts from
// the first window and yields identical windows again.
class ChunkSequence {
 public:
  std::optional<TextWindow> Next();
  void Reset();
  [[nodiscard]] std::vector<TextWindow> Collect();

  [[nodiscard]] const std::string& source() const { return *text_; }

 private:
  friend class Chunker;
  ChunkSequence(std::shared_ptr<const std::string> text, ChunkingConfig config);

  std::shared_ptr<const std::string> text_;
  ChunkingConfig config_;
  std::size_t cursor_ = 0;
  bool done_ = false;
};

class Chunker {
 public:
  // Throws ChunkingError unless 0 <= chunk_overlap < chunk_size.
  explicit Chunker(ChunkingConfig config);

  // Throws ChunkingError when text is empty or whitespace only.
  [[nodiscard]] ChunkSequence Split(std::string text) const;

  [[nodiscard]] const ChunkingConfig& config() const { return config_; }

 private:
  ChunkingConfig config_;
};

}  // namespace docmem
