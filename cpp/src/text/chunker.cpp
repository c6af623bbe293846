#include "docmem/chunker.hpp"
#include "docmem/errors.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace docmem {
namespace {

bool IsSpace(char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool IsSentenceEnd(char ch) {
  return ch == '.' || ch == '!' || ch == '?';
}

// Break rules, strongest first. A break at `pos` ends the window at [.., pos).
enum class BreakRule {
  kParagraph,
  kLine,
  kSentence,
  kWord,
};

bool IsBreakAt(const std::string& text, std::size_t pos, BreakRule rule) {
  const bool at_end = pos >= text.size();
  switch (rule) {
    case BreakRule::kParagraph:
      return pos >= 2 && text[pos - 1] == '\n' && text[pos - 2] == '\n';
    case BreakRule::kLine:
      return pos >= 1 && text[pos - 1] == '\n';
    case BreakRule::kSentence:
      return pos >= 1 && IsSentenceEnd(text[pos - 1]) && (at_end || IsSpace(text[pos]));
    case BreakRule::kWord:
      return pos >= 1 && (IsSpace(text[pos - 1]) || at_end || IsSpace(text[pos]));
  }
  return false;
}

// Picks the end of the window within [lo, hi], preferring the strongest rule
// and, within a rule, the longest window. Falls back to a hard cut at hi.
std::size_t FindBreak(const std::string& text, std::size_t lo, std::size_t hi) {
  for (const auto rule : {BreakRule::kParagraph, BreakRule::kLine, BreakRule::kSentence, BreakRule::kWord}) {
    for (std::size_t pos = hi; pos >= lo && pos > 0; --pos) {
      if (IsBreakAt(text, pos, rule)) {
        return pos;
      }
    }
  }
  return hi;
}

// Moves a mid-word position forward to the next word start, bounded by limit.
// Returns pos unchanged when no boundary exists before limit.
std::size_t SnapToWordStart(const std::string& text, std::size_t pos, std::size_t limit) {
  if (pos == 0 || pos >= text.size() || IsSpace(text[pos - 1]) || IsSpace(text[pos])) {
    return pos;
  }
  std::size_t cursor = pos;
  while (cursor < limit && !IsSpace(text[cursor])) {
    ++cursor;
  }
  return cursor < limit ? cursor : pos;
}

}  // namespace

ChunkSequence::ChunkSequence(std::shared_ptr<const std::string> text, ChunkingConfig config)
    : text_(std::move(text)), config_(config) {}

std::optional<TextWindow> ChunkSequence::Next() {
  if (done_) {
    return std::nullopt;
  }
  const auto& text = *text_;
  std::size_t start = cursor_;
  while (start < text.size() && IsSpace(text[start])) {
    ++start;
  }
  if (start >= text.size()) {
    done_ = true;
    return std::nullopt;
  }

  std::size_t end = text.size();
  if (text.size() - start > config_.chunk_size) {
    const std::size_t limit = start + config_.chunk_size;
    // Ending past start + overlap keeps the next window strictly ahead.
    const std::size_t min_end = start + config_.chunk_overlap + 1;
    end = FindBreak(text, min_end, limit);
  }

  std::size_t trimmed_end = end;
  while (trimmed_end > start && IsSpace(text[trimmed_end - 1])) {
    --trimmed_end;
  }

  if (end >= text.size()) {
    done_ = true;
  } else {
    const std::size_t next = end - config_.chunk_overlap;
    cursor_ = SnapToWordStart(text, next, end);
  }

  return TextWindow{
      .text = text.substr(start, trimmed_end - start),
      .start = start,
      .end = trimmed_end,
  };
}

void ChunkSequence::Reset() {
  cursor_ = 0;
  done_ = false;
}

std::vector<TextWindow> ChunkSequence::Collect() {
  Reset();
  std::vector<TextWindow> out{};
  while (auto window = Next()) {
    out.push_back(std::move(*window));
  }
  return out;
}

Chunker::Chunker(ChunkingConfig config) : config_(config) {
  if (config_.chunk_size == 0) {
    throw ChunkingError("chunk_size must be positive");
  }
  if (config_.chunk_overlap >= config_.chunk_size) {
    throw ChunkingError("chunk_overlap must be smaller than chunk_size");
  }
}

ChunkSequence Chunker::Split(std::string text) const {
  const bool blank = std::all_of(text.begin(), text.end(), [](char ch) { return IsSpace(ch); });
  if (blank) {
    throw ChunkingError("source text is empty");
  }
  return ChunkSequence(std::make_shared<const std::string>(std::move(text)), config_);
}

}  // namespace docmem
