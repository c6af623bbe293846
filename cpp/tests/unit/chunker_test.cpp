#include "docmem/chunker.hpp"
#include "docmem/errors.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

namespace {

using docmem::tests::Require;
using docmem::tests::RequireThrows;

docmem::Chunker SmallChunker() {
  return docmem::Chunker(docmem::ChunkingConfig{.chunk_size = 50, .chunk_overlap = 10});
}

void ScenarioParagraphWindows() {
  docmem::tests::Log("scenario: paragraph windows");
  const std::string text =
      "Alpha notes cover the opening topic here.\n\n"
      "Beta notes explain the middle part.\n\n"
      "Gamma notes close it.";
  auto windows = SmallChunker().Split(text).Collect();
  Require(windows.size() == 3, "expected three windows");
  Require(windows[0].text == "Alpha notes cover the opening topic here.", "first window mismatch");
  Require(windows[0].start == 0 && windows[0].end == 41, "first window offsets mismatch");
  Require(windows[1].start == 36 && windows[1].end == 78, "second window offsets mismatch");
  Require(windows[2].text == "part.\n\nGamma notes close it.", "last window mismatch");
  Require(windows[2].end == text.size(), "last window must reach the end");
  for (const auto& window : windows) {
    Require(window.text.size() <= 50, "window exceeds chunk_size");
    Require(text.substr(window.start, window.end - window.start) == window.text, "offsets must address window text");
  }
}

void ScenarioCoverageAndOverlap() {
  docmem::tests::Log("scenario: coverage and overlap");
  std::string text{};
  for (int i = 0; i < 40; ++i) {
    text += "Sentence number " + std::to_string(i) + " talks about storage. ";
  }
  auto windows = SmallChunker().Split(text).Collect();
  Require(windows.size() > 10, "long text should produce many windows");
  Require(windows.front().start == 0, "first window starts at the first character");
  for (std::size_t i = 1; i < windows.size(); ++i) {
    Require(windows[i].start > windows[i - 1].start, "windows must advance");
    Require(windows[i].start <= windows[i - 1].end, "consecutive windows must leave no gap");
  }
  Require(windows.back().end == text.find_last_not_of(' ') + 1, "last window reaches the trimmed end");
}

void ScenarioOverlapTracksConfiguredWidth() {
  docmem::tests::Log("scenario: overlap width");
  constexpr std::size_t kSize = 200;
  constexpr std::size_t kOverlap = 50;
  // Longest word below, plus the space that precedes it.
  constexpr std::size_t kWordSlack = 9;
  std::string text{};
  for (int i = 0; i < 40; ++i) {
    text += "Sentence number " + std::to_string(i) + " talks about storage. ";
  }
  const docmem::Chunker chunker(docmem::ChunkingConfig{.chunk_size = kSize, .chunk_overlap = kOverlap});
  auto windows = chunker.Split(text).Collect();
  Require(windows.size() > 5, "long text should produce several windows");
  for (std::size_t i = 0; i < windows.size(); ++i) {
    Require(windows[i].text.size() <= kSize, "window exceeds chunk_size");
    if (i == 0) {
      continue;
    }
    Require(windows[i - 1].end > windows[i].start, "consecutive windows must overlap");
    const auto shared = windows[i - 1].end - windows[i].start;
    Require(shared <= kOverlap, "overlap exceeds chunk_overlap: " + std::to_string(shared));
    Require(shared + kWordSlack >= kOverlap, "overlap falls short by more than a word: " + std::to_string(shared));
  }
}

void ScenarioShortTextSingleWindow() {
  docmem::tests::Log("scenario: short text");
  auto windows = SmallChunker().Split("  tiny note  ").Collect();
  Require(windows.size() == 1, "short text yields a single window");
  Require(windows[0].text == "tiny note", "surrounding whitespace is trimmed");
  Require(windows[0].start == 2 && windows[0].end == 11, "trimmed window offsets mismatch");
}

void ScenarioHardCutWithoutBreaks() {
  docmem::tests::Log("scenario: hard cut");
  const std::string text(120, 'x');
  auto windows = SmallChunker().Split(text).Collect();
  Require(windows.size() == 3, "unbroken text is cut at chunk_size");
  Require(windows[0].end == 50, "first hard cut at chunk_size");
  Require(windows[1].start == 40, "second window starts overlap characters back");
}

void ScenarioRestartable() {
  docmem::tests::Log("scenario: restartable sequence");
  auto sequence = SmallChunker().Split("one two three four five six seven eight nine ten eleven twelve thirteen");
  const auto first = sequence.Next();
  Require(first.has_value(), "sequence must yield a first window");
  const auto all = sequence.Collect();
  Require(!all.empty() && all.front().text == first->text, "Collect restarts from the first window");
  sequence.Reset();
  const auto again = sequence.Next();
  Require(again.has_value() && again->start == first->start, "Reset yields identical windows");
}

void ScenarioRejectsBadInput() {
  docmem::tests::Log("scenario: invalid input");
  RequireThrows<docmem::ChunkingError>([] { (void)SmallChunker().Split(" \n\t "); }, "blank text must be rejected");
  RequireThrows<docmem::ChunkingError>(
      [] { docmem::Chunker(docmem::ChunkingConfig{.chunk_size = 10, .chunk_overlap = 10}); },
      "overlap equal to size must be rejected");
  RequireThrows<docmem::ValidationError>(
      [] { docmem::Chunker(docmem::ChunkingConfig{.chunk_size = 0, .chunk_overlap = 0}); },
      "zero chunk_size must be rejected as a validation error");
}

}  // namespace

int main() {
  try {
    docmem::tests::Log("chunker_test: start");
    ScenarioParagraphWindows();
    ScenarioCoverageAndOverlap();
    ScenarioOverlapTracksConfiguredWidth();
    ScenarioShortTextSingleWindow();
    ScenarioHardCutWithoutBreaks();
    ScenarioRestartable();
    ScenarioRejectsBadInput();
    docmem::tests::Log("chunker_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    docmem::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
