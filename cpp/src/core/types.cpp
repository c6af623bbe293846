#include "docmem/types.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <string>

namespace docmem {
namespace {

std::string LowerAscii(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return out;
}

bool EndsWith(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string_view ToString(FileType type) {
  switch (type) {
    case FileType::kPdf:
      return "pdf";
    case FileType::kTxt:
      return "txt";
    case FileType::kDocx:
      return "docx";
  }
  return "unknown";
}

std::string_view ToString(BackendKind kind) {
  switch (kind) {
    case BackendKind::kFlat:
      return "flat";
    case BackendKind::kDocument:
      return "document";
  }
  return "unknown";
}

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kValidation:
      return "validation";
    case ErrorKind::kChunking:
      return "chunking";
    case ErrorKind::kExtraction:
      return "extraction";
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kEmbedding:
      return "embedding";
    case ErrorKind::kRetrievalUnavailable:
      return "retrieval_unavailable";
    case ErrorKind::kIndexOperation:
      return "index_operation";
    case ErrorKind::kIndexCorrupted:
      return "index_corrupted";
    case ErrorKind::kSnapshot:
      return "snapshot";
    case ErrorKind::kRegistry:
      return "registry";
  }
  return "unknown";
}

std::optional<FileType> FileTypeFromFilename(std::string_view filename) {
  const auto lowered = LowerAscii(filename);
  if (EndsWith(lowered, ".pdf")) {
    return FileType::kPdf;
  }
  if (EndsWith(lowered, ".txt")) {
    return FileType::kTxt;
  }
  if (EndsWith(lowered, ".docx")) {
    return FileType::kDocx;
  }
  return std::nullopt;
}

std::optional<FileType> FileTypeFromMimeType(std::string_view mime_type) {
  const auto lowered = LowerAscii(mime_type);
  if (lowered == "application/pdf") {
    return FileType::kPdf;
  }
  if (lowered == "text/plain") {
    return FileType::kTxt;
  }
  if (lowered == "application/vnd.openxmlformats-officedocument.wordprocessingml.document") {
    return FileType::kDocx;
  }
  return std::nullopt;
}

std::optional<BackendKind> ParseBackendKind(std::string_view name) {
  const auto lowered = LowerAscii(name);
  if (lowered == "flat" || lowered == "faiss") {
    return BackendKind::kFlat;
  }
  if (lowered == "document" || lowered == "chroma") {
    return BackendKind::kDocument;
  }
  return std::nullopt;
}

std::int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string UtcTimestamp(std::int64_t millis) {
  const auto seconds = static_cast<std::time_t>(millis / 1000);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &utc);
  return buffer;
}

std::size_t EstimateTokens(std::string_view text) {
  return (text.size() + 3) / 4;
}

}  // namespace docmem
