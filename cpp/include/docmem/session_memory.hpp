#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace docmem {

struct SessionMessage {
  std::string role;
  std::string content;
  std::int64_t timestamp_ms = 0;
};

// Per-session bounded chat history, independent of the document store.
// Oldest messages are evicted once a session holds `capacity` messages.
class SessionMemory {
 public:
  explicit SessionMemory(std::size_t capacity_per_session = 50);

  void Append(const std::string& session_id, std::string role, std::string content);
  // The most recent `limit` messages, oldest first. limit == 0 returns all.
  [[nodiscard]] std::vector<SessionMessage> History(const std::string& session_id, std::size_t limit = 0) const;
  bool Clear(const std::string& session_id);
  void ClearAll();
  // "Memory contains N messages", or "Memory is empty".
  [[nodiscard]] std::string Summary(const std::string& session_id) const;
  [[nodiscard]] std::size_t SessionCount() const;
  [[nodiscard]] std::size_t capacity() const { return capacity_; }

 private:
  std::size_t capacity_ = 0;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::deque<SessionMessage>> sessions_;
};

}  // namespace docmem
