#include "docmem/session_memory.hpp"

#include "docmem/errors.hpp"
#include "docmem/types.hpp"

#include <utility>

namespace docmem {

SessionMemory::SessionMemory(std::size_t capacity_per_session) : capacity_(capacity_per_session) {
  if (capacity_ == 0) {
    throw ValidationError("session capacity must be positive");
  }
}

void SessionMemory::Append(const std::string& session_id, std::string role, std::string content) {
  if (session_id.empty()) {
    throw ValidationError("session id must be non-empty");
  }
  if (role.empty()) {
    throw ValidationError("message role must be non-empty");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto& history = sessions_[session_id];
  history.push_back(SessionMessage{.role = std::move(role), .content = std::move(content), .timestamp_ms = NowMillis()});
  while (history.size() > capacity_) {
    history.pop_front();
  }
}

std::vector<SessionMessage> SessionMemory::History(const std::string& session_id, std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return {};
  }
  const auto& history = it->second;
  const auto count = (limit == 0 || limit > history.size()) ? history.size() : limit;
  return std::vector<SessionMessage>(history.end() - static_cast<std::ptrdiff_t>(count), history.end());
}

bool SessionMemory::Clear(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.erase(session_id) > 0;
}

void SessionMemory::ClearAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_.clear();
}

std::string SessionMemory::Summary(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end() || it->second.empty()) {
    return "Memory is empty";
  }
  return "Memory contains " + std::to_string(it->second.size()) + " messages";
}

std::size_t SessionMemory::SessionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

}  // namespace docmem
