#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace docmem {

struct EmbeddingIdentity {
  std::string provider;
  std::string model;
  int dimensions = 0;
};

// Deterministic text -> vector capability. Embed returns one vector of
// dimensions() floats per input, in input order, and throws EmbeddingError on
// empty input or provider failure. Implementations must be thread-safe.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  [[nodiscard]] virtual int dimensions() const = 0;
  [[nodiscard]] virtual EmbeddingIdentity identity() const = 0;
  virtual std::vector<std::vector<float>> Embed(const std::vector<std::string>& texts) = 0;
};

// Signed feature hashing of lowercase alphanumeric tokens, L2-normalized.
// Keeps a FIFO memo of recent texts.
class HashingEmbedder final : public EmbeddingProvider {
 public:
  explicit HashingEmbedder(int dimensions = 384, std::size_t memoization_capacity = 4096);

  [[nodiscard]] int dimensions() const override { return dimensions_; }
  [[nodiscard]] EmbeddingIdentity identity() const override;
  std::vector<std::vector<float>> Embed(const std::vector<std::string>& texts) override;
  [[nodiscard]] std::size_t cache_size() const;

 private:
  std::vector<float> EmbedOne(const std::string& text);

  int dimensions_ = 384;
  std::size_t memoization_capacity_ = 0;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::vector<float>> memoized_embeddings_{};
  std::deque<std::string> memoization_order_{};
};

}  // namespace docmem
