#include "docmem/embeddings.hpp"
#include "docmem/errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace docmem {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens{};
  std::string current{};
  for (const unsigned char ch : text) {
    if (std::isalnum(ch) != 0) {
      current.push_back(static_cast<char>(std::tolower(ch)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

std::uint64_t HashToken(std::string_view token) {
  std::uint64_t hash = kFnvOffset;
  for (const unsigned char ch : token) {
    hash ^= static_cast<std::uint64_t>(ch);
    hash *= kFnvPrime;
  }
  return hash;
}

void NormalizeL2(std::vector<float>& v) {
  double sum_sq = 0.0;
  for (const auto x : v) {
    sum_sq += static_cast<double>(x) * static_cast<double>(x);
  }
  if (sum_sq <= 0.0) {
    return;
  }
  const auto inv_norm = 1.0 / std::sqrt(sum_sq);
  for (auto& x : v) {
    x = static_cast<float>(static_cast<double>(x) * inv_norm);
  }
}

}  // namespace

HashingEmbedder::HashingEmbedder(int dimensions, std::size_t memoization_capacity)
    : dimensions_(dimensions), memoization_capacity_(memoization_capacity) {
  if (dimensions_ <= 0) {
    throw EmbeddingError("embedding dimensions must be positive");
  }
}

EmbeddingIdentity HashingEmbedder::identity() const {
  return EmbeddingIdentity{
      .provider = "docmem",
      .model = "feature-hash",
      .dimensions = dimensions_,
  };
}

std::vector<std::vector<float>> HashingEmbedder::Embed(const std::vector<std::string>& texts) {
  if (texts.empty()) {
    throw EmbeddingError("embed called with no texts");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::vector<float>> out{};
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(EmbedOne(text));
  }
  return out;
}

std::vector<float> HashingEmbedder::EmbedOne(const std::string& text) {
  if (memoization_capacity_ > 0) {
    const auto cached = memoized_embeddings_.find(text);
    if (cached != memoized_embeddings_.end()) {
      return cached->second;
    }
  }

  std::vector<float> embedding(static_cast<std::size_t>(dimensions_), 0.0F);
  for (const auto& token : Tokenize(text)) {
    const auto hash = HashToken(token);
    const auto index = static_cast<std::size_t>(hash % static_cast<std::uint64_t>(dimensions_));
    const float sign = ((hash >> 63U) != 0U) ? -1.0F : 1.0F;
    embedding[index] += sign;
  }
  NormalizeL2(embedding);

  if (memoization_capacity_ > 0) {
    while (memoized_embeddings_.size() >= memoization_capacity_ && !memoization_order_.empty()) {
      memoized_embeddings_.erase(memoization_order_.front());
      memoization_order_.pop_front();
    }
    memoization_order_.push_back(text);
    memoized_embeddings_[text] = embedding;
  }
  return embedding;
}

std::size_t HashingEmbedder::cache_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return memoized_embeddings_.size();
}

}  // namespace docmem
