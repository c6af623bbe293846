#include "ranking.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

namespace docmem::index {
namespace {

float Dot(std::span<const float> lhs, std::span<const float> rhs) {
  float dot = 0.0F;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    dot += lhs[i] * rhs[i];
  }
  return dot;
}

float Norm(std::span<const float> v) {
  return std::sqrt(std::max(Dot(v, v), 0.0F));
}

}  // namespace

float CosineSimilarity(std::span<const float> lhs, std::span<const float> rhs) {
  const auto lhs_norm = Norm(lhs);
  const auto rhs_norm = Norm(rhs);
  if (lhs_norm <= 0.0F || rhs_norm <= 0.0F) {
    return 0.0F;
  }
  return Dot(lhs, rhs) / (lhs_norm * rhs_norm);
}

std::vector<ScoredChunk> RankByCosine(const std::vector<const Chunk*>& ordered,
                                      const std::vector<float>& query,
                                      int top_k) {
  if (top_k <= 0 || ordered.empty()) {
    return {};
  }
  std::vector<std::pair<std::size_t, float>> scored{};
  scored.reserve(ordered.size());
  for (std::size_t i = 0; i < ordered.size(); ++i) {
    scored.emplace_back(i, CosineSimilarity(query, ordered[i]->vector));
  }
  const auto keep = std::min<std::size_t>(scored.size(), static_cast<std::size_t>(top_k));
  std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(keep), scored.end(),
                    [](const auto& lhs, const auto& rhs) {
                      if (lhs.second != rhs.second) {
                        return lhs.second > rhs.second;
                      }
                      return lhs.first < rhs.first;
                    });
  std::vector<ScoredChunk> out{};
  out.reserve(keep);
  for (std::size_t i = 0; i < keep; ++i) {
    out.push_back(ScoredChunk{.chunk = *ordered[scored[i].first], .score = scored[i].second});
  }
  return out;
}

}  // namespace docmem::index
