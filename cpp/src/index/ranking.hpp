#pragma once

#include "docmem/types.hpp"

#include <span>
#include <vector>

namespace docmem::index {

[[nodiscard]] float CosineSimilarity(std::span<const float> lhs, std::span<const float> rhs);

// Scores `ordered` (insertion order) against query and keeps the best top_k.
// Equal scores keep insertion order.
[[nodiscard]] std::vector<ScoredChunk> RankByCosine(const std::vector<const Chunk*>& ordered,
                                                    const std::vector<float>& query,
                                                    int top_k);

}  // namespace docmem::index
