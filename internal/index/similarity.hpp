#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "internal/db/api/types.hpp"

namespace siros::index {

/*
  Exact cosine-distance ranking shared by the backends that have no
  native vector index (memory, sqlite).

  distance = 1 - cos(a, b), in [0, 2]. A zero-norm operand has
  distance 1.0 to everything.
*/

// Throws std::invalid_argument when the dimensions differ.
double CosineDistance(const std::vector<float>& a, const std::vector<float>& b);

// Strict weak order: distance asc, created_at desc, id asc.
bool RanksBefore(const db::NeighborRecord& a, const db::NeighborRecord& b);

// Scores every candidate against query and keeps the best k in rank order.
// Candidates without a vector, or farther than max_distance, are skipped.
std::vector<db::NeighborRecord> RankNearest(std::vector<db::model::ResourceRecord> candidates, const std::vector<float>& query, std::size_t k,
                                            std::optional<double> max_distance = std::nullopt);

} // namespace siros::index
