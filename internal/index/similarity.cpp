#include "similarity.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace siros::index {

double CosineDistance(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size()) {
    throw std::invalid_argument("cosine distance: dimension mismatch " + std::to_string(a.size()) + " vs " + std::to_string(b.size()));
  }

  double dot    = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }

  if (norm_a == 0.0 || norm_b == 0.0) {
    return 1.0;
  }

  const double cosine = std::clamp(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)), -1.0, 1.0);
  return 1.0 - cosine;
}

bool RanksBefore(const db::NeighborRecord& a, const db::NeighborRecord& b) {
  if (a.distance != b.distance) return a.distance < b.distance;
  if (a.record.created_at_ms != b.record.created_at_ms) return a.record.created_at_ms > b.record.created_at_ms;
  return a.record.id < b.record.id;
}

std::vector<db::NeighborRecord> RankNearest(std::vector<db::model::ResourceRecord> candidates, const std::vector<float>& query, std::size_t k,
                                            std::optional<double> max_distance) {
  std::vector<db::NeighborRecord> scored;
  scored.reserve(candidates.size());
  for (auto& record : candidates) {
    if (record.vector.empty()) continue;
    const double distance = CosineDistance(query, record.vector);
    if (max_distance && distance > *max_distance) continue;
    scored.push_back(db::NeighborRecord{std::move(record), distance});
  }

  const auto keep = std::min(k, scored.size());
  std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(keep), scored.end(), RanksBefore);
  scored.resize(keep);
  return scored;
}

} // namespace siros::index
