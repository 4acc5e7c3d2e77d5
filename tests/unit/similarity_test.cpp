#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "internal/index/similarity.hpp"

namespace {

using siros::db::model::ResourceRecord;
using siros::index::CosineDistance;
using siros::index::RankNearest;

ResourceRecord Record(const std::string& id, std::vector<float> vector, uint64_t created_at_ms) {
  ResourceRecord record;
  record.id            = id;
  record.vector        = std::move(vector);
  record.created_at_ms = created_at_ms;
  return record;
}

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestCosineDistance() {
  assert(Near(CosineDistance({1, 0}, {1, 0}), 0.0));
  assert(Near(CosineDistance({1, 0}, {0, 1}), 1.0));
  assert(Near(CosineDistance({1, 0}, {-1, 0}), 2.0));
  assert(Near(CosineDistance({2, 0}, {5, 0}), 0.0));
}

void TestZeroNormRanksAtOne() {
  assert(Near(CosineDistance({0, 0}, {1, 0}), 1.0));
  assert(Near(CosineDistance({1, 0}, {0, 0}), 1.0));
}

void TestDimensionMismatchThrows() {
  bool threw = false;
  try {
    CosineDistance({1, 0}, {1, 0, 0});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestRankReturnsMinKInOrder() {
  std::vector<ResourceRecord> candidates = {
      Record("a", {1, 0}, 1),
      Record("b", {0.9f, 0.1f}, 2),
      Record("c", {0, 1}, 3),
      Record("d", {}, 4), // unvectorized, never ranked
      Record("e", {-1, 0}, 5),
  };

  auto top2 = RankNearest(candidates, {1, 0}, 2);
  assert(top2.size() == 2);
  assert(top2[0].record.id == "a");
  assert(top2[1].record.id == "b");

  auto all = RankNearest(candidates, {1, 0}, 10);
  assert(all.size() == 4);
  for (std::size_t i = 1; i < all.size(); ++i) {
    assert(all[i - 1].distance <= all[i].distance);
  }
  assert(all.back().record.id == "e");
}

void TestTiesBreakByNewestThenId() {
  std::vector<ResourceRecord> candidates = {
      Record("z-old", {1, 0}, 10),
      Record("b-new", {1, 0}, 20),
      Record("a-new", {1, 0}, 20),
  };

  auto ranked = RankNearest(candidates, {1, 0}, 3);
  assert(ranked.size() == 3);
  assert(ranked[0].record.id == "a-new");
  assert(ranked[1].record.id == "b-new");
  assert(ranked[2].record.id == "z-old");
}

} // namespace

int main() {
  TestCosineDistance();
  TestZeroNormRanksAtOne();
  TestDimensionMismatchThrows();
  TestRankReturnsMinKInOrder();
  TestTiesBreakByNewestThenId();

  std::cout << "siros_similarity_test: pass\n";
  return 0;
}
