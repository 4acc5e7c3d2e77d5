#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "internal/db/model/resource_record.hpp"

namespace siros::db {

struct Pagination {
  std::size_t limit  = 50;
  std::size_t offset = 0;
};

enum class SortOrder {
  kNewestFirst,
  kOldestFirst,
};

// All set criteria must match. Tags match when every listed pair is present.
struct ResourceFilter {
  std::optional<std::string>         provider;
  std::optional<std::string>         type;
  std::optional<std::string>         region;
  std::optional<std::string>         parent_id;
  std::map<std::string, std::string> tags;
};

struct NeighborRecord {
  model::ResourceRecord record;
  double                distance = 0.0;
};

} // namespace siros::db
