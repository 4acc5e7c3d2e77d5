#pragma once

#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace siros::model {

// Registered shape for a (provider, type) pair.
struct Schema {
  std::string              provider;
  std::string              type;
  std::string              name;
  std::string              version;
  std::vector<std::string> required_fields;
  std::string              description;
  util::TimePoint          created_at{};
};

} // namespace siros::model
