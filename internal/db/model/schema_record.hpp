#pragma once

#include <cstdint>
#include <string>

namespace siros::db::model {

struct SchemaRecord {
  std::string provider;
  std::string type;
  std::string name;
  std::string version;
  std::string required_fields_json;
  std::string description;
  uint64_t    created_at_ms = 0;
};

} // namespace siros::db::model
