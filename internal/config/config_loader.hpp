#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace siros::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, serialized to JSON and parsed
  into RuntimeConfig with unknown fields rejected, so a typo in a key
  fails at startup instead of being silently ignored.

  Quoted scalars always stay strings; plain scalars are typed
  (true/false, numbers).
*/
class ConfigLoader {
 public:
  static siros::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static siros::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

// Effective values with defaults applied.
std::uint32_t VectorDimension(const siros::runtime::config::RuntimeConfig& config);
std::uint32_t MaxK(const siros::runtime::config::RuntimeConfig& config);
bool          EmbeddingEnabled(const siros::runtime::config::RuntimeConfig& config);
std::string   BindAddress(const siros::runtime::config::RuntimeConfig& config);

} // namespace siros::config
