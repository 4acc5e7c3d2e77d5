#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace siros::db::model {

/*
  Persistent resource row.

  Structured columns (data, metadata, children, links) are protobuf JSON
  text. Tags are kept as a map because every backend filters on them.
  An empty vector means the row is unvectorized.
*/

struct ResourceRecord {
  std::string id;
  std::string type;
  std::string provider;
  std::string region;
  std::string name;

  std::string                        data_json;
  std::string                        metadata_json;
  std::map<std::string, std::string> tags;

  std::string parent_id; // empty = none
  std::string children_json;
  std::string links_json;

  std::vector<float> vector;
  int                state = 0;

  uint64_t created_at_ms      = 0;
  uint64_t updated_at_ms      = 0;
  uint64_t last_scanned_at_ms = 0; // 0 = never scanned
};

} // namespace siros::db::model
