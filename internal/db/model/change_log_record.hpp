#pragma once

#include <cstdint>
#include <string>

namespace siros::db::model {

/*
  Append-only audit row.

  (resource_id, sequence) is unique in every backend; a second writer
  racing for the same sequence fails instead of forking the chain.
*/

struct ChangeLogRecord {
  std::string id;
  std::string resource_id;
  uint64_t    sequence = 0;
  std::string operation;
  std::string changes_json;
  std::string actor;
  uint64_t    timestamp_ms = 0;
  std::string previous_hash;
  std::string block_hash;
};

} // namespace siros::db::model
