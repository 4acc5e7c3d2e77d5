#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

#include "internal/util/time.hpp"

namespace siros::model {

enum class ChangeOperation : std::uint8_t {
  kCreate = 1,
  kUpdate = 2,
  kDelete = 3,
};

inline const char* ToString(ChangeOperation op) {
  switch (op) {
    case ChangeOperation::kCreate:
      return "create";
    case ChangeOperation::kUpdate:
      return "update";
    case ChangeOperation::kDelete:
      return "delete";
  }
  return "unknown";
}

inline std::optional<ChangeOperation> ParseChangeOperation(std::string_view s) {
  if (s == "create") return ChangeOperation::kCreate;
  if (s == "update") return ChangeOperation::kUpdate;
  if (s == "delete") return ChangeOperation::kDelete;
  return std::nullopt;
}

/*
  One link of a per-resource audit chain.

  sequence, previous_hash and block_hash are assigned by AuditChain::Append;
  callers fill the rest.
*/
struct ChangeRecord {
  std::string              id;
  std::string              resource_id;
  std::uint64_t            sequence  = 0;
  ChangeOperation          operation = ChangeOperation::kCreate;
  google::protobuf::Struct changes;
  std::string              actor;
  util::TimePoint          timestamp{};
  std::string              previous_hash;
  std::string              block_hash;
};

} // namespace siros::model
