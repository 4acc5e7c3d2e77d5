#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/util/time.hpp"

namespace siros::model {

using FloatVector = std::vector<float>;

/*
  Resource lifecycle.

    Unvectorized -> Active        (vector generated)
    Unvectorized -> Deleted
    Active       -> Active        (update, possibly re-vectorized)
    Active       -> Deleted

  Deleted is terminal. Rows are removed physically once the delete is
  in the audit chain, so Deleted is only ever observed in change records.
*/
enum class ResourceState : std::uint8_t {
  kUnvectorized = 1,
  kActive       = 2,
  kDeleted      = 3,
};

inline const char* ToString(ResourceState state) {
  switch (state) {
    case ResourceState::kUnvectorized:
      return "unvectorized";
    case ResourceState::kActive:
      return "active";
    case ResourceState::kDeleted:
      return "deleted";
  }
  return "unknown";
}

inline bool CanTransition(ResourceState from, ResourceState to) {
  if (from == ResourceState::kDeleted) return false;
  if (from == ResourceState::kActive && to == ResourceState::kUnvectorized) return false;
  return true;
}

struct ResourceLink {
  std::string                        target_id;
  std::string                        type;
  std::string                        direction;
  std::map<std::string, std::string> properties;

  bool operator==(const ResourceLink&) const = default;
};

struct ResourceMetadata {
  std::string            created_by;
  std::string            modified_by;
  google::protobuf::Struct iam;
  google::protobuf::Struct custom;
};

struct Resource {
  std::string id;
  std::string type;
  std::string provider;
  std::string region;
  std::string name;

  google::protobuf::Struct           data;
  std::map<std::string, std::string> tags;
  ResourceMetadata                   metadata;

  std::optional<std::string> parent_id;
  std::set<std::string>      children;
  std::vector<ResourceLink>  links;

  // Empty when unvectorized or when a read did not ask for it.
  FloatVector   vector;
  ResourceState state = ResourceState::kUnvectorized;

  util::TimePoint                created_at{};
  util::TimePoint                updated_at{};
  std::optional<util::TimePoint> last_scanned_at;
};

} // namespace siros::model
