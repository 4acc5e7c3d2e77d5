#pragma once

#include <google/protobuf/struct.pb.h>

#include "internal/model/resource.hpp"

namespace siros::core {

/*
  Field-level diff between two versions of a resource.

  Keys are dotted paths. data, tags and metadata are compared one level
  deep ("data.size", "tags.env", "metadata.iam"); every other field is
  compared as a whole. Each entry is {"old": <value>, "new": <value>},
  with null standing in for an absent side. updated_at and
  metadata.modified_by are bookkeeping and never reported.
*/
google::protobuf::Struct DiffResources(const model::Resource& before, const model::Resource& after);

// True when a path in the diff feeds the embedding.
bool TouchesVectorizedContent(const google::protobuf::Struct& diff);

} // namespace siros::core
