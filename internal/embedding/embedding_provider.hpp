#pragma once

#include <cstdint>

#include <google/protobuf/struct.pb.h>

#include "internal/model/resource.hpp"

namespace siros::embedding {

/*
  Port to whatever turns resource content into a vector.

  Implementations must:
  - return exactly Dimension() values
  - throw util::EmbeddingFailed on any failure (the caller aborts the
    whole mutation and nothing is persisted)
  - be safe to call from multiple threads
*/
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual model::FloatVector GenerateVector(const google::protobuf::Struct& content, const google::protobuf::Struct& metadata) = 0;

  virtual std::uint32_t Dimension() const = 0;
};

} // namespace siros::embedding
