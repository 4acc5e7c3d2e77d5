#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace siros::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace siros::util;

  if (const auto* validation = dynamic_cast<const ValidationFailed*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what(), std::string(ToString(validation->code())) + ":" + validation->field()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const EmbeddingFailed*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  // Conflict before its PersistenceFailed base.
  if (dynamic_cast<const Conflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const PersistenceFailed*>(&e)) {
    return {::grpc::StatusCode::INTERNAL, e.what()};
  }
  if (const auto* broken = dynamic_cast<const ChainBroken*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, e.what(), broken->resource_id() + "@" + std::to_string(broken->index())};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const DeadlineExceeded*>(&e)) {
    return {::grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace siros::grpc
