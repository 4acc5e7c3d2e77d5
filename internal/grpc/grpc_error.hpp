#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace siros::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  ValidationFailed, InvalidArgument -> INVALID_ARGUMENT
  EmbeddingFailed                   -> UNAVAILABLE
  Conflict                          -> ABORTED
  PersistenceFailed                 -> INTERNAL
  ChainBroken                       -> DATA_LOSS
  NotFound                          -> NOT_FOUND
  AlreadyExists                     -> ALREADY_EXISTS
  DeadlineExceeded                  -> DEADLINE_EXCEEDED
  anything else                     -> INTERNAL
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace siros::grpc
