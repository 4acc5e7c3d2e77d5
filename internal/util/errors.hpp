#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace siros::util {

/*
  Central error types.

  Thrown by the core and translated to gRPC status codes
  by siros::grpc::ToStatus.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class ValidationErrorCode {
  kMissingField,
  kSchemaMismatch,
  kUnsupportedProvider,
  kInvalidValue,
};

inline const char* ToString(ValidationErrorCode code) {
  switch (code) {
    case ValidationErrorCode::kMissingField:
      return "missing_field";
    case ValidationErrorCode::kSchemaMismatch:
      return "schema_mismatch";
    case ValidationErrorCode::kUnsupportedProvider:
      return "unsupported_provider";
    case ValidationErrorCode::kInvalidValue:
      return "invalid_value";
  }
  return "unknown";
}

class ValidationFailed : public std::runtime_error {
 public:
  ValidationFailed(ValidationErrorCode code, std::string field, const std::string& msg)
      : std::runtime_error(msg), code_(code), field_(std::move(field)) {
  }

  ValidationErrorCode code() const {
    return code_;
  }
  const std::string& field() const {
    return field_;
  }

 private:
  ValidationErrorCode code_;
  std::string         field_;
};

// Embedding provider failures are always retryable by the caller.
class EmbeddingFailed : public std::runtime_error {
 public:
  explicit EmbeddingFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceFailed : public std::runtime_error {
 public:
  explicit PersistenceFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Concurrent writer won the race (serialization failure, chain fork, busy store).
class Conflict : public PersistenceFailed {
 public:
  explicit Conflict(const std::string& msg) : PersistenceFailed(msg) {
  }
};

class ChainBroken : public std::runtime_error {
 public:
  ChainBroken(std::string resource_id, std::uint64_t index, const std::string& msg)
      : std::runtime_error(msg), resource_id_(std::move(resource_id)), index_(index) {
  }

  const std::string& resource_id() const {
    return resource_id_;
  }
  std::uint64_t index() const {
    return index_;
  }

 private:
  std::string   resource_id_;
  std::uint64_t index_;
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace siros::util
