#pragma once

#include <string>
#include <vector>

#include "internal/model/resource.hpp"
#include "internal/model/schema.hpp"
#include "internal/util/errors.hpp"

namespace siros::validation {

struct ValidationOptions {
  // Lower-case provider names. Empty accepts any provider.
  std::vector<std::string> allowed_providers;
};

struct ValidationResult {
  bool                      ok   = true;
  util::ValidationErrorCode code = util::ValidationErrorCode::kMissingField;
  std::string               field;
  std::string               message;

  static ValidationResult Ok() {
    return {};
  }

  static ValidationResult Fail(util::ValidationErrorCode code, std::string field, std::string message) {
    return {false, code, std::move(field), std::move(message)};
  }

  explicit operator bool() const {
    return ok;
  }
};

/*
  Structural checks applied to every resource before it is persisted.

  Validate has no side effects: it never touches the store, and the
  same (resource, schema) pair always yields the same result. The
  schema, when given, is the one registered for (provider, type).
*/
class Validator {
 public:
  Validator() = default;
  explicit Validator(ValidationOptions options);

  ValidationResult Validate(const model::Resource& resource, const model::Schema* schema) const;

  // Throws util::ValidationFailed carrying the first violation.
  void Check(const model::Resource& resource, const model::Schema* schema) const;

  // Case-insensitive.
  bool IsSupportedProvider(const std::string& provider) const;

  // Registration requires provider, type, name and version.
  ValidationResult ValidateSchema(const model::Schema& schema) const;

 private:
  ValidationOptions options_;
};

} // namespace siros::validation
