#include "validator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <utility>

namespace siros::validation {

namespace {

bool IsBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

ValidationResult Missing(const std::string& field) {
  return ValidationResult::Fail(util::ValidationErrorCode::kMissingField, field, field + " is required");
}

std::optional<std::string> FindNonFinite(const google::protobuf::Value& value, const std::string& path);

// Keys are visited in sorted order so the reported path is stable.
std::optional<std::string> FindNonFinite(const google::protobuf::Struct& object, const std::string& path) {
  std::vector<std::string> keys;
  keys.reserve(object.fields().size());
  for (const auto& [key, _] : object.fields()) {
    keys.push_back(key);
  }
  std::sort(keys.begin(), keys.end());

  for (const auto& key : keys) {
    if (auto found = FindNonFinite(object.fields().at(key), path + "." + key)) return found;
  }
  return std::nullopt;
}

std::optional<std::string> FindNonFinite(const google::protobuf::Value& value, const std::string& path) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNumberValue:
      if (!std::isfinite(value.number_value())) return path;
      return std::nullopt;
    case google::protobuf::Value::kStructValue:
      return FindNonFinite(value.struct_value(), path);
    case google::protobuf::Value::kListValue:
      for (int i = 0; i < value.list_value().values_size(); ++i) {
        if (auto found = FindNonFinite(value.list_value().values(i), path + "[" + std::to_string(i) + "]")) return found;
      }
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

} // namespace

Validator::Validator(ValidationOptions options) : options_(std::move(options)) {
  for (auto& provider : options_.allowed_providers) {
    provider = Lower(provider);
  }
}

bool Validator::IsSupportedProvider(const std::string& provider) const {
  if (options_.allowed_providers.empty()) {
    return true;
  }
  const auto lowered = Lower(provider);
  return std::find(options_.allowed_providers.begin(), options_.allowed_providers.end(), lowered) != options_.allowed_providers.end();
}

ValidationResult Validator::Validate(const model::Resource& resource, const model::Schema* schema) const {
  if (IsBlank(resource.id)) return Missing("id");
  if (IsBlank(resource.type)) return Missing("type");
  if (IsBlank(resource.provider)) return Missing("provider");

  if (!IsSupportedProvider(resource.provider)) {
    return ValidationResult::Fail(util::ValidationErrorCode::kUnsupportedProvider, "provider",
                                  "unsupported provider: " + resource.provider);
  }

  // JSON has no encoding for NaN or infinity.
  const std::pair<const char*, const google::protobuf::Struct*> documents[] = {
      {"data", &resource.data},
      {"metadata.iam", &resource.metadata.iam},
      {"metadata.custom", &resource.metadata.custom},
  };
  for (const auto& [root, object] : documents) {
    if (auto path = FindNonFinite(*object, root)) {
      return ValidationResult::Fail(util::ValidationErrorCode::kInvalidValue, *path, *path + " must be a finite number");
    }
  }

  if (schema) {
    const auto& fields = resource.data.fields();
    for (const auto& required : schema->required_fields) {
      if (fields.find(required) == fields.end()) {
        return ValidationResult::Fail(util::ValidationErrorCode::kSchemaMismatch, "data." + required,
                                      "schema " + schema->name + "@" + schema->version + " requires data." + required);
      }
    }
  }

  return ValidationResult::Ok();
}

void Validator::Check(const model::Resource& resource, const model::Schema* schema) const {
  auto result = Validate(resource, schema);
  if (!result) {
    throw util::ValidationFailed(result.code, result.field, result.message);
  }
}

ValidationResult Validator::ValidateSchema(const model::Schema& schema) const {
  if (IsBlank(schema.provider)) return Missing("provider");
  if (IsBlank(schema.type)) return Missing("type");
  if (IsBlank(schema.name)) return Missing("name");
  if (IsBlank(schema.version)) return Missing("version");
  return ValidationResult::Ok();
}

} // namespace siros::validation
