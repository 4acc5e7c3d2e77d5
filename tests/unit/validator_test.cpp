#include <cassert>
#include <iostream>
#include <limits>

#include "internal/util/errors.hpp"
#include "internal/validation/validator.hpp"

namespace {

using siros::util::ValidationErrorCode;
using siros::validation::ValidationOptions;
using siros::validation::Validator;

siros::model::Resource MakeResource() {
  siros::model::Resource resource;
  resource.id       = "i-1";
  resource.type     = "ec2.instance";
  resource.provider = "aws";
  resource.region   = "us-east-1";
  resource.name     = "web-1";
  (*resource.data.mutable_fields())["instance_type"].set_string_value("t3.micro");
  return resource;
}

siros::model::Schema MakeSchema() {
  siros::model::Schema schema;
  schema.provider        = "aws";
  schema.type            = "ec2.instance";
  schema.name            = "ec2";
  schema.version         = "1";
  schema.required_fields = {"instance_type", "ami"};
  return schema;
}

void TestAcceptsMinimalResource() {
  Validator validator;
  auto      result = validator.Validate(MakeResource(), nullptr);
  assert(result);
  assert(result.ok);
}

void TestMissingIdentityFields() {
  Validator validator;

  auto resource = MakeResource();
  resource.id   = "   ";
  auto result   = validator.Validate(resource, nullptr);
  assert(!result);
  assert(result.code == ValidationErrorCode::kMissingField);
  assert(result.field == "id");

  resource      = MakeResource();
  resource.type = "";
  result        = validator.Validate(resource, nullptr);
  assert(result.code == ValidationErrorCode::kMissingField);
  assert(result.field == "type");

  resource          = MakeResource();
  resource.provider = "\t";
  result            = validator.Validate(resource, nullptr);
  assert(result.code == ValidationErrorCode::kMissingField);
  assert(result.field == "provider");
}

void TestSchemaRequiredFields() {
  Validator  validator;
  const auto schema = MakeSchema();

  auto resource = MakeResource();
  auto result   = validator.Validate(resource, &schema);
  assert(!result);
  assert(result.code == ValidationErrorCode::kSchemaMismatch);
  assert(result.field == "data.ami");

  (*resource.data.mutable_fields())["ami"].set_string_value("ami-123");
  assert(validator.Validate(resource, &schema));
}

void TestProviderAllowList() {
  Validator open;
  auto      resource = MakeResource();
  resource.provider  = "digitalocean";
  assert(open.Validate(resource, nullptr));

  Validator restricted(ValidationOptions{{"AWS", "gcp"}});
  auto      result = restricted.Validate(resource, nullptr);
  assert(result.code == ValidationErrorCode::kUnsupportedProvider);
  assert(result.field == "provider");

  resource.provider = "Aws";
  assert(restricted.Validate(resource, nullptr));
  assert(restricted.IsSupportedProvider("GCP"));
  assert(!restricted.IsSupportedProvider("azure"));
}

void TestValidateIsPureAndIdempotent() {
  Validator  validator;
  const auto schema   = MakeSchema();
  const auto resource = MakeResource();
  const auto before   = resource.data.DebugString();

  auto first  = validator.Validate(resource, &schema);
  auto second = validator.Validate(resource, &schema);
  assert(first.ok == second.ok);
  assert(first.code == second.code);
  assert(first.field == second.field);
  assert(first.message == second.message);
  assert(resource.data.DebugString() == before);
}

void TestCheckThrowsValidationFailed() {
  Validator validator;
  auto      resource = MakeResource();
  resource.id.clear();

  bool threw = false;
  try {
    validator.Check(resource, nullptr);
  } catch (const siros::util::ValidationFailed& e) {
    threw = true;
    assert(e.code() == ValidationErrorCode::kMissingField);
    assert(e.field() == "id");
  }
  assert(threw);
}

void TestSchemaRegistrationRules() {
  Validator validator;
  auto      schema = MakeSchema();
  assert(validator.ValidateSchema(schema));

  schema.version.clear();
  auto result = validator.ValidateSchema(schema);
  assert(!result);
  assert(result.field == "version");
}

void TestRejectsNonFiniteNumbers() {
  Validator validator;

  auto resource = MakeResource();
  auto* nested  = (*resource.data.mutable_fields())["limits"].mutable_struct_value();
  (*nested->mutable_fields())["cpu"].set_number_value(std::numeric_limits<double>::quiet_NaN());
  auto result = validator.Validate(resource, nullptr);
  assert(!result);
  assert(result.code == ValidationErrorCode::kInvalidValue);
  assert(result.field == "data.limits.cpu");

  resource    = MakeResource();
  auto* ports = (*resource.data.mutable_fields())["ports"].mutable_list_value();
  ports->add_values()->set_number_value(443);
  ports->add_values()->set_number_value(std::numeric_limits<double>::infinity());
  result = validator.Validate(resource, nullptr);
  assert(result.code == ValidationErrorCode::kInvalidValue);
  assert(result.field == "data.ports[1]");

  resource = MakeResource();
  (*resource.metadata.custom.mutable_fields())["weight"].set_number_value(-std::numeric_limits<double>::infinity());
  bool threw = false;
  try {
    validator.Check(resource, nullptr);
  } catch (const siros::util::ValidationFailed& e) {
    threw = true;
    assert(e.code() == ValidationErrorCode::kInvalidValue);
    assert(e.field() == "metadata.custom.weight");
  }
  assert(threw);

  resource = MakeResource();
  (*resource.data.mutable_fields())["cpu"].set_number_value(2.5);
  assert(validator.Validate(resource, nullptr));
}

} // namespace

int main() {
  TestAcceptsMinimalResource();
  TestMissingIdentityFields();
  TestSchemaRequiredFields();
  TestProviderAllowList();
  TestValidateIsPureAndIdempotent();
  TestCheckThrowsValidationFailed();
  TestSchemaRegistrationRules();
  TestRejectsNonFiniteNumbers();

  std::cout << "siros_validator_test: pass\n";
  return 0;
}
