#include "canonical.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <vector>

#include "internal/audit/hash.hpp"
#include "internal/util/time.hpp"

namespace siros::audit {

namespace {

void AppendValue(std::string& out, const google::protobuf::Value& value);

void AppendString(std::string& out, const std::string& s) {
  out.push_back('"');
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out.push_back(static_cast<char>(c));
        }
    }
  }
  out.push_back('"');
}

void AppendNumber(std::string& out, double n) {
  char buf[32];
  if (std::isfinite(n) && std::trunc(n) == n && std::fabs(n) < 9007199254740992.0) {
    std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(n));
  } else {
    std::snprintf(buf, sizeof(buf), "%.17g", n);
  }
  out += buf;
}

void AppendStruct(std::string& out, const google::protobuf::Struct& s) {
  std::vector<const std::string*> keys;
  keys.reserve(s.fields().size());
  for (const auto& entry : s.fields())
    keys.push_back(&entry.first);
  std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

  out.push_back('{');
  bool first = true;
  for (const auto* key : keys) {
    if (!first) out.push_back(',');
    first = false;
    AppendString(out, *key);
    out.push_back(':');
    AppendValue(out, s.fields().at(*key));
  }
  out.push_back('}');
}

void AppendValue(std::string& out, const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kBoolValue:
      out += value.bool_value() ? "true" : "false";
      break;
    case google::protobuf::Value::kNumberValue:
      AppendNumber(out, value.number_value());
      break;
    case google::protobuf::Value::kStringValue:
      AppendString(out, value.string_value());
      break;
    case google::protobuf::Value::kStructValue:
      AppendStruct(out, value.struct_value());
      break;
    case google::protobuf::Value::kListValue: {
      out.push_back('[');
      bool first = true;
      for (const auto& item : value.list_value().values()) {
        if (!first) out.push_back(',');
        first = false;
        AppendValue(out, item);
      }
      out.push_back(']');
      break;
    }
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      out += "null";
      break;
  }
}

void AppendField(std::string& out, std::string_view name, const std::string& value) {
  out.push_back('\n');
  out.append(name);
  out.push_back('=');
  out += std::to_string(value.size());
  out.push_back(':');
  out += value;
}

} // namespace

std::string CanonicalJson(const google::protobuf::Value& value) {
  std::string out;
  AppendValue(out, value);
  return out;
}

std::string CanonicalJson(const google::protobuf::Struct& value) {
  std::string out;
  AppendStruct(out, value);
  return out;
}

std::string CanonicalEncoding(const model::ChangeRecord& record) {
  std::string out = "siros.change.v1";
  AppendField(out, "id", record.id);
  AppendField(out, "resource_id", record.resource_id);
  AppendField(out, "sequence", std::to_string(record.sequence));
  AppendField(out, "operation", model::ToString(record.operation));
  AppendField(out, "actor", record.actor);
  AppendField(out, "timestamp_ms", std::to_string(util::ToUnixMillis(record.timestamp)));
  AppendField(out, "changes", CanonicalJson(record.changes));
  return out;
}

std::string ComputeBlockHash(std::string_view previous_hash, const model::ChangeRecord& record) {
  std::string input(previous_hash);
  input.push_back('\n');
  input += CanonicalEncoding(record);
  return Sha256Hex(input);
}

} // namespace siros::audit
