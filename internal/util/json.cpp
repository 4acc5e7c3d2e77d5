#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace siros::util {

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("serialize " + std::string(message.GetTypeName()) + " to json: " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  message->Clear();
  if (json.empty()) {
    return;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("parse " + std::string(message->GetTypeName()) + " from json: " + std::string(status.message()));
  }
}

} // namespace siros::util
