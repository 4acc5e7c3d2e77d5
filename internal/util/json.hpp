#pragma once

#include <string>

#include <google/protobuf/message.h>

namespace siros::util {

/*
  Protobuf JSON helpers used to persist Struct/ListValue columns.

  Both throw std::runtime_error on malformed input.
*/

std::string ToJson(const google::protobuf::Message& message);
void        FromJson(const std::string& json, google::protobuf::Message* message);

} // namespace siros::util
