#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace siros::util {

/*
  Time utilities: single place to control clock source later.

  Persisted timestamps carry millisecond precision, so Now() truncates
  to whole milliseconds. A value read back from any backend compares
  equal to the one written.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::uint64_t ToUnixMillis(TimePoint tp);
TimePoint     FromUnixMillis(std::uint64_t ms);

} // namespace siros::util
