#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/duration.pb.h"

namespace fleetq::util {

/*
  Time utilities. Single place to control the clock source.

  Every component that stamps rows takes a NowFn so tests can drive time.
  Rows store epoch milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

std::chrono::milliseconds  FromProto(const google::protobuf::Duration& d);
google::protobuf::Duration ToProto(std::chrono::milliseconds d);

} // namespace fleetq::util
