#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/timestamp.pb.h"

namespace impact::util {

/*
  Time utilities: single place to control clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace impact::util
