#include "time.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace impact::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  // Keep a year of headroom so ETA and lookahead arithmetic cannot overflow.
  constexpr int64_t kHeadroomSec = 366LL * 24 * 3600;
  constexpr int64_t kMaxSeconds  = std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max()).count() - kHeadroomSec;

  if (ts.seconds() > kMaxSeconds || ts.seconds() < -kMaxSeconds) {
    throw ValidationError("timestamp out of range: " + std::to_string(ts.seconds()) + "s");
  }
  if (ts.nanos() < 0 || ts.nanos() >= 1000000000) {
    throw ValidationError("timestamp nanos out of range: " + std::to_string(ts.nanos()));
  }
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  return ms < 0 ? 0 : static_cast<uint64_t>(ms);
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
}

} // namespace impact::util
