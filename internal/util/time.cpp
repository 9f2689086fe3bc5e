#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <cmath>

namespace stash::util {

TimePoint SystemClock::Now() const {
  // microsecond grid: survives the epoch-seconds round trip exactly
  return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

double ToEpochSeconds(TimePoint tp) {
  return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

TimePoint FromEpochSeconds(double seconds) {
  const auto micros = static_cast<std::int64_t>(std::llround(seconds * 1e6));
  return TimePoint{} + std::chrono::duration_cast<TimePoint::duration>(std::chrono::microseconds(micros));
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

std::string FormatIso8601(TimePoint tp) {
  return google::protobuf::util::TimeUtil::ToString(ToProto(std::chrono::time_point_cast<std::chrono::seconds>(tp)));
}

} // namespace stash::util
