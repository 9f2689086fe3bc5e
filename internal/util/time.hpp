#pragma once

#include <chrono>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace stash::util {

/*
  Time utilities. Every "now" in the engine comes through a Clock so
  escalation can be driven without wall-clock waits.
*/

using TimePoint = std::chrono::system_clock::time_point;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override;
};

// Persisted form: epoch seconds as a double, read back to the nearest
// microsecond. Exact for any time on the microsecond grid, which is
// what SystemClock hands out.
double    ToEpochSeconds(TimePoint tp);
TimePoint FromEpochSeconds(double seconds);

google::protobuf::Timestamp ToProto(TimePoint tp);

// RFC 3339 / ISO-8601, UTC, second precision ("2026-10-17T09:30:00Z").
std::string FormatIso8601(TimePoint tp);

} // namespace stash::util
