#pragma once

#include <chrono>
#include <functional>

#include "google/protobuf/timestamp.pb.h"

namespace datalens::util {

/*
  Wall-clock time for build and scan timestamps, steady time for latency.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock = std::chrono::steady_clock;

// Injectable clock, used by caches that expire on a time window.
using ClockFn = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

// True when now falls in [since, since + window). A clock that moved
// backwards past `since` counts as expired.
bool IsWithin(TimePoint since, std::chrono::seconds window, TimePoint now);

double MillisSince(SteadyClock::time_point started_at);

} // namespace datalens::util
