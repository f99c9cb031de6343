#include "time.hpp"

namespace datalens::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::floor<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

bool IsWithin(TimePoint since, std::chrono::seconds window, TimePoint now) {
  return now >= since && now - since < window;
}

double MillisSince(SteadyClock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(SteadyClock::now() - started_at).count();
}

} // namespace datalens::util
