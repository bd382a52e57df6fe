#include "time.hpp"

namespace inkvault::util {

TimePoint ManualClock::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

void ManualClock::Advance(Duration d) {
  std::lock_guard lock(mutex_);
  now_ += d;
}

void ManualClock::Set(TimePoint tp) {
  std::lock_guard lock(mutex_);
  now_ = tp;
}

WallTimePoint WallNow() {
  return WallClock::now();
}

google::protobuf::Timestamp ToProto(WallTimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

WallTimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return WallTimePoint{} + std::chrono::duration_cast<WallClock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

Duration FromProto(const google::protobuf::Duration& d, Duration fallback) {
  auto value = std::chrono::duration_cast<Duration>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
  if (value <= Duration::zero()) return fallback;
  return value;
}

uint64_t ToUnixMillis(WallTimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int64_t ToMillis(Duration d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

} // namespace inkvault::util
