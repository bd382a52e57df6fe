#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace inkvault::util {

/*
  Time utilities.

  Two clocks on purpose:
    WallClock   -> createdAt of persisted snapshots only
    Monotonic   -> everything that measures an interval (grace window,
                   load timeout)
*/

using WallClock     = std::chrono::system_clock;
using WallTimePoint = WallClock::time_point;

using SteadyClock = std::chrono::steady_clock;
using TimePoint   = SteadyClock::time_point;
using Duration    = SteadyClock::duration;

/*
  Injectable monotonic clock. Sessions read time only through this so the
  navigation state machine can be driven deterministically in tests.
*/
class MonotonicClock {
 public:
  virtual ~MonotonicClock() = default;

  virtual TimePoint Now() const = 0;
};

class SystemMonotonicClock final : public MonotonicClock {
 public:
  TimePoint Now() const override {
    return SteadyClock::now();
  }
};

// Clock that only moves when told to.
class ManualClock final : public MonotonicClock {
 public:
  TimePoint Now() const override;

  void Advance(Duration d);
  void Set(TimePoint tp);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_{};
};

WallTimePoint WallNow();

google::protobuf::Timestamp ToProto(WallTimePoint tp);
WallTimePoint               FromProto(const google::protobuf::Timestamp& ts);

// Zero or negative durations yield `fallback`.
Duration FromProto(const google::protobuf::Duration& d, Duration fallback);

uint64_t ToUnixMillis(WallTimePoint tp);

int64_t ToMillis(Duration d);

} // namespace inkvault::util
