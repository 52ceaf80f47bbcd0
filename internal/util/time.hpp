#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace medianode::util {

/*
  Time utilities. Single place to control the clock source.
*/

using TimePoint = std::chrono::system_clock::time_point;
using Duration  = std::chrono::milliseconds;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override;
};

/*
  Clock driven by hand. Used by tests and simulations to step idle
  deadlines deterministically.
*/
class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start = TimePoint{});

  TimePoint Now() const override;

  void Set(TimePoint now);
  void Advance(Duration delta);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

Duration FromProto(const google::protobuf::Duration& d);

} // namespace medianode::util
