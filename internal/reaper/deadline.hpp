#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace medianode::reaper {

enum class DeadlineKind : std::uint8_t {
  kIdleGrace         = 1,
  kTerminationRetry  = 2,
  kCanceledRetention = 3,
};

constexpr std::string_view ToString(DeadlineKind kind) {
  switch (kind) {
    case DeadlineKind::kIdleGrace:
      return "idle_grace";
    case DeadlineKind::kTerminationRetry:
      return "termination_retry";
    case DeadlineKind::kCanceledRetention:
      return "canceled_retention";
  }
  return "unknown";
}

/*
  A scheduled time-driven action on one media node.

  `generation` identifies the arming; a handler compares it against the
  generation it recorded to discard fires that were superseded after they
  were taken from the table.
*/
struct Deadline {
  std::string     node_id;
  DeadlineKind    kind = DeadlineKind::kIdleGrace;
  util::TimePoint at{};
  std::uint64_t   generation = 0;
};

class DeadlineHandler {
 public:
  virtual ~DeadlineHandler() = default;

  virtual void OnDeadline(const Deadline& deadline) = 0;
};

} // namespace medianode::reaper
