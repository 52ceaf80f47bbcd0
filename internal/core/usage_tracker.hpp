#pragma once

#include "internal/model/media_node.hpp"
#include "internal/util/time.hpp"

namespace medianode::core {

struct UsageChange {
  std::uint64_t usage_before = 0;
  std::uint64_t usage_after  = 0;

  bool resumed_from_idle = false;
  bool became_idle       = false;
};

/*
  Applies attach/detach events to a node record.

  Callers run these inside registry::MediaNodeRegistry::Mutate so the
  usage counter and the state move together. Both functions throw before
  touching the record, so a rejected event never leaves a partial update.
*/
class UsageTracker {
 public:
  // Throws util::InvalidStateTransition unless the node accepts sessions.
  static UsageChange RecordAttach(model::MediaNode& node, util::TimePoint time_of_connection);

  // Throws util::UsageUnderflow when no session is attached.
  static UsageChange RecordDetach(model::MediaNode& node, util::TimePoint time_of_disconnection);
};

} // namespace medianode::core
