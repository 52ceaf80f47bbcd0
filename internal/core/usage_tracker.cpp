#include "internal/core/usage_tracker.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace medianode::core {

using model::NodeEvent;
using model::NodeState;

UsageChange UsageTracker::RecordAttach(model::MediaNode& node, util::TimePoint time_of_connection) {
  if (!model::AcceptsRegistration(node.state)) {
    throw util::InvalidStateTransition("media node " + node.id + " does not accept registrations in state " +
                                       std::string(model::ToString(node.state)));
  }

  UsageChange change;
  change.usage_before = node.usage_count;

  if (node.state == NodeState::kWaitingIdleToTerminate) {
    node.state               = model::Transition(node.id, node.state, NodeEvent::kUsageResumed);
    node.state_changed_at    = time_of_connection;
    change.resumed_from_idle = true;
  }

  node.usage_count += 1;
  node.last_usage_change_at = time_of_connection;
  node.idle_since.reset();

  change.usage_after = node.usage_count;
  return change;
}

UsageChange UsageTracker::RecordDetach(model::MediaNode& node, util::TimePoint time_of_disconnection) {
  if (node.usage_count == 0) {
    throw util::UsageUnderflow("media node " + node.id + " has no attached sessions to deregister (state " +
                               std::string(model::ToString(node.state)) + ")");
  }

  UsageChange change;
  change.usage_before = node.usage_count;

  if (node.usage_count == 1) {
    // Validate before decrementing so a rejected transition leaves usage intact.
    const auto next = model::Transition(node.id, node.state, NodeEvent::kUsageReachedZero);
    node.state            = next;
    node.state_changed_at = time_of_disconnection;
    node.idle_since       = time_of_disconnection;
    change.became_idle    = true;
  }

  node.usage_count -= 1;
  node.last_usage_change_at = time_of_disconnection;

  change.usage_after = node.usage_count;
  return change;
}

} // namespace medianode::core
