#include "internal/model/state_machine.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace medianode::model {

std::string_view ToString(NodeState state) {
  switch (state) {
    case NodeState::kLaunching:
      return "LAUNCHING";
    case NodeState::kRunning:
      return "RUNNING";
    case NodeState::kWaitingIdleToTerminate:
      return "WAITING_IDLE_TO_TERMINATE";
    case NodeState::kTerminating:
      return "TERMINATING";
    case NodeState::kCanceled:
      return "CANCELED";
  }
  return "UNKNOWN";
}

std::string_view ToString(NodeEvent event) {
  switch (event) {
    case NodeEvent::kProvisioningConfirmed:
      return "provisioning_confirmed";
    case NodeEvent::kProvisioningAborted:
      return "provisioning_aborted";
    case NodeEvent::kUsageReachedZero:
      return "usage_reached_zero";
    case NodeEvent::kUsageResumed:
      return "usage_resumed";
    case NodeEvent::kGracePeriodElapsed:
      return "grace_period_elapsed";
    case NodeEvent::kDropRequested:
      return "drop_requested";
  }
  return "unknown";
}

NodeState Transition(std::string_view node_id, NodeState from, NodeEvent event) {
  if (auto next = NextState(from, event)) {
    return *next;
  }
  throw util::InvalidStateTransition("media node " + std::string(node_id) + ": event " + std::string(ToString(event)) + " is not valid in state " +
                                     std::string(ToString(from)));
}

} // namespace medianode::model
