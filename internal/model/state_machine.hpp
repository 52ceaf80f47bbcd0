#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace medianode::model {

enum class NodeState : std::uint8_t {
  kLaunching              = 1,
  kRunning                = 2,
  kWaitingIdleToTerminate = 3,
  kTerminating            = 4,
  kCanceled               = 5,
};

enum class NodeEvent : std::uint8_t {
  kProvisioningConfirmed = 1,
  kProvisioningAborted   = 2,
  kUsageReachedZero      = 3,
  kUsageResumed          = 4,
  kGracePeriodElapsed    = 5,
  kDropRequested         = 6,
};

constexpr bool AcceptsRegistration(NodeState state) {
  return state == NodeState::kRunning || state == NodeState::kWaitingIdleToTerminate;
}

// Returns the target state, or nullopt when the event is not valid in `from`.
constexpr std::optional<NodeState> NextState(NodeState from, NodeEvent event) {
  switch (from) {
    case NodeState::kLaunching:
      if (event == NodeEvent::kProvisioningConfirmed) return NodeState::kRunning;
      if (event == NodeEvent::kProvisioningAborted) return NodeState::kCanceled;
      return std::nullopt;
    case NodeState::kRunning:
      if (event == NodeEvent::kUsageReachedZero) return NodeState::kWaitingIdleToTerminate;
      return std::nullopt;
    case NodeState::kWaitingIdleToTerminate:
      if (event == NodeEvent::kUsageResumed) return NodeState::kRunning;
      if (event == NodeEvent::kGracePeriodElapsed || event == NodeEvent::kDropRequested) return NodeState::kTerminating;
      return std::nullopt;
    case NodeState::kTerminating:
    case NodeState::kCanceled:
      return std::nullopt;
  }
  return std::nullopt;
}

std::string_view ToString(NodeState state);
std::string_view ToString(NodeEvent event);

// Applies `event` to `from`, throwing util::InvalidStateTransition when the
// table has no entry for the pair.
NodeState Transition(std::string_view node_id, NodeState from, NodeEvent event);

} // namespace medianode::model
