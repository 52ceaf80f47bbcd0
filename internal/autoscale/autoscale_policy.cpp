#include "autoscale_policy.hpp"

#include <stdexcept>

namespace medianode::autoscale {

using model::NodeState;

AutoscalePolicy::AutoscalePolicy(AutoscaleOptions options) : options_(options) {
  if (options_.enabled && options_.node_capacity == 0) {
    throw std::invalid_argument("autoscale node capacity must be positive");
  }
}

FleetLoad AutoscalePolicy::Measure(const std::vector<model::MediaNode>& fleet) const {
  FleetLoad load;

  for (const auto& node : fleet) {
    load.attached_sessions += node.usage_count;

    switch (node.state) {
      case NodeState::kLaunching:
        ++load.launching_nodes;
        break;
      case NodeState::kRunning:
        ++load.running_nodes;
        break;
      case NodeState::kWaitingIdleToTerminate:
        ++load.idle_nodes;
        continue;
      case NodeState::kTerminating:
      case NodeState::kCanceled:
        continue;
    }

    if (node.usage_count < options_.node_capacity) {
      load.spare_capacity += options_.node_capacity - node.usage_count;
    }
  }

  load.live_nodes = load.launching_nodes + load.running_nodes + load.idle_nodes;
  return load;
}

bool AutoscalePolicy::NeedsCapacity(const FleetLoad& load) const {
  if (!options_.enabled) {
    return false;
  }
  return load.spare_capacity < options_.min_spare_capacity;
}

} // namespace medianode::autoscale
