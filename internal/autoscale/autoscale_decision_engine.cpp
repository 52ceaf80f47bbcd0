#include "autoscale_decision_engine.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/provisioning/provisioning_gateway.hpp"
#include "internal/registry/media_node_registry.hpp"
#include "internal/util/errors.hpp"

namespace medianode::autoscale {

using medianode::observability::IntField;
using medianode::observability::StringField;
using model::NodeState;

std::string_view ToString(LaunchDecision decision) {
  switch (decision) {
    case LaunchDecision::kNotNeeded:
      return "not_needed";
    case LaunchDecision::kLaunchPending:
      return "launch_pending";
    case LaunchDecision::kFleetAtCapacity:
      return "fleet_at_capacity";
    case LaunchDecision::kLaunched:
      return "launched";
    case LaunchDecision::kFailed:
      return "failed";
  }
  return "unknown";
}

AutoscaleDecisionEngine::AutoscaleDecisionEngine(std::shared_ptr<AutoscalePolicy> policy, std::shared_ptr<registry::MediaNodeRegistry> registry,
                                                 std::shared_ptr<provisioning::ProvisioningGateway> gateway, std::shared_ptr<util::Clock> clock)
    : policy_(std::move(policy)), registry_(std::move(registry)), gateway_(std::move(gateway)), clock_(std::move(clock)) {
  if (!policy_ || !registry_ || !gateway_ || !clock_) {
    throw std::invalid_argument("autoscale decision engine requires policy, registry, gateway and clock");
  }
}

DecisionResult AutoscaleDecisionEngine::Evaluate(const std::vector<model::MediaNode>& fleet) {
  DecisionResult result;
  result.load = policy_->Measure(fleet);

  if (!policy_->NeedsCapacity(result.load)) {
    return result;
  }

  std::lock_guard lock(mutex_);

  // The caller's view may be stale; the registry is authoritative for
  // outstanding launches and fleet size.
  if (registry_->CountInState(NodeState::kLaunching) > 0) {
    result.decision = LaunchDecision::kLaunchPending;
    return result;
  }

  const auto max_nodes = policy_->options().max_nodes;
  if (max_nodes > 0) {
    const auto live = registry_->CountInState(NodeState::kRunning) + registry_->CountInState(NodeState::kWaitingIdleToTerminate);
    if (live >= max_nodes) {
      MEDIANODE_LOG_WARN("Fleet short of capacity but at node ceiling",
                         {IntField("live_nodes", static_cast<std::int64_t>(live)), IntField("max_nodes", static_cast<std::int64_t>(max_nodes)),
                          IntField("spare_capacity", static_cast<std::int64_t>(result.load.spare_capacity))});
      result.decision = LaunchDecision::kFleetAtCapacity;
      return result;
    }
  }

  std::string node_id;
  try {
    node_id = gateway_->RequestLaunch();
  } catch (const util::ProvisioningFailure& e) {
    MEDIANODE_LOG_ERROR("Media node launch request failed", {StringField("error", e.what())});
    observability::Metrics::Instance().RecordProvisioningRequest("launch", false);
    result.decision = LaunchDecision::kFailed;
    return result;
  }

  try {
    registry_->Insert(model::MakeLaunchingNode(node_id, clock_->Now()));
  } catch (const util::AlreadyExists& e) {
    MEDIANODE_LOG_ERROR("Provisioning gateway returned a known media node id", {StringField("node_id", node_id), StringField("error", e.what())});
    observability::Metrics::Instance().RecordProvisioningRequest("launch", false);
    result.decision = LaunchDecision::kFailed;
    return result;
  }

  observability::Metrics::Instance().RecordProvisioningRequest("launch", true);
  MEDIANODE_LOG_INFO("Requested media node launch",
                     {StringField("node_id", node_id), IntField("spare_capacity", static_cast<std::int64_t>(result.load.spare_capacity)),
                      IntField("min_spare_capacity", static_cast<std::int64_t>(policy_->options().min_spare_capacity))});

  result.decision         = LaunchDecision::kLaunched;
  result.launched_node_id = std::move(node_id);
  return result;
}

} // namespace medianode::autoscale
