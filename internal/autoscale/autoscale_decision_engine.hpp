#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "autoscale_policy.hpp"
#include "internal/util/time.hpp"

namespace medianode::registry {
class MediaNodeRegistry;
}
namespace medianode::provisioning {
class ProvisioningGateway;
}

namespace medianode::autoscale {

enum class LaunchDecision : std::uint8_t {
  kNotNeeded       = 1,
  kLaunchPending   = 2,
  kFleetAtCapacity = 3,
  kLaunched        = 4,
  kFailed          = 5,
};

std::string_view ToString(LaunchDecision decision);

struct DecisionResult {
  LaunchDecision             decision = LaunchDecision::kNotNeeded;
  FleetLoad                  load;
  std::optional<std::string> launched_node_id;
};

/*
  Requests a new media node when the fleet runs short of spare capacity.

  Decisions are serialized: at most one node is LAUNCHING at any time, so a
  burst of registrations during one demand spike produces a single launch.
  A failed launch request inserts nothing; the next registration retries.
*/
class AutoscaleDecisionEngine {
 public:
  AutoscaleDecisionEngine(std::shared_ptr<AutoscalePolicy> policy, std::shared_ptr<registry::MediaNodeRegistry> registry,
                          std::shared_ptr<provisioning::ProvisioningGateway> gateway, std::shared_ptr<util::Clock> clock);

  DecisionResult Evaluate(const std::vector<model::MediaNode>& fleet);

 private:
  std::shared_ptr<AutoscalePolicy>                   policy_;
  std::shared_ptr<registry::MediaNodeRegistry>       registry_;
  std::shared_ptr<provisioning::ProvisioningGateway> gateway_;
  std::shared_ptr<util::Clock>                       clock_;

  std::mutex mutex_;
};

} // namespace medianode::autoscale
