#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/reaper/deadline.hpp"
#include "media_node_manager.hpp"

namespace medianode::registry {
class MediaNodeRegistry;
}
namespace medianode::reaper {
class IdleReaper;
}
namespace medianode::autoscale {
class AutoscaleDecisionEngine;
}
namespace medianode::provisioning {
class ProvisioningGateway;
}

namespace medianode::core {

struct LifecycleOptions {
  util::Duration idle_grace_period{std::chrono::minutes(5)};
  util::Duration canceled_retention{std::chrono::seconds(30)};

  std::uint32_t  max_termination_retries = 3;
  util::Duration termination_retry_backoff{std::chrono::seconds(30)};
};

/*
  Media node lifecycle driven by usage and provisioning events.

  Every operation on a node runs inside the registry's per-node critical
  section (MediaNodeRegistry::Mutate), including deadline fires from the
  reaper thread, so a registration racing an idle fire is decided by
  whichever enters first. Reaper deadlines are armed and cancelled inside
  that same section; the record keeps the generation of its live deadline
  and fires carrying any other generation are discarded.

  Provisioning requests are issued after the state change is committed and
  outside the per-node section.
*/
class LifecycleMediaNodeManager final : public MediaNodeManager, public reaper::DeadlineHandler {
 public:
  LifecycleMediaNodeManager(LifecycleOptions options, std::shared_ptr<registry::MediaNodeRegistry> registry,
                            std::shared_ptr<reaper::IdleReaper> reaper, std::shared_ptr<autoscale::AutoscaleDecisionEngine> autoscale,
                            std::shared_ptr<provisioning::ProvisioningGateway> gateway, std::shared_ptr<util::Clock> clock);
  ~LifecycleMediaNodeManager() override;

  LifecycleMediaNodeManager(const LifecycleMediaNodeManager&)            = delete;
  LifecycleMediaNodeManager& operator=(const LifecycleMediaNodeManager&) = delete;

  void MediaNodeUsageRegistration(const model::MediaNode& node, util::TimePoint time_of_connection,
                                  const std::vector<model::MediaNode>& existing_nodes) override;
  void MediaNodeUsageDeregistration(const model::MediaNode& node, util::TimePoint time_of_disconnection) override;
  void DropIdleMediaNode(const std::string& media_node_id) override;

  // Same as DropIdleMediaNode; returns whether this call moved the node out
  // of WAITING_IDLE_TO_TERMINATE.
  bool TryDropIdleMediaNode(const std::string& media_node_id);

  bool IsLaunching(const std::string& media_node_id) const override;
  bool IsCanceled(const std::string& media_node_id) const override;
  bool IsRunning(const std::string& media_node_id) const override;
  bool IsTerminating(const std::string& media_node_id) const override;
  bool IsWaitingIdleToTerminate(const std::string& media_node_id) const override;

  // Provisioning events.
  void ConfirmAvailable(const std::string& media_node_id, util::TimePoint at);
  void AbortLaunch(const std::string& media_node_id, util::TimePoint at);
  void ConfirmTerminated(const std::string& media_node_id);
  void ReportTerminationFailure(const std::string& media_node_id, const std::string& reason, util::TimePoint at);

  // Runs the autoscale decision against the registry's view of the fleet.
  // Used at startup and after provisioning events, when no registration
  // would otherwise trigger it.
  void EnsureCapacity();

  void OnDeadline(const reaper::Deadline& deadline) override;

  std::optional<model::MediaNode> FindMediaNode(const std::string& media_node_id) const;
  std::vector<model::MediaNode>   ListMediaNodes() const;

  // Rejects further registrations and discards every pending deadline.
  void Shutdown();
  bool IsShutdown() const;

 private:
  bool StateIs(const std::string& media_node_id, model::NodeState state) const;

  void RequestTermination(const std::string& media_node_id);
  void HandleTerminationFailure(const std::string& media_node_id, const std::string& reason, util::TimePoint at);

  void FireIdleGrace(const reaper::Deadline& deadline);
  void FireTerminationRetry(const reaper::Deadline& deadline);
  void FireCanceledRetention(const reaper::Deadline& deadline);

  void RecordTransition(const std::string& media_node_id, model::NodeState from, model::NodeState to) const;
  void PublishFleetGauge() const;

  LifecycleOptions                                   options_;
  std::shared_ptr<registry::MediaNodeRegistry>       registry_;
  std::shared_ptr<reaper::IdleReaper>                reaper_;
  std::shared_ptr<autoscale::AutoscaleDecisionEngine> autoscale_;
  std::shared_ptr<provisioning::ProvisioningGateway> gateway_;
  std::shared_ptr<util::Clock>                       clock_;

  std::atomic<bool> shutdown_{false};
};

} // namespace medianode::core
