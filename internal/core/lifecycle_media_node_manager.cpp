#include "lifecycle_media_node_manager.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "internal/autoscale/autoscale_decision_engine.hpp"
#include "internal/core/usage_tracker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/provisioning/provisioning_gateway.hpp"
#include "internal/reaper/idle_reaper.hpp"
#include "internal/registry/media_node_registry.hpp"
#include "internal/util/errors.hpp"

namespace medianode::core {

using medianode::observability::IntField;
using medianode::observability::StringField;
using model::NodeEvent;
using model::NodeState;
using reaper::DeadlineKind;

namespace {

// Logs a rejected contract before handing it back to the caller.
template <typename Fn>
auto Reported(std::string_view operation, const std::string& media_node_id, Fn&& fn) {
  try {
    return fn();
  } catch (const util::InvalidStateTransition& e) {
    MEDIANODE_LOG_WARN("Rejected media node operation", {StringField("operation", operation), StringField("node_id", media_node_id),
                                                         StringField("reason", "invalid_state_transition"), StringField("error", e.what())});
    throw;
  } catch (const util::UsageUnderflow& e) {
    MEDIANODE_LOG_WARN("Rejected media node operation", {StringField("operation", operation), StringField("node_id", media_node_id),
                                                         StringField("reason", "usage_underflow"), StringField("error", e.what())});
    throw;
  } catch (const util::NodeNotFound& e) {
    MEDIANODE_LOG_WARN("Rejected media node operation", {StringField("operation", operation), StringField("node_id", media_node_id),
                                                         StringField("reason", "node_not_found"), StringField("error", e.what())});
    throw;
  }
}

} // namespace

LifecycleMediaNodeManager::LifecycleMediaNodeManager(LifecycleOptions options, std::shared_ptr<registry::MediaNodeRegistry> registry,
                                                     std::shared_ptr<reaper::IdleReaper> reaper,
                                                     std::shared_ptr<autoscale::AutoscaleDecisionEngine> autoscale,
                                                     std::shared_ptr<provisioning::ProvisioningGateway> gateway, std::shared_ptr<util::Clock> clock)
    : options_(options),
      registry_(std::move(registry)),
      reaper_(std::move(reaper)),
      autoscale_(std::move(autoscale)),
      gateway_(std::move(gateway)),
      clock_(std::move(clock)) {
  if (!registry_ || !reaper_ || !autoscale_ || !gateway_ || !clock_) {
    throw std::invalid_argument("lifecycle manager requires registry, reaper, autoscale engine, gateway and clock");
  }
  if (options_.idle_grace_period.count() < 0 || options_.canceled_retention.count() < 0 || options_.termination_retry_backoff.count() < 0) {
    throw std::invalid_argument("lifecycle durations must not be negative");
  }
  reaper_->SetHandler(this);
}

LifecycleMediaNodeManager::~LifecycleMediaNodeManager() {
  Shutdown();
}

// ------------------------------------------------------------
// Usage
// ------------------------------------------------------------

void LifecycleMediaNodeManager::MediaNodeUsageRegistration(const model::MediaNode& node, util::TimePoint time_of_connection,
                                                           const std::vector<model::MediaNode>& existing_nodes) {
  if (shutdown_) {
    throw util::Unavailable("media node manager is shut down; registration on " + node.id + " rejected");
  }

  UsageChange change;
  auto        updated = Reported("registration", node.id, [&] {
    return registry_->Mutate(node.id, [&](model::MediaNode& record) {
      change = UsageTracker::RecordAttach(record, time_of_connection);
      if (change.resumed_from_idle) {
        reaper_->Cancel(record.id);
        record.deadline_generation = 0;
      }
      return record;
    });
  });

  if (change.resumed_from_idle) {
    RecordTransition(node.id, NodeState::kWaitingIdleToTerminate, NodeState::kRunning);
    MEDIANODE_LOG_INFO("Idle media node resumed, termination cancelled", {StringField("node_id", node.id)});
  }
  MEDIANODE_LOG_DEBUG("Media node usage registered",
                      {StringField("node_id", node.id), IntField("usage_count", static_cast<std::int64_t>(change.usage_after))});

  std::vector<model::MediaNode> fleet;
  fleet.reserve(existing_nodes.size() + 1);
  for (const auto& other : existing_nodes) {
    if (other.id != updated.id) {
      fleet.push_back(other);
    }
  }
  fleet.push_back(std::move(updated));

  const auto decision = autoscale_->Evaluate(fleet);
  if (decision.decision == autoscale::LaunchDecision::kLaunched) {
    PublishFleetGauge();
  }
}

void LifecycleMediaNodeManager::MediaNodeUsageDeregistration(const model::MediaNode& node, util::TimePoint time_of_disconnection) {
  UsageChange change;
  Reported("deregistration", node.id, [&] {
    registry_->Mutate(node.id, [&](model::MediaNode& record) {
      change = UsageTracker::RecordDetach(record, time_of_disconnection);
      if (change.became_idle && !shutdown_) {
        const auto deadline        = reaper_->Arm(record.id, DeadlineKind::kIdleGrace, *record.idle_since + options_.idle_grace_period);
        record.deadline_generation = deadline.generation;
      }
    });
  });

  if (change.became_idle) {
    RecordTransition(node.id, NodeState::kRunning, NodeState::kWaitingIdleToTerminate);
    MEDIANODE_LOG_INFO("Media node idle, termination scheduled",
                       {StringField("node_id", node.id), IntField("grace_period_ms", options_.idle_grace_period.count())});
  }
  MEDIANODE_LOG_DEBUG("Media node usage deregistered",
                      {StringField("node_id", node.id), IntField("usage_count", static_cast<std::int64_t>(change.usage_after))});
}

void LifecycleMediaNodeManager::DropIdleMediaNode(const std::string& media_node_id) {
  TryDropIdleMediaNode(media_node_id);
}

bool LifecycleMediaNodeManager::TryDropIdleMediaNode(const std::string& media_node_id) {
  bool      dropped  = false;
  NodeState observed = NodeState::kWaitingIdleToTerminate;
  try {
    dropped = registry_->Mutate(media_node_id, [&](model::MediaNode& record) {
      observed = record.state;
      if (record.state != NodeState::kWaitingIdleToTerminate) {
        return false;
      }
      record.state               = model::Transition(record.id, record.state, NodeEvent::kDropRequested);
      record.state_changed_at    = clock_->Now();
      record.deadline_generation = 0;
      reaper_->Cancel(record.id);
      return true;
    });
  } catch (const util::NodeNotFound&) {
    MEDIANODE_LOG_INFO("Ignoring drop of unknown media node", {StringField("node_id", media_node_id)});
    return false;
  }

  if (!dropped) {
    MEDIANODE_LOG_INFO("Ignoring drop of media node that is not idle",
                       {StringField("node_id", media_node_id), StringField("state", model::ToString(observed))});
    return false;
  }

  RecordTransition(media_node_id, NodeState::kWaitingIdleToTerminate, NodeState::kTerminating);
  RequestTermination(media_node_id);
  return true;
}

// ------------------------------------------------------------
// State predicates
// ------------------------------------------------------------

bool LifecycleMediaNodeManager::StateIs(const std::string& media_node_id, NodeState state) const {
  const auto current = registry_->StateOf(media_node_id);
  return current && *current == state;
}

bool LifecycleMediaNodeManager::IsLaunching(const std::string& media_node_id) const {
  return StateIs(media_node_id, NodeState::kLaunching);
}

bool LifecycleMediaNodeManager::IsCanceled(const std::string& media_node_id) const {
  return StateIs(media_node_id, NodeState::kCanceled);
}

bool LifecycleMediaNodeManager::IsRunning(const std::string& media_node_id) const {
  return StateIs(media_node_id, NodeState::kRunning);
}

bool LifecycleMediaNodeManager::IsTerminating(const std::string& media_node_id) const {
  return StateIs(media_node_id, NodeState::kTerminating);
}

bool LifecycleMediaNodeManager::IsWaitingIdleToTerminate(const std::string& media_node_id) const {
  return StateIs(media_node_id, NodeState::kWaitingIdleToTerminate);
}

// ------------------------------------------------------------
// Provisioning events
// ------------------------------------------------------------

void LifecycleMediaNodeManager::ConfirmAvailable(const std::string& media_node_id, util::TimePoint at) {
  Reported("confirm_available", media_node_id, [&] {
    registry_->Mutate(media_node_id, [&](model::MediaNode& record) {
      record.state            = model::Transition(record.id, record.state, NodeEvent::kProvisioningConfirmed);
      record.state_changed_at = at;
    });
  });

  RecordTransition(media_node_id, NodeState::kLaunching, NodeState::kRunning);
  EnsureCapacity();
}

void LifecycleMediaNodeManager::AbortLaunch(const std::string& media_node_id, util::TimePoint at) {
  Reported("abort_launch", media_node_id, [&] {
    registry_->Mutate(media_node_id, [&](model::MediaNode& record) {
      record.state            = model::Transition(record.id, record.state, NodeEvent::kProvisioningAborted);
      record.state_changed_at = at;
      if (!shutdown_) {
        const auto deadline        = reaper_->Arm(record.id, DeadlineKind::kCanceledRetention, at + options_.canceled_retention);
        record.deadline_generation = deadline.generation;
      }
    });
  });

  RecordTransition(media_node_id, NodeState::kLaunching, NodeState::kCanceled);
  observability::Metrics::Instance().RecordProvisioningRequest("launch", false);
  EnsureCapacity();
}

void LifecycleMediaNodeManager::ConfirmTerminated(const std::string& media_node_id) {
  Reported("confirm_terminated", media_node_id, [&] {
    const bool removed = registry_->RemoveIf(media_node_id, [&](const model::MediaNode& record) {
      if (record.state != NodeState::kTerminating) {
        return false;
      }
      reaper_->Cancel(record.id);
      return true;
    });
    if (!removed) {
      const auto state = registry_->StateOf(media_node_id);
      throw util::InvalidStateTransition("media node " + media_node_id + ": termination confirmed while in state " +
                                         std::string(state ? model::ToString(*state) : "REMOVED"));
    }
  });

  MEDIANODE_LOG_INFO("Media node terminated and removed", {StringField("node_id", media_node_id)});
  PublishFleetGauge();
  EnsureCapacity();
}

void LifecycleMediaNodeManager::ReportTerminationFailure(const std::string& media_node_id, const std::string& reason, util::TimePoint at) {
  Reported("report_termination_failure", media_node_id, [&] { HandleTerminationFailure(media_node_id, reason, at); });
}

void LifecycleMediaNodeManager::RequestTermination(const std::string& media_node_id) {
  try {
    gateway_->RequestTermination(media_node_id);
  } catch (const util::ProvisioningFailure& e) {
    observability::Metrics::Instance().RecordProvisioningRequest("terminate", false);
    HandleTerminationFailure(media_node_id, e.what(), clock_->Now());
    return;
  }

  observability::Metrics::Instance().RecordProvisioningRequest("terminate", true);
  MEDIANODE_LOG_INFO("Requested media node termination", {StringField("node_id", media_node_id)});
}

void LifecycleMediaNodeManager::HandleTerminationFailure(const std::string& media_node_id, const std::string& reason, util::TimePoint at) {
  const auto record = registry_->Mutate(media_node_id, [&](model::MediaNode& node) {
    if (node.state != NodeState::kTerminating) {
      throw util::InvalidStateTransition("media node " + node.id + ": termination failure reported while in state " +
                                         std::string(model::ToString(node.state)));
    }

    node.termination_attempts += 1;
    if (node.termination_attempts > options_.max_termination_retries) {
      node.termination_escalated = true;
      node.deadline_generation   = 0;
      reaper_->Cancel(node.id);
    } else if (!shutdown_) {
      const auto deadline      = reaper_->Arm(node.id, DeadlineKind::kTerminationRetry, at + options_.termination_retry_backoff);
      node.deadline_generation = deadline.generation;
    }
    return node;
  });

  if (record.termination_escalated) {
    MEDIANODE_LOG_ERROR("Media node termination keeps failing, operator action required",
                        {StringField("node_id", media_node_id), IntField("attempts", record.termination_attempts), StringField("error", reason)});
    return;
  }

  MEDIANODE_LOG_WARN("Media node termination failed, retry scheduled",
                     {StringField("node_id", media_node_id), IntField("attempts", record.termination_attempts),
                      IntField("retry_in_ms", options_.termination_retry_backoff.count()), StringField("error", reason)});
}

void LifecycleMediaNodeManager::EnsureCapacity() {
  if (shutdown_) {
    return;
  }

  const auto decision = autoscale_->Evaluate(registry_->Snapshot());
  if (decision.decision == autoscale::LaunchDecision::kLaunched) {
    PublishFleetGauge();
  }
}

// ------------------------------------------------------------
// Deadlines
// ------------------------------------------------------------

void LifecycleMediaNodeManager::OnDeadline(const reaper::Deadline& deadline) {
  try {
    switch (deadline.kind) {
      case DeadlineKind::kIdleGrace:
        FireIdleGrace(deadline);
        return;
      case DeadlineKind::kTerminationRetry:
        FireTerminationRetry(deadline);
        return;
      case DeadlineKind::kCanceledRetention:
        FireCanceledRetention(deadline);
        return;
    }
  } catch (const util::NodeNotFound&) {
    MEDIANODE_LOG_DEBUG("Discarding deadline for removed media node",
                        {StringField("node_id", deadline.node_id), StringField("kind", reaper::ToString(deadline.kind))});
  }
}

void LifecycleMediaNodeManager::FireIdleGrace(const reaper::Deadline& deadline) {
  const bool fired = registry_->Mutate(deadline.node_id, [&](model::MediaNode& record) {
    if (record.deadline_generation != deadline.generation || record.state != NodeState::kWaitingIdleToTerminate) {
      return false;
    }
    record.state               = model::Transition(record.id, record.state, NodeEvent::kGracePeriodElapsed);
    record.state_changed_at    = clock_->Now();
    record.deadline_generation = 0;
    return true;
  });

  if (!fired) {
    MEDIANODE_LOG_DEBUG("Discarding stale idle deadline", {StringField("node_id", deadline.node_id)});
    return;
  }

  RecordTransition(deadline.node_id, NodeState::kWaitingIdleToTerminate, NodeState::kTerminating);
  RequestTermination(deadline.node_id);
}

void LifecycleMediaNodeManager::FireTerminationRetry(const reaper::Deadline& deadline) {
  const bool retry = registry_->Mutate(deadline.node_id, [&](model::MediaNode& record) {
    if (record.deadline_generation != deadline.generation || record.state != NodeState::kTerminating || record.termination_escalated) {
      return false;
    }
    record.deadline_generation = 0;
    return true;
  });

  if (retry) {
    RequestTermination(deadline.node_id);
  }
}

void LifecycleMediaNodeManager::FireCanceledRetention(const reaper::Deadline& deadline) {
  const bool removed = registry_->RemoveIf(deadline.node_id, [&](const model::MediaNode& record) {
    return record.state == NodeState::kCanceled && record.deadline_generation == deadline.generation;
  });

  if (removed) {
    MEDIANODE_LOG_INFO("Canceled media node finalized and removed", {StringField("node_id", deadline.node_id)});
    PublishFleetGauge();
  }
}

// ------------------------------------------------------------
// Inspection and teardown
// ------------------------------------------------------------

std::optional<model::MediaNode> LifecycleMediaNodeManager::FindMediaNode(const std::string& media_node_id) const {
  return registry_->Find(media_node_id);
}

std::vector<model::MediaNode> LifecycleMediaNodeManager::ListMediaNodes() const {
  return registry_->Snapshot();
}

void LifecycleMediaNodeManager::Shutdown() {
  if (shutdown_.exchange(true)) {
    return;
  }

  const auto discarded = reaper_->Drain();
  reaper_->SetHandler(nullptr);
  MEDIANODE_LOG_INFO("Media node manager shut down",
                     {IntField("discarded_deadlines", static_cast<std::int64_t>(discarded)), IntField("nodes", static_cast<std::int64_t>(registry_->Size()))});
}

bool LifecycleMediaNodeManager::IsShutdown() const {
  return shutdown_;
}

void LifecycleMediaNodeManager::RecordTransition(const std::string& media_node_id, NodeState from, NodeState to) const {
  observability::Metrics::Instance().RecordTransition(model::ToString(from), model::ToString(to));
  MEDIANODE_LOG_INFO("Media node state changed",
                     {StringField("node_id", media_node_id), StringField("from", model::ToString(from)), StringField("to", model::ToString(to))});
  PublishFleetGauge();
}

void LifecycleMediaNodeManager::PublishFleetGauge() const {
  for (const auto state : {NodeState::kLaunching, NodeState::kRunning, NodeState::kWaitingIdleToTerminate, NodeState::kTerminating,
                           NodeState::kCanceled}) {
    observability::Metrics::Instance().SetFleetNodes(model::ToString(state), registry_->CountInState(state));
  }
}

} // namespace medianode::core
