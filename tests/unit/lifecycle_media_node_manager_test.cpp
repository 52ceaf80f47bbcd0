#include "internal/core/lifecycle_media_node_manager.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/autoscale/autoscale_decision_engine.hpp"
#include "internal/provisioning/provisioning_gateway.hpp"
#include "internal/reaper/idle_reaper.hpp"
#include "internal/registry/media_node_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using medianode::autoscale::AutoscaleDecisionEngine;
using medianode::autoscale::AutoscaleOptions;
using medianode::autoscale::AutoscalePolicy;
using medianode::core::LifecycleMediaNodeManager;
using medianode::core::LifecycleOptions;
using medianode::model::MediaNode;
using medianode::model::NodeState;
using medianode::reaper::DeadlineKind;
using medianode::reaper::IdleReaper;
using medianode::registry::MediaNodeRegistry;
using medianode::util::ManualClock;
using medianode::util::TimePoint;
using std::chrono::seconds;

const TimePoint kEpoch{};

TimePoint At(int second) {
  return kEpoch + seconds(second);
}

class ScriptedGateway final : public medianode::provisioning::ProvisioningGateway {
 public:
  std::string RequestLaunch() override {
    ++launches;
    return "launched-" + std::to_string(launches);
  }

  void RequestTermination(const std::string& node_id) override {
    terminations.push_back(node_id);
    if (fail_termination) {
      throw medianode::util::ProvisioningFailure("instance api unreachable");
    }
  }

  int                      launches         = 0;
  bool                     fail_termination = false;
  std::vector<std::string> terminations;
};

LifecycleOptions DefaultOptions() {
  LifecycleOptions options;
  options.idle_grace_period         = seconds(60);
  options.canceled_retention        = seconds(30);
  options.max_termination_retries   = 2;
  options.termination_retry_backoff = seconds(10);
  return options;
}

struct Fixture {
  explicit Fixture(LifecycleOptions options = DefaultOptions(), AutoscaleOptions autoscale = AutoscaleOptions{false, 100, 20, 0})
      : clock(std::make_shared<ManualClock>(kEpoch)),
        registry(std::make_shared<MediaNodeRegistry>()),
        reaper(std::make_shared<IdleReaper>(clock, seconds(1))),
        gateway(std::make_shared<ScriptedGateway>()) {
    auto engine = std::make_shared<AutoscaleDecisionEngine>(std::make_shared<AutoscalePolicy>(autoscale), registry, gateway, clock);
    manager     = std::make_unique<LifecycleMediaNodeManager>(options, registry, reaper, engine, gateway, clock);
  }

  MediaNode Node(const std::string& id) const {
    return registry->Get(id);
  }

  // Inserts a LAUNCHING node and confirms it.
  void AddRunning(const std::string& id) {
    registry->Insert(medianode::model::MakeLaunchingNode(id, clock->Now()));
    manager->ConfirmAvailable(id, clock->Now());
  }

  void Register(const std::string& id, TimePoint at) {
    clock->Set(at);
    manager->MediaNodeUsageRegistration(Node(id), at, registry->Snapshot());
  }

  void Deregister(const std::string& id, TimePoint at) {
    clock->Set(at);
    manager->MediaNodeUsageDeregistration(Node(id), at);
  }

  std::size_t Fire(TimePoint now) {
    clock->Set(now);
    return reaper->FireDue(now);
  }

  std::shared_ptr<ManualClock>               clock;
  std::shared_ptr<MediaNodeRegistry>         registry;
  std::shared_ptr<IdleReaper>                reaper;
  std::shared_ptr<ScriptedGateway>           gateway;
  std::unique_ptr<LifecycleMediaNodeManager> manager;
};

int TrueCount(const LifecycleMediaNodeManager& manager, const std::string& id) {
  return static_cast<int>(manager.IsLaunching(id)) + static_cast<int>(manager.IsRunning(id)) +
         static_cast<int>(manager.IsWaitingIdleToTerminate(id)) + static_cast<int>(manager.IsTerminating(id)) +
         static_cast<int>(manager.IsCanceled(id));
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestSessionLifecycleScenario() {
  Fixture f;
  f.registry->Insert(medianode::model::MakeLaunchingNode("node-n", kEpoch));
  assert(f.manager->IsLaunching("node-n"));

  f.manager->ConfirmAvailable("node-n", kEpoch);
  assert(f.manager->IsRunning("node-n"));

  f.Register("node-n", At(0));
  f.Register("node-n", At(1));
  f.Register("node-n", At(2));
  assert(f.Node("node-n").usage_count == 3);

  f.Deregister("node-n", At(4));
  f.Deregister("node-n", At(7));
  f.Deregister("node-n", At(10));
  assert(f.Node("node-n").usage_count == 0);
  assert(f.manager->IsWaitingIdleToTerminate("node-n"));
  assert(f.Node("node-n").idle_since == At(10));
  assert(f.reaper->Pending("node-n")->at == At(70));

  f.Register("node-n", At(11));
  assert(f.manager->IsRunning("node-n"));
  assert(!f.reaper->Pending("node-n"));
  assert(!f.Node("node-n").idle_since);

  // The cancelled deadline never fires.
  assert(f.Fire(At(70)) == 0);
  assert(f.manager->IsRunning("node-n"));
  assert(f.gateway->terminations.empty());
}

void TestGraceExpiryTerminatesIdleNode() {
  Fixture f;
  f.AddRunning("node-n");
  f.Register("node-n", At(0));
  f.Deregister("node-n", At(10));

  assert(f.Fire(At(69)) == 0);
  assert(f.manager->IsWaitingIdleToTerminate("node-n"));

  assert(f.Fire(At(70)) == 1);
  assert(f.manager->IsTerminating("node-n"));
  assert(f.gateway->terminations == std::vector<std::string>{"node-n"});

  // A late registration is refused and changes nothing.
  assert(Throws<medianode::util::InvalidStateTransition>([&] { f.Register("node-n", At(71)); }));
  assert(f.Node("node-n").usage_count == 0);

  f.manager->ConfirmTerminated("node-n");
  assert(!f.registry->Find("node-n"));
  assert(TrueCount(*f.manager, "node-n") == 0);
  assert(f.registry->IsRetired("node-n"));
}

void TestStaleDeadlineIsDiscarded() {
  Fixture f;
  f.AddRunning("node-n");
  f.Register("node-n", At(0));
  f.Deregister("node-n", At(1));

  const auto stale = *f.reaper->Pending("node-n");

  // Registration wins; the deadline taken before it must not terminate.
  f.Register("node-n", At(2));
  f.manager->OnDeadline(stale);
  assert(f.manager->IsRunning("node-n"));
  assert(f.Node("node-n").usage_count == 1);

  // Idle again: the old generation is still superseded.
  f.Deregister("node-n", At(3));
  f.manager->OnDeadline(stale);
  assert(f.manager->IsWaitingIdleToTerminate("node-n"));
  assert(f.gateway->terminations.empty());
}

void TestRepeatedIdleCyclesKeepOneDeadline() {
  Fixture f;
  f.AddRunning("node-n");

  for (int i = 0; i < 5; ++i) {
    f.Register("node-n", At(i * 2));
    f.Deregister("node-n", At(i * 2 + 1));
  }

  assert(f.reaper->PendingCount() == 1);
  assert(f.reaper->Pending("node-n")->at == At(9 + 60));

  assert(f.Fire(At(200)) == 1);
  assert(f.Fire(At(300)) == 0);
  assert(f.gateway->terminations.size() == 1);
}

void TestDropIdleMediaNode() {
  Fixture f;
  f.AddRunning("node-n");
  f.Register("node-n", At(0));

  // RUNNING: no-op.
  f.manager->DropIdleMediaNode("node-n");
  assert(f.manager->IsRunning("node-n"));
  assert(f.Node("node-n").usage_count == 1);

  // Unknown: no-op.
  f.manager->DropIdleMediaNode("missing");
  assert(f.gateway->terminations.empty());

  f.Deregister("node-n", At(1));
  f.manager->DropIdleMediaNode("node-n");
  assert(f.manager->IsTerminating("node-n"));
  assert(!f.reaper->Pending("node-n"));
  assert(f.gateway->terminations == std::vector<std::string>{"node-n"});

  // Already terminating: no second request.
  f.manager->DropIdleMediaNode("node-n");
  assert(f.gateway->terminations.size() == 1);
}

void TestRegistrationRejectedOutsideServingStates() {
  Fixture f;
  f.registry->Insert(medianode::model::MakeLaunchingNode("node-launching", kEpoch));

  f.registry->Insert(medianode::model::MakeLaunchingNode("node-canceled", kEpoch));
  f.manager->AbortLaunch("node-canceled", kEpoch);

  for (const auto* id : {"node-launching", "node-canceled"}) {
    const auto before = f.Node(id);
    assert(Throws<medianode::util::InvalidStateTransition>([&] { f.Register(id, At(5)); }));
    const auto after = f.Node(id);
    assert(after.usage_count == 0);
    assert(after.state == before.state);
    assert(after.last_usage_change_at == before.last_usage_change_at);
  }

  assert(Throws<medianode::util::NodeNotFound>([&] {
    MediaNode unknown;
    unknown.id = "missing";
    f.manager->MediaNodeUsageRegistration(unknown, At(5), {});
  }));
}

void TestDeregistrationUnderflow() {
  Fixture f;
  f.AddRunning("node-n");

  assert(Throws<medianode::util::UsageUnderflow>([&] { f.Deregister("node-n", At(3)); }));
  assert(f.Node("node-n").usage_count == 0);
  assert(f.manager->IsRunning("node-n"));
  assert(f.reaper->PendingCount() == 0);
}

void TestPredicatesAreMutuallyExclusive() {
  Fixture f;
  f.registry->Insert(medianode::model::MakeLaunchingNode("node-n", kEpoch));
  assert(TrueCount(*f.manager, "node-n") == 1);

  f.manager->ConfirmAvailable("node-n", kEpoch);
  assert(TrueCount(*f.manager, "node-n") == 1);

  f.Register("node-n", At(1));
  f.Deregister("node-n", At(2));
  assert(TrueCount(*f.manager, "node-n") == 1);

  f.Fire(At(100));
  assert(TrueCount(*f.manager, "node-n") == 1);
  assert(TrueCount(*f.manager, "unknown") == 0);
}

void TestTerminationRetriesThenEscalates() {
  Fixture f;
  f.gateway->fail_termination = true;
  f.AddRunning("node-n");
  f.Register("node-n", At(0));
  f.Deregister("node-n", At(1));

  f.clock->Set(At(2));
  f.manager->DropIdleMediaNode("node-n");
  assert(f.manager->IsTerminating("node-n"));
  assert(f.Node("node-n").termination_attempts == 1);
  assert(f.reaper->Pending("node-n")->kind == DeadlineKind::kTerminationRetry);
  assert(f.reaper->Pending("node-n")->at == At(12));

  assert(f.Fire(At(12)) == 1);
  assert(f.gateway->terminations.size() == 2);
  assert(f.Node("node-n").termination_attempts == 2);
  assert(!f.Node("node-n").termination_escalated);

  assert(f.Fire(At(22)) == 1);
  assert(f.gateway->terminations.size() == 3);
  assert(f.Node("node-n").termination_attempts == 3);
  assert(f.Node("node-n").termination_escalated);
  assert(!f.reaper->Pending("node-n"));

  // Escalated nodes stay TERMINATING until the provisioner reports back.
  assert(f.manager->IsTerminating("node-n"));
  f.manager->ConfirmTerminated("node-n");
  assert(!f.registry->Find("node-n"));
}

void TestZeroRetriesEscalatesOnFirstFailure() {
  auto options                    = DefaultOptions();
  options.max_termination_retries = 0;
  Fixture f(options);
  f.gateway->fail_termination = true;
  f.AddRunning("node-n");
  f.Register("node-n", At(0));
  f.Deregister("node-n", At(1));

  f.clock->Set(At(2));
  assert(f.manager->TryDropIdleMediaNode("node-n"));
  assert(f.Node("node-n").termination_attempts == 1);
  assert(f.Node("node-n").termination_escalated);
  assert(!f.reaper->Pending("node-n"));
  assert(f.manager->IsTerminating("node-n"));
}

void TestReportedTerminationFailureIsRetried() {
  Fixture f;
  f.AddRunning("node-n");
  f.Register("node-n", At(0));
  f.Deregister("node-n", At(1));
  f.Fire(At(61));
  assert(f.gateway->terminations.size() == 1);

  f.manager->ReportTerminationFailure("node-n", "instance busy", At(62));
  assert(f.Node("node-n").termination_attempts == 1);
  assert(f.reaper->Pending("node-n")->at == At(72));

  assert(f.Fire(At(72)) == 1);
  assert(f.gateway->terminations.size() == 2);
  assert(f.manager->IsTerminating("node-n"));

  assert(Throws<medianode::util::InvalidStateTransition>([&] {
    f.AddRunning("node-other");
    f.manager->ReportTerminationFailure("node-other", "wrong node", At(73));
  }));
}

void TestAbortedLaunchIsFinalizedAfterRetention() {
  Fixture f;
  f.registry->Insert(medianode::model::MakeLaunchingNode("node-n", kEpoch));

  f.manager->AbortLaunch("node-n", At(5));
  assert(f.manager->IsCanceled("node-n"));
  assert(f.reaper->Pending("node-n")->kind == DeadlineKind::kCanceledRetention);

  assert(f.Fire(At(34)) == 0);
  assert(f.manager->IsCanceled("node-n"));

  assert(f.Fire(At(35)) == 1);
  assert(!f.registry->Find("node-n"));
  assert(!f.manager->IsCanceled("node-n"));
  assert(f.registry->IsRetired("node-n"));
}

void TestProvisioningEventsValidateState() {
  Fixture f;
  f.AddRunning("node-n");

  assert(Throws<medianode::util::InvalidStateTransition>([&] { f.manager->ConfirmAvailable("node-n", At(1)); }));
  assert(Throws<medianode::util::InvalidStateTransition>([&] { f.manager->AbortLaunch("node-n", At(1)); }));
  assert(Throws<medianode::util::InvalidStateTransition>([&] { f.manager->ConfirmTerminated("node-n"); }));
  assert(Throws<medianode::util::NodeNotFound>([&] { f.manager->ConfirmTerminated("missing"); }));
  assert(Throws<medianode::util::NodeNotFound>([&] { f.manager->ConfirmAvailable("missing", At(1)); }));
  assert(f.manager->IsRunning("node-n"));
}

void TestRegistrationTriggersAutoscaleLaunch() {
  Fixture f(DefaultOptions(), AutoscaleOptions{true, 2, 1, 0});
  f.AddRunning("node-n");

  f.Register("node-n", At(0));
  assert(f.gateway->launches == 0);

  f.Register("node-n", At(1));
  assert(f.gateway->launches == 1);
  assert(f.manager->IsLaunching("launched-1"));

  // Launch in flight: no second request.
  f.Deregister("node-n", At(2));
  f.Register("node-n", At(3));
  assert(f.gateway->launches == 1);

  f.manager->ConfirmAvailable("launched-1", At(4));
  assert(f.manager->IsRunning("launched-1"));
}

void TestShutdownRejectsRegistrationsAndDrainsDeadlines() {
  Fixture f;
  f.AddRunning("node-a");
  f.AddRunning("node-b");
  f.Register("node-a", At(0));
  f.Register("node-b", At(0));
  f.Deregister("node-a", At(1));
  assert(f.reaper->PendingCount() == 1);

  f.manager->Shutdown();
  f.manager->Shutdown();
  assert(f.manager->IsShutdown());
  assert(f.reaper->PendingCount() == 0);

  assert(Throws<medianode::util::Unavailable>([&] { f.Register("node-a", At(2)); }));

  // Detaches still settle usage but no new deadline is armed.
  f.Deregister("node-b", At(3));
  assert(f.manager->IsWaitingIdleToTerminate("node-b"));
  assert(f.Node("node-b").deadline_generation == 0);
  assert(f.reaper->PendingCount() == 0);
  assert(f.Fire(At(1000)) == 0);
}

} // namespace

int main() {
  TestSessionLifecycleScenario();
  TestGraceExpiryTerminatesIdleNode();
  TestStaleDeadlineIsDiscarded();
  TestRepeatedIdleCyclesKeepOneDeadline();
  TestDropIdleMediaNode();
  TestRegistrationRejectedOutsideServingStates();
  TestDeregistrationUnderflow();
  TestPredicatesAreMutuallyExclusive();
  TestTerminationRetriesThenEscalates();
  TestZeroRetriesEscalatesOnFirstFailure();
  TestReportedTerminationFailureIsRetried();
  TestAbortedLaunchIsFinalizedAfterRetention();
  TestProvisioningEventsValidateState();
  TestRegistrationTriggersAutoscaleLaunch();
  TestShutdownRejectsRegistrationsAndDrainsDeadlines();

  std::cout << "medianode_unit_lifecycle_media_node_manager: pass\n";
  return 0;
}
