#include "internal/model/state_machine.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using medianode::model::NextState;
using medianode::model::NodeEvent;
using medianode::model::NodeState;
using medianode::model::Transition;

constexpr NodeState kAllStates[] = {NodeState::kLaunching, NodeState::kRunning, NodeState::kWaitingIdleToTerminate, NodeState::kTerminating,
                                    NodeState::kCanceled};
constexpr NodeEvent kAllEvents[] = {NodeEvent::kProvisioningConfirmed, NodeEvent::kProvisioningAborted, NodeEvent::kUsageReachedZero,
                                    NodeEvent::kUsageResumed,          NodeEvent::kGracePeriodElapsed,  NodeEvent::kDropRequested};

void TestTableTransitions() {
  assert(Transition("n", NodeState::kLaunching, NodeEvent::kProvisioningConfirmed) == NodeState::kRunning);
  assert(Transition("n", NodeState::kLaunching, NodeEvent::kProvisioningAborted) == NodeState::kCanceled);
  assert(Transition("n", NodeState::kRunning, NodeEvent::kUsageReachedZero) == NodeState::kWaitingIdleToTerminate);
  assert(Transition("n", NodeState::kWaitingIdleToTerminate, NodeEvent::kUsageResumed) == NodeState::kRunning);
  assert(Transition("n", NodeState::kWaitingIdleToTerminate, NodeEvent::kGracePeriodElapsed) == NodeState::kTerminating);
  assert(Transition("n", NodeState::kWaitingIdleToTerminate, NodeEvent::kDropRequested) == NodeState::kTerminating);
}

void TestEveryOtherPairIsRejected() {
  int accepted = 0;
  for (const auto state : kAllStates) {
    for (const auto event : kAllEvents) {
      if (NextState(state, event)) {
        ++accepted;
        continue;
      }

      bool threw = false;
      try {
        Transition("node-x", state, event);
      } catch (const medianode::util::InvalidStateTransition& e) {
        threw = std::string(e.what()).find("node-x") != std::string::npos;
      }
      assert(threw);
    }
  }
  assert(accepted == 6);
}

void TestTerminalStatesHaveNoExits() {
  for (const auto event : kAllEvents) {
    assert(!NextState(NodeState::kTerminating, event));
    assert(!NextState(NodeState::kCanceled, event));
  }
}

void TestRegistrationAcceptance() {
  static_assert(medianode::model::AcceptsRegistration(NodeState::kRunning));
  static_assert(medianode::model::AcceptsRegistration(NodeState::kWaitingIdleToTerminate));
  static_assert(!medianode::model::AcceptsRegistration(NodeState::kLaunching));
  static_assert(!medianode::model::AcceptsRegistration(NodeState::kTerminating));
  static_assert(!medianode::model::AcceptsRegistration(NodeState::kCanceled));
}

void TestStateNames() {
  assert(medianode::model::ToString(NodeState::kWaitingIdleToTerminate) == "WAITING_IDLE_TO_TERMINATE");
  assert(medianode::model::ToString(NodeState::kLaunching) == "LAUNCHING");
}

} // namespace

int main() {
  TestTableTransitions();
  TestEveryOtherPairIsRejected();
  TestTerminalStatesHaveNoExits();
  TestRegistrationAcceptance();
  TestStateNames();

  std::cout << "medianode_unit_state_machine: pass\n";
  return 0;
}
