#include "internal/provisioning/queueing_provisioning_gateway.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using medianode::provisioning::ProvisioningRequest;
using medianode::provisioning::QueueingProvisioningGateway;
using medianode::util::ManualClock;
using std::chrono::milliseconds;
using std::chrono::seconds;

const medianode::util::TimePoint kEpoch{};

void TestLaunchMintsDistinctIds() {
  QueueingProvisioningGateway gateway(std::make_shared<ManualClock>(kEpoch), 8);
  const auto                  a = gateway.RequestLaunch();
  const auto                  b = gateway.RequestLaunch();

  assert(a.size() == 36);
  assert(a != b);
  assert(gateway.PendingCount() == 2);
}

void TestDrainReturnsOldestFirst() {
  auto                        clock = std::make_shared<ManualClock>(kEpoch);
  QueueingProvisioningGateway gateway(clock, 8);

  const auto launched = gateway.RequestLaunch();
  clock->Advance(seconds(2));
  gateway.RequestTermination("node-old");

  const auto first = gateway.Drain(1);
  assert(first.size() == 1);
  assert(first.front().kind == ProvisioningRequest::Kind::kLaunch);
  assert(first.front().node_id == launched);
  assert(first.front().requested_at == kEpoch);

  const auto rest = gateway.Drain(0);
  assert(rest.size() == 1);
  assert(rest.front().kind == ProvisioningRequest::Kind::kTerminate);
  assert(rest.front().node_id == "node-old");
  assert(rest.front().requested_at == kEpoch + seconds(2));
  assert(gateway.PendingCount() == 0);
}

void TestFullQueueFailsRequest() {
  QueueingProvisioningGateway gateway(std::make_shared<ManualClock>(kEpoch), 1);
  gateway.RequestTermination("node-a");

  bool threw = false;
  try {
    gateway.RequestLaunch();
  } catch (const medianode::util::ProvisioningFailure&) {
    threw = true;
  }
  assert(threw);
  assert(gateway.PendingCount() == 1);
}

void TestWaitAndDrainWakesOnRequest() {
  QueueingProvisioningGateway gateway(std::make_shared<ManualClock>(kEpoch), 8);

  std::thread producer([&] {
    std::this_thread::sleep_for(milliseconds(20));
    gateway.RequestTermination("node-a");
  });

  const auto taken = gateway.WaitAndDrain(0, seconds(5));
  producer.join();

  assert(taken.size() == 1);
  assert(taken.front().node_id == "node-a");
}

void TestShutdownReleasesWaitersAndRejectsRequests() {
  QueueingProvisioningGateway gateway(std::make_shared<ManualClock>(kEpoch), 8);

  std::thread closer([&] {
    std::this_thread::sleep_for(milliseconds(20));
    gateway.Shutdown();
  });

  const auto taken = gateway.WaitAndDrain(0, seconds(5));
  closer.join();
  assert(taken.empty());

  bool threw = false;
  try {
    gateway.RequestTermination("node-a");
  } catch (const medianode::util::ProvisioningFailure&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLaunchMintsDistinctIds();
  TestDrainReturnsOldestFirst();
  TestFullQueueFailsRequest();
  TestWaitAndDrainWakesOnRequest();
  TestShutdownReleasesWaitersAndRejectsRequests();

  std::cout << "medianode_unit_queueing_provisioning_gateway: pass\n";
  return 0;
}
