#include "internal/registry/media_node_registry.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using medianode::model::MakeLaunchingNode;
using medianode::model::MediaNode;
using medianode::model::NodeState;
using medianode::registry::MediaNodeRegistry;

MediaNode RunningNode(const std::string& id, std::uint64_t usage = 0) {
  auto node        = MakeLaunchingNode(id, std::chrono::system_clock::time_point{});
  node.state       = NodeState::kRunning;
  node.usage_count = usage;
  return node;
}

void TestInsertGetAndDuplicate() {
  MediaNodeRegistry registry;
  registry.Insert(RunningNode("node-a", 2));

  const auto node = registry.Get("node-a");
  assert(node.usage_count == 2);
  assert(registry.StateOf("node-a") == NodeState::kRunning);

  bool threw = false;
  try {
    registry.Insert(RunningNode("node-a"));
  } catch (const medianode::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownIdsReportNotFound() {
  MediaNodeRegistry registry;
  assert(!registry.Find("missing"));
  assert(!registry.StateOf("missing"));

  bool threw = false;
  try {
    registry.Get("missing");
  } catch (const medianode::util::NodeNotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    registry.Mutate("missing", [](MediaNode&) {});
  } catch (const medianode::util::NodeNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestThrowingMutationLeavesRecordUnchanged() {
  MediaNodeRegistry registry;
  registry.Insert(RunningNode("node-a", 1));

  bool threw = false;
  try {
    registry.Mutate("node-a", [](MediaNode& node) {
      node.usage_count = 99;
      node.state       = NodeState::kTerminating;
      throw std::runtime_error("rejected");
    });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  const auto node = registry.Get("node-a");
  assert(node.usage_count == 1);
  assert(node.state == NodeState::kRunning);
  assert(registry.StateOf("node-a") == NodeState::kRunning);
}

void TestMutateReturnsCallbackResultAndPublishesState() {
  MediaNodeRegistry registry;
  registry.Insert(MakeLaunchingNode("node-a", std::chrono::system_clock::time_point{}));

  const auto usage = registry.Mutate("node-a", [](MediaNode& node) {
    node.state = NodeState::kRunning;
    node.id    = "renamed";
    return node.usage_count + 7;
  });
  assert(usage == 7);
  assert(registry.StateOf("node-a") == NodeState::kRunning);
  assert(registry.Get("node-a").id == "node-a");
  assert(!registry.Find("renamed"));
}

void TestRemovedIdsAreRetired() {
  MediaNodeRegistry registry;
  registry.Insert(RunningNode("node-a"));
  registry.Remove("node-a");

  assert(!registry.Find("node-a"));
  assert(registry.IsRetired("node-a"));
  assert(registry.Size() == 0);

  bool threw = false;
  try {
    registry.Insert(RunningNode("node-a"));
  } catch (const medianode::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
}

void TestRemoveIfHonorsPredicate() {
  MediaNodeRegistry registry;
  registry.Insert(RunningNode("node-a"));

  assert(!registry.RemoveIf("node-a", [](const MediaNode& node) { return node.state == NodeState::kCanceled; }));
  assert(registry.Find("node-a"));

  assert(registry.RemoveIf("node-a", [](const MediaNode& node) { return node.state == NodeState::kRunning; }));
  assert(!registry.Find("node-a"));
}

void TestCountsAndSnapshot() {
  MediaNodeRegistry registry;
  registry.Insert(RunningNode("node-a"));
  registry.Insert(RunningNode("node-b"));
  registry.Insert(MakeLaunchingNode("node-c", std::chrono::system_clock::time_point{}));

  assert(registry.Size() == 3);
  assert(registry.CountInState(NodeState::kRunning) == 2);
  assert(registry.CountInState(NodeState::kLaunching) == 1);
  assert(registry.Snapshot().size() == 3);

  auto replaced        = RunningNode("node-c", 4);
  registry.Upsert(replaced);
  assert(registry.CountInState(NodeState::kLaunching) == 0);
  assert(registry.Get("node-c").usage_count == 4);
}

void TestConcurrentMutationsOnOneRecordAreSerialized() {
  MediaNodeRegistry registry;
  registry.Insert(RunningNode("node-a"));

  constexpr int kThreads    = 8;
  constexpr int kIterations = 1000;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kIterations; ++i) {
        registry.Mutate("node-a", [](MediaNode& node) { node.usage_count += 1; });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  assert(registry.Get("node-a").usage_count == static_cast<std::uint64_t>(kThreads * kIterations));
}

} // namespace

int main() {
  TestInsertGetAndDuplicate();
  TestUnknownIdsReportNotFound();
  TestThrowingMutationLeavesRecordUnchanged();
  TestMutateReturnsCallbackResultAndPublishesState();
  TestRemovedIdsAreRetired();
  TestRemoveIfHonorsPredicate();
  TestCountsAndSnapshot();
  TestConcurrentMutationsOnOneRecordAreSerialized();

  std::cout << "medianode_unit_media_node_registry: pass\n";
  return 0;
}
