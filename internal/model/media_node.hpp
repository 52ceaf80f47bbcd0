#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "internal/model/state_machine.hpp"

namespace medianode::model {

struct MediaNode {
  std::string id;
  NodeState   state = NodeState::kLaunching;

  std::uint64_t usage_count = 0;

  std::chrono::system_clock::time_point                created_at{};
  std::chrono::system_clock::time_point                last_usage_change_at{};
  std::optional<std::chrono::system_clock::time_point> idle_since;
  std::chrono::system_clock::time_point                state_changed_at{};

  std::uint32_t termination_attempts  = 0;
  bool          termination_escalated = false;

  // Generation of the reaper deadline armed for this node, 0 when none.
  std::uint64_t deadline_generation = 0;
};

inline MediaNode MakeLaunchingNode(std::string id, std::chrono::system_clock::time_point now) {
  MediaNode node;
  node.id                   = std::move(id);
  node.state                = NodeState::kLaunching;
  node.created_at           = now;
  node.last_usage_change_at = now;
  node.state_changed_at     = now;
  return node;
}

} // namespace medianode::model
