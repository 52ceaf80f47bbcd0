#pragma once

#include <cstdint>

namespace medianode::autoscale {

/*
  Aggregate usage accounting used by launch decisions.
*/
struct FleetLoad {
  std::uint64_t launching_nodes = 0;
  std::uint64_t running_nodes   = 0;
  std::uint64_t idle_nodes      = 0;
  std::uint64_t live_nodes      = 0;

  std::uint64_t attached_sessions = 0;
  std::uint64_t spare_capacity    = 0;
};

} // namespace medianode::autoscale
