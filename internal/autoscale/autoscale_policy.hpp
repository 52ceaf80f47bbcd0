#pragma once

#include <cstdint>
#include <vector>

#include "fleet_load.hpp"
#include "internal/model/media_node.hpp"

namespace medianode::autoscale {

struct AutoscaleOptions {
  bool          enabled            = true;
  std::uint64_t node_capacity      = 100;
  std::uint64_t min_spare_capacity = 20;
  // 0 = no ceiling.
  std::uint64_t max_nodes = 0;
};

/*
  Determines whether the fleet needs another media node.

  Spare capacity only counts nodes that are RUNNING or LAUNCHING; idle
  nodes are on their way out and terminating/canceled nodes never take
  sessions.
*/
class AutoscalePolicy {
 public:
  explicit AutoscalePolicy(AutoscaleOptions options);

  FleetLoad Measure(const std::vector<model::MediaNode>& fleet) const;

  bool NeedsCapacity(const FleetLoad& load) const;

  const AutoscaleOptions& options() const {
    return options_;
  }

 private:
  AutoscaleOptions options_;
};

} // namespace medianode::autoscale
