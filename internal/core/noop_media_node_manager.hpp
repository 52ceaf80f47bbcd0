#pragma once

#include "media_node_manager.hpp"

namespace medianode::core {

/*
  Stand-in used when lifecycle management is disabled: the fleet is
  managed out of band, so every node is reported as running and usage
  events are ignored.
*/
class NoopMediaNodeManager final : public MediaNodeManager {
 public:
  void MediaNodeUsageRegistration(const model::MediaNode& node, util::TimePoint time_of_connection,
                                  const std::vector<model::MediaNode>& existing_nodes) override;
  void MediaNodeUsageDeregistration(const model::MediaNode& node, util::TimePoint time_of_disconnection) override;
  void DropIdleMediaNode(const std::string& media_node_id) override;

  bool IsLaunching(const std::string& media_node_id) const override;
  bool IsCanceled(const std::string& media_node_id) const override;
  bool IsRunning(const std::string& media_node_id) const override;
  bool IsTerminating(const std::string& media_node_id) const override;
  bool IsWaitingIdleToTerminate(const std::string& media_node_id) const override;
};

} // namespace medianode::core
