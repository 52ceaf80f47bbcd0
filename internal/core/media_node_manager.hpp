#pragma once

#include <string>
#include <vector>

#include "internal/model/media_node.hpp"
#include "internal/util/time.hpp"

namespace medianode::core {

/*
  Lifecycle capability consumed by session routing.

  Routing reports every session attach/detach and asks for a node's state
  before placing a session on it. Implementations are interchangeable:
  NoopMediaNodeManager treats every node as permanently usable,
  LifecycleMediaNodeManager runs the full launch/idle/terminate cycle.

  State predicates are snapshots. The state may change right after the
  call returns; callers must tolerate a registration being rejected anyway.
*/
class MediaNodeManager {
 public:
  virtual ~MediaNodeManager() = default;

  // A session attached to `node`. `existing_nodes` is the caller's view of
  // the rest of the fleet, read only for the autoscale decision.
  // Throws util::InvalidStateTransition when the node does not accept
  // sessions, util::NodeNotFound for unknown nodes.
  virtual void MediaNodeUsageRegistration(const model::MediaNode& node, util::TimePoint time_of_connection,
                                          const std::vector<model::MediaNode>& existing_nodes) = 0;

  // A session detached from `node`. Throws util::UsageUnderflow when no
  // session is attached.
  virtual void MediaNodeUsageDeregistration(const model::MediaNode& node, util::TimePoint time_of_disconnection) = 0;

  // Terminates an idle node without waiting out its grace period. No-op
  // unless the node is waiting idle to terminate.
  virtual void DropIdleMediaNode(const std::string& media_node_id) = 0;

  virtual bool IsLaunching(const std::string& media_node_id) const              = 0;
  virtual bool IsCanceled(const std::string& media_node_id) const               = 0;
  virtual bool IsRunning(const std::string& media_node_id) const                = 0;
  virtual bool IsTerminating(const std::string& media_node_id) const            = 0;
  virtual bool IsWaitingIdleToTerminate(const std::string& media_node_id) const = 0;
};

} // namespace medianode::core
