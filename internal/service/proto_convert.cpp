#include "proto_convert.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"

namespace medianode::service {

using namespace medianode::manager::v1;

MediaNodeState ToProto(model::NodeState state) {
  switch (state) {
    case model::NodeState::kLaunching:
      return MEDIA_NODE_STATE_LAUNCHING;
    case model::NodeState::kRunning:
      return MEDIA_NODE_STATE_RUNNING;
    case model::NodeState::kWaitingIdleToTerminate:
      return MEDIA_NODE_STATE_WAITING_IDLE_TO_TERMINATE;
    case model::NodeState::kTerminating:
      return MEDIA_NODE_STATE_TERMINATING;
    case model::NodeState::kCanceled:
      return MEDIA_NODE_STATE_CANCELED;
  }
  return MEDIA_NODE_STATE_UNSPECIFIED;
}

model::NodeState FromProto(MediaNodeState state) {
  switch (state) {
    case MEDIA_NODE_STATE_LAUNCHING:
      return model::NodeState::kLaunching;
    case MEDIA_NODE_STATE_RUNNING:
      return model::NodeState::kRunning;
    case MEDIA_NODE_STATE_WAITING_IDLE_TO_TERMINATE:
      return model::NodeState::kWaitingIdleToTerminate;
    case MEDIA_NODE_STATE_TERMINATING:
      return model::NodeState::kTerminating;
    case MEDIA_NODE_STATE_CANCELED:
      return model::NodeState::kCanceled;
    default:
      break;
  }
  throw std::invalid_argument("unsupported media node state " + std::to_string(static_cast<int>(state)));
}

MediaNode ToProto(const model::MediaNode& node) {
  MediaNode out;
  out.set_id(node.id);
  out.set_state(ToProto(node.state));
  out.set_usage_count(node.usage_count);
  *out.mutable_created_at()           = util::ToProto(node.created_at);
  *out.mutable_last_usage_change_at() = util::ToProto(node.last_usage_change_at);
  if (node.idle_since) {
    *out.mutable_idle_since() = util::ToProto(*node.idle_since);
  }
  *out.mutable_state_changed_at() = util::ToProto(node.state_changed_at);
  out.set_termination_attempts(node.termination_attempts);
  out.set_termination_escalated(node.termination_escalated);
  return out;
}

model::MediaNode FromProto(const MediaNode& node) {
  model::MediaNode out;
  out.id          = node.id();
  out.usage_count = node.usage_count();
  if (node.state() != MEDIA_NODE_STATE_UNSPECIFIED) {
    out.state = FromProto(node.state());
  }
  if (node.has_created_at()) {
    out.created_at = util::FromProto(node.created_at());
  }
  if (node.has_last_usage_change_at()) {
    out.last_usage_change_at = util::FromProto(node.last_usage_change_at());
  }
  if (node.has_idle_since()) {
    out.idle_since = util::FromProto(node.idle_since());
  }
  if (node.has_state_changed_at()) {
    out.state_changed_at = util::FromProto(node.state_changed_at());
  }
  out.termination_attempts  = node.termination_attempts();
  out.termination_escalated = node.termination_escalated();
  return out;
}

} // namespace medianode::service
