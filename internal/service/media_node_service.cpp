#include "media_node_service.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/core/lifecycle_media_node_manager.hpp"
#include "internal/core/media_node_manager.hpp"
#include "internal/registry/media_node_registry.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace medianode::service {

using namespace medianode::manager::v1;

namespace {

void RequireNodeId(const std::string& media_node_id, std::string_view operation) {
  if (media_node_id.empty()) {
    throw std::invalid_argument(std::string(operation) + ": missing media_node_id");
  }
}

} // namespace

MediaNodeService::MediaNodeService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.manager || !ctx_.registry || !ctx_.clock) {
    throw std::invalid_argument("media node service requires manager, registry and clock");
  }
}

RegisterUsageResponse MediaNodeService::RegisterUsage(const RegisterUsageRequest& req) {
  return ObserveRpc("MediaNodeService.RegisterUsage", req.media_node_id(), [&] {
    RequireNodeId(req.media_node_id(), "register usage");

    // The registry record is authoritative; the id alone is enough when
    // lifecycle management is disabled and nothing is recorded.
    model::MediaNode node = ctx_.registry->Find(req.media_node_id()).value_or(model::MediaNode{});
    node.id               = req.media_node_id();

    const auto at = req.has_time_of_connection() ? util::FromProto(req.time_of_connection()) : ctx_.clock->Now();

    std::vector<model::MediaNode> existing;
    if (req.existing_nodes().empty()) {
      existing = ctx_.registry->Snapshot();
    } else {
      existing.reserve(static_cast<std::size_t>(req.existing_nodes_size()));
      for (const auto& other : req.existing_nodes()) {
        existing.push_back(FromProto(other));
      }
    }

    ctx_.manager->MediaNodeUsageRegistration(node, at, existing);

    RegisterUsageResponse resp;
    if (auto updated = ctx_.registry->Find(node.id)) {
      *resp.mutable_node() = ToProto(*updated);
    } else {
      resp.mutable_node()->set_id(node.id);
    }
    return resp;
  });
}

DeregisterUsageResponse MediaNodeService::DeregisterUsage(const DeregisterUsageRequest& req) {
  return ObserveRpc("MediaNodeService.DeregisterUsage", req.media_node_id(), [&] {
    RequireNodeId(req.media_node_id(), "deregister usage");

    model::MediaNode node = ctx_.registry->Find(req.media_node_id()).value_or(model::MediaNode{});
    node.id               = req.media_node_id();

    const auto at = req.has_time_of_disconnection() ? util::FromProto(req.time_of_disconnection()) : ctx_.clock->Now();
    ctx_.manager->MediaNodeUsageDeregistration(node, at);

    DeregisterUsageResponse resp;
    if (auto updated = ctx_.registry->Find(node.id)) {
      *resp.mutable_node() = ToProto(*updated);
    } else {
      resp.mutable_node()->set_id(node.id);
    }
    return resp;
  });
}

DropIdleMediaNodeResponse MediaNodeService::DropIdleMediaNode(const DropIdleMediaNodeRequest& req) {
  return ObserveRpc("MediaNodeService.DropIdleMediaNode", req.media_node_id(), [&] {
    RequireNodeId(req.media_node_id(), "drop idle media node");

    DropIdleMediaNodeResponse resp;
    if (ctx_.lifecycle) {
      resp.set_dropped(ctx_.lifecycle->TryDropIdleMediaNode(req.media_node_id()));
    } else {
      ctx_.manager->DropIdleMediaNode(req.media_node_id());
      resp.set_dropped(false);
    }
    return resp;
  });
}

GetMediaNodeStateResponse MediaNodeService::GetMediaNodeState(const GetMediaNodeStateRequest& req) {
  return ObserveRpc("MediaNodeService.GetMediaNodeState", req.media_node_id(), [&] {
    RequireNodeId(req.media_node_id(), "get media node state");
    const auto& id = req.media_node_id();

    GetMediaNodeStateResponse resp;
    if (const auto state = ctx_.registry->StateOf(id)) {
      resp.set_found(true);
      resp.set_state(ToProto(*state));
    }

    resp.set_launching(ctx_.manager->IsLaunching(id));
    resp.set_canceled(ctx_.manager->IsCanceled(id));
    resp.set_running(ctx_.manager->IsRunning(id));
    resp.set_terminating(ctx_.manager->IsTerminating(id));
    resp.set_waiting_idle_to_terminate(ctx_.manager->IsWaitingIdleToTerminate(id));
    return resp;
  });
}

ListMediaNodesResponse MediaNodeService::ListMediaNodes(const ListMediaNodesRequest& req) {
  return ObserveRpc("MediaNodeService.ListMediaNodes", "", [&] {
    std::optional<model::NodeState> filter;
    if (req.state_filter() != MEDIA_NODE_STATE_UNSPECIFIED) {
      filter = FromProto(req.state_filter());
    }

    ListMediaNodesResponse resp;
    for (const auto& node : ctx_.registry->Snapshot()) {
      if (!filter || node.state == *filter) {
        *resp.add_nodes() = ToProto(node);
      }
    }
    return resp;
  });
}

} // namespace medianode::service
