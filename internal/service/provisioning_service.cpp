#include "provisioning_service.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/core/lifecycle_media_node_manager.hpp"
#include "internal/provisioning/queueing_provisioning_gateway.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace medianode::service {

using namespace medianode::manager::v1;

namespace {

// Cap on a single long poll so a stuck provisioner cannot pin a handler thread.
constexpr util::Duration kMaxPollWait = std::chrono::seconds(30);

ProvisioningOperation ToProto(provisioning::ProvisioningRequest::Kind kind) {
  switch (kind) {
    case provisioning::ProvisioningRequest::Kind::kLaunch:
      return PROVISIONING_OPERATION_LAUNCH;
    case provisioning::ProvisioningRequest::Kind::kTerminate:
      return PROVISIONING_OPERATION_TERMINATE;
  }
  return PROVISIONING_OPERATION_UNSPECIFIED;
}

void RequireNodeId(const std::string& media_node_id, std::string_view operation) {
  if (media_node_id.empty()) {
    throw std::invalid_argument(std::string(operation) + ": missing media_node_id");
  }
}

} // namespace

ProvisioningService::ProvisioningService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void ProvisioningService::RequireLifecycle() const {
  if (!ctx_.lifecycle || !ctx_.gateway || !ctx_.clock) {
    throw util::Unavailable("media node lifecycle management is disabled");
  }
}

PollProvisioningRequestsResponse ProvisioningService::PollProvisioningRequests(const PollProvisioningRequestsRequest& req) {
  return ObserveRpc("ProvisioningService.PollProvisioningRequests", "", [&] {
    RequireLifecycle();

    const auto max_requests = static_cast<std::size_t>(req.max_requests());
    std::vector<provisioning::ProvisioningRequest> pending;
    if (req.has_wait()) {
      const auto wait = std::min(util::FromProto(req.wait()), kMaxPollWait);
      pending         = ctx_.gateway->WaitAndDrain(max_requests, wait);
    } else {
      pending = ctx_.gateway->Drain(max_requests);
    }

    PollProvisioningRequestsResponse resp;
    for (const auto& request : pending) {
      auto* out = resp.add_requests();
      out->set_operation(ToProto(request.kind));
      out->set_media_node_id(request.node_id);
      *out->mutable_requested_at() = util::ToProto(request.requested_at);
    }
    return resp;
  });
}

ConfirmAvailableResponse ProvisioningService::ConfirmAvailable(const ConfirmAvailableRequest& req) {
  return ObserveRpc("ProvisioningService.ConfirmAvailable", req.media_node_id(), [&] {
    RequireLifecycle();
    RequireNodeId(req.media_node_id(), "confirm available");

    ctx_.lifecycle->ConfirmAvailable(req.media_node_id(), req.has_at() ? util::FromProto(req.at()) : ctx_.clock->Now());
    return ConfirmAvailableResponse{};
  });
}

AbortLaunchResponse ProvisioningService::AbortLaunch(const AbortLaunchRequest& req) {
  return ObserveRpc("ProvisioningService.AbortLaunch", req.media_node_id(), [&] {
    RequireLifecycle();
    RequireNodeId(req.media_node_id(), "abort launch");

    MEDIANODE_LOG_WARN("Media node launch aborted by provisioner", {medianode::observability::StringField("node_id", req.media_node_id()),
                                                                    medianode::observability::StringField("reason", req.reason())});
    ctx_.lifecycle->AbortLaunch(req.media_node_id(), req.has_at() ? util::FromProto(req.at()) : ctx_.clock->Now());
    return AbortLaunchResponse{};
  });
}

ConfirmTerminatedResponse ProvisioningService::ConfirmTerminated(const ConfirmTerminatedRequest& req) {
  return ObserveRpc("ProvisioningService.ConfirmTerminated", req.media_node_id(), [&] {
    RequireLifecycle();
    RequireNodeId(req.media_node_id(), "confirm terminated");

    ctx_.lifecycle->ConfirmTerminated(req.media_node_id());
    return ConfirmTerminatedResponse{};
  });
}

ReportTerminationFailureResponse ProvisioningService::ReportTerminationFailure(const ReportTerminationFailureRequest& req) {
  return ObserveRpc("ProvisioningService.ReportTerminationFailure", req.media_node_id(), [&] {
    RequireLifecycle();
    RequireNodeId(req.media_node_id(), "report termination failure");

    ctx_.lifecycle->ReportTerminationFailure(req.media_node_id(), req.reason(), req.has_at() ? util::FromProto(req.at()) : ctx_.clock->Now());

    ReportTerminationFailureResponse resp;
    if (const auto node = ctx_.lifecycle->FindMediaNode(req.media_node_id())) {
      resp.set_termination_attempts(node->termination_attempts);
      resp.set_termination_escalated(node->termination_escalated);
    }
    return resp;
  });
}

} // namespace medianode::service
