#pragma once

#include "medianode/manager/v1.hpp"
#include "service_context.hpp"

namespace medianode::service {

/*
  Usage events and state queries for session routing.
*/
class MediaNodeService {
 public:
  explicit MediaNodeService(ServiceContext ctx);

  medianode::manager::v1::RegisterUsageResponse   RegisterUsage(const medianode::manager::v1::RegisterUsageRequest& req);
  medianode::manager::v1::DeregisterUsageResponse DeregisterUsage(const medianode::manager::v1::DeregisterUsageRequest& req);

  medianode::manager::v1::DropIdleMediaNodeResponse DropIdleMediaNode(const medianode::manager::v1::DropIdleMediaNodeRequest& req);

  medianode::manager::v1::GetMediaNodeStateResponse GetMediaNodeState(const medianode::manager::v1::GetMediaNodeStateRequest& req);
  medianode::manager::v1::ListMediaNodesResponse    ListMediaNodes(const medianode::manager::v1::ListMediaNodesRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace medianode::service
