#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/media_node_service.hpp"
#include "medianode/manager/v1/media_node_service.grpc.pb.h"

namespace medianode::grpc {

class MediaNodeServer final : public medianode::manager::v1::MediaNodeService::Service {
 public:
  explicit MediaNodeServer(std::shared_ptr<medianode::service::MediaNodeService> svc);

  ::grpc::Status RegisterUsage(::grpc::ServerContext*, const medianode::manager::v1::RegisterUsageRequest*,
                               medianode::manager::v1::RegisterUsageResponse*) override;
  ::grpc::Status DeregisterUsage(::grpc::ServerContext*, const medianode::manager::v1::DeregisterUsageRequest*,
                                 medianode::manager::v1::DeregisterUsageResponse*) override;
  ::grpc::Status DropIdleMediaNode(::grpc::ServerContext*, const medianode::manager::v1::DropIdleMediaNodeRequest*,
                                   medianode::manager::v1::DropIdleMediaNodeResponse*) override;
  ::grpc::Status GetMediaNodeState(::grpc::ServerContext*, const medianode::manager::v1::GetMediaNodeStateRequest*,
                                   medianode::manager::v1::GetMediaNodeStateResponse*) override;
  ::grpc::Status ListMediaNodes(::grpc::ServerContext*, const medianode::manager::v1::ListMediaNodesRequest*,
                                medianode::manager::v1::ListMediaNodesResponse*) override;

 private:
  std::shared_ptr<medianode::service::MediaNodeService> service_;
};

} // namespace medianode::grpc
