#include "media_node_server.hpp"

#include <utility>

#include "grpc_error.hpp"

namespace medianode::grpc {

using namespace medianode::manager::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

MediaNodeServer::MediaNodeServer(std::shared_ptr<medianode::service::MediaNodeService> svc) : service_(std::move(svc)) {
}

::grpc::Status MediaNodeServer::RegisterUsage(::grpc::ServerContext*, const RegisterUsageRequest* req, RegisterUsageResponse* resp) {
  return Handle([&] { *resp = service_->RegisterUsage(*req); });
}

::grpc::Status MediaNodeServer::DeregisterUsage(::grpc::ServerContext*, const DeregisterUsageRequest* req, DeregisterUsageResponse* resp) {
  return Handle([&] { *resp = service_->DeregisterUsage(*req); });
}

::grpc::Status MediaNodeServer::DropIdleMediaNode(::grpc::ServerContext*, const DropIdleMediaNodeRequest* req, DropIdleMediaNodeResponse* resp) {
  return Handle([&] { *resp = service_->DropIdleMediaNode(*req); });
}

::grpc::Status MediaNodeServer::GetMediaNodeState(::grpc::ServerContext*, const GetMediaNodeStateRequest* req, GetMediaNodeStateResponse* resp) {
  return Handle([&] { *resp = service_->GetMediaNodeState(*req); });
}

::grpc::Status MediaNodeServer::ListMediaNodes(::grpc::ServerContext*, const ListMediaNodesRequest* req, ListMediaNodesResponse* resp) {
  return Handle([&] { *resp = service_->ListMediaNodes(*req); });
}

} // namespace medianode::grpc
