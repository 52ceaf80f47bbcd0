#include "provisioning_server.hpp"

#include <utility>

#include "grpc_error.hpp"

namespace medianode::grpc {

using namespace medianode::manager::v1;

ProvisioningServer::ProvisioningServer(std::shared_ptr<medianode::service::ProvisioningService> svc) : service_(std::move(svc)) {
}

::grpc::Status ProvisioningServer::PollProvisioningRequests(::grpc::ServerContext*, const PollProvisioningRequestsRequest* req,
                                                            PollProvisioningRequestsResponse* resp) {
  try {
    *resp = service_->PollProvisioningRequests(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProvisioningServer::ConfirmAvailable(::grpc::ServerContext*, const ConfirmAvailableRequest* req, ConfirmAvailableResponse* resp) {
  try {
    *resp = service_->ConfirmAvailable(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProvisioningServer::AbortLaunch(::grpc::ServerContext*, const AbortLaunchRequest* req, AbortLaunchResponse* resp) {
  try {
    *resp = service_->AbortLaunch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProvisioningServer::ConfirmTerminated(::grpc::ServerContext*, const ConfirmTerminatedRequest* req, ConfirmTerminatedResponse* resp) {
  try {
    *resp = service_->ConfirmTerminated(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProvisioningServer::ReportTerminationFailure(::grpc::ServerContext*, const ReportTerminationFailureRequest* req,
                                                            ReportTerminationFailureResponse* resp) {
  try {
    *resp = service_->ReportTerminationFailure(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace medianode::grpc
