#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/provisioning_service.hpp"
#include "medianode/manager/v1/provisioning_service.grpc.pb.h"

namespace medianode::grpc {

class ProvisioningServer final : public medianode::manager::v1::ProvisioningService::Service {
 public:
  explicit ProvisioningServer(std::shared_ptr<medianode::service::ProvisioningService> svc);

  ::grpc::Status PollProvisioningRequests(::grpc::ServerContext*, const medianode::manager::v1::PollProvisioningRequestsRequest*,
                                          medianode::manager::v1::PollProvisioningRequestsResponse*) override;
  ::grpc::Status ConfirmAvailable(::grpc::ServerContext*, const medianode::manager::v1::ConfirmAvailableRequest*,
                                  medianode::manager::v1::ConfirmAvailableResponse*) override;
  ::grpc::Status AbortLaunch(::grpc::ServerContext*, const medianode::manager::v1::AbortLaunchRequest*,
                             medianode::manager::v1::AbortLaunchResponse*) override;
  ::grpc::Status ConfirmTerminated(::grpc::ServerContext*, const medianode::manager::v1::ConfirmTerminatedRequest*,
                                   medianode::manager::v1::ConfirmTerminatedResponse*) override;
  ::grpc::Status ReportTerminationFailure(::grpc::ServerContext*, const medianode::manager::v1::ReportTerminationFailureRequest*,
                                          medianode::manager::v1::ReportTerminationFailureResponse*) override;

 private:
  std::shared_ptr<medianode::service::ProvisioningService> service_;
};

} // namespace medianode::grpc
