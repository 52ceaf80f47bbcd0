#pragma once

#include "medianode/manager/v1.hpp"
#include "service_context.hpp"

namespace medianode::service {

/*
  Control plane for the external provisioner: hands out pending launch and
  termination requests and takes back their outcome.

  Every call fails with util::Unavailable when lifecycle management is
  disabled.
*/
class ProvisioningService {
 public:
  explicit ProvisioningService(ServiceContext ctx);

  medianode::manager::v1::PollProvisioningRequestsResponse PollProvisioningRequests(
      const medianode::manager::v1::PollProvisioningRequestsRequest& req);

  medianode::manager::v1::ConfirmAvailableResponse  ConfirmAvailable(const medianode::manager::v1::ConfirmAvailableRequest& req);
  medianode::manager::v1::AbortLaunchResponse       AbortLaunch(const medianode::manager::v1::AbortLaunchRequest& req);
  medianode::manager::v1::ConfirmTerminatedResponse ConfirmTerminated(const medianode::manager::v1::ConfirmTerminatedRequest& req);

  medianode::manager::v1::ReportTerminationFailureResponse ReportTerminationFailure(
      const medianode::manager::v1::ReportTerminationFailureRequest& req);

 private:
  void RequireLifecycle() const;

  ServiceContext ctx_;
};

} // namespace medianode::service
