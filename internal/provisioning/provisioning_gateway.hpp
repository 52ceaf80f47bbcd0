#pragma once

#include <string>

namespace medianode::provisioning {

/*
  Side effects on the compute fleet.

  Both calls only submit a request; completion arrives later as a
  provisioning event (ConfirmAvailable / AbortLaunch / ConfirmTerminated /
  ReportTerminationFailure on the manager). Implementations throw
  util::ProvisioningFailure when a request cannot be submitted.
*/
class ProvisioningGateway {
 public:
  virtual ~ProvisioningGateway() = default;

  // Returns the id the new media node will be known by.
  virtual std::string RequestLaunch() = 0;

  virtual void RequestTermination(const std::string& node_id) = 0;
};

} // namespace medianode::provisioning
