#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "provisioning_gateway.hpp"

namespace medianode::provisioning {

struct ProvisioningRequest {
  enum class Kind : std::uint8_t {
    kLaunch    = 1,
    kTerminate = 2,
  };

  Kind            kind = Kind::kLaunch;
  std::string     node_id;
  util::TimePoint requested_at{};
};

/*
  Gateway that records requests for an external provisioner.

  The provisioner drains pending requests (over the control plane),
  performs the cloud calls and reports the outcome back as provisioning
  events. Launch ids are minted here as UUIDs.
*/
class QueueingProvisioningGateway final : public ProvisioningGateway {
 public:
  QueueingProvisioningGateway(std::shared_ptr<util::Clock> clock, std::size_t max_pending);

  std::string RequestLaunch() override;
  void        RequestTermination(const std::string& node_id) override;

  // Non-blocking; returns up to `max_requests` (0 = all) oldest first.
  std::vector<ProvisioningRequest> Drain(std::size_t max_requests);

  // Blocks until a request is pending, `timeout` elapses or Shutdown().
  std::vector<ProvisioningRequest> WaitAndDrain(std::size_t max_requests, util::Duration timeout);

  void Shutdown();

  std::size_t PendingCount() const;

 private:
  void                             Enqueue(ProvisioningRequest request);
  std::vector<ProvisioningRequest> TakeLocked(std::size_t max_requests);

  std::shared_ptr<util::Clock> clock_;
  std::size_t                  max_pending_;

  mutable std::mutex              mutex_;
  std::condition_variable         cv_;
  std::deque<ProvisioningRequest> pending_;
  bool                            shutdown_ = false;
};

} // namespace medianode::provisioning
