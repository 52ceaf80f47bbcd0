#include "queueing_provisioning_gateway.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace medianode::provisioning {

QueueingProvisioningGateway::QueueingProvisioningGateway(std::shared_ptr<util::Clock> clock, std::size_t max_pending)
    : clock_(std::move(clock)), max_pending_(max_pending) {
  if (!clock_) {
    throw std::invalid_argument("provisioning gateway requires a clock");
  }
  if (max_pending_ == 0) {
    throw std::invalid_argument("provisioning gateway needs room for at least one pending request");
  }
}

std::string QueueingProvisioningGateway::RequestLaunch() {
  ProvisioningRequest request;
  request.kind         = ProvisioningRequest::Kind::kLaunch;
  request.node_id      = util::ToString(util::GenerateUUID());
  request.requested_at = clock_->Now();

  auto node_id = request.node_id;
  Enqueue(std::move(request));
  return node_id;
}

void QueueingProvisioningGateway::RequestTermination(const std::string& node_id) {
  ProvisioningRequest request;
  request.kind         = ProvisioningRequest::Kind::kTerminate;
  request.node_id      = node_id;
  request.requested_at = clock_->Now();
  Enqueue(std::move(request));
}

void QueueingProvisioningGateway::Enqueue(ProvisioningRequest request) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw util::ProvisioningFailure("provisioning gateway is shut down");
    }
    if (pending_.size() >= max_pending_) {
      throw util::ProvisioningFailure("provisioning request queue is full (" + std::to_string(max_pending_) + " pending)");
    }
    pending_.push_back(std::move(request));
  }
  cv_.notify_one();
}

std::vector<ProvisioningRequest> QueueingProvisioningGateway::TakeLocked(std::size_t max_requests) {
  const auto count = max_requests == 0 ? pending_.size() : std::min(max_requests, pending_.size());

  std::vector<ProvisioningRequest> taken;
  taken.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    taken.push_back(std::move(pending_.front()));
    pending_.pop_front();
  }
  return taken;
}

std::vector<ProvisioningRequest> QueueingProvisioningGateway::Drain(std::size_t max_requests) {
  std::lock_guard lock(mutex_);
  return TakeLocked(max_requests);
}

std::vector<ProvisioningRequest> QueueingProvisioningGateway::WaitAndDrain(std::size_t max_requests, util::Duration timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return shutdown_ || !pending_.empty(); });

  return TakeLocked(max_requests);
}

void QueueingProvisioningGateway::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t QueueingProvisioningGateway::PendingCount() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

} // namespace medianode::provisioning
