#include "idle_reaper.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"

namespace medianode::reaper {

using medianode::observability::IntField;
using medianode::observability::StringField;

IdleReaper::IdleReaper(std::shared_ptr<util::Clock> clock, util::Duration poll_interval)
    : clock_(std::move(clock)), poll_interval_(poll_interval) {
  if (!clock_) {
    throw std::invalid_argument("idle reaper requires a clock");
  }
  if (poll_interval_.count() <= 0) {
    throw std::invalid_argument("idle reaper poll interval must be positive");
  }
}

IdleReaper::~IdleReaper() {
  Stop();
}

void IdleReaper::SetHandler(DeadlineHandler* handler) {
  std::lock_guard lock(handler_mutex_);
  handler_ = handler;
}

Deadline IdleReaper::Arm(const std::string& node_id, DeadlineKind kind, util::TimePoint at) {
  auto deadline = table_.Arm(node_id, kind, at);
  if (deadline.generation == 0) {
    MEDIANODE_LOG_DEBUG("Ignoring deadline armed after drain", {StringField("node_id", node_id), StringField("kind", ToString(kind))});
    return deadline;
  }
  {
    std::lock_guard lock(wake_mutex_);
    wake_ = true;
  }
  wake_cv_.notify_one();
  return deadline;
}

bool IdleReaper::Cancel(const std::string& node_id) {
  return table_.Cancel(node_id);
}

std::size_t IdleReaper::FireDue(util::TimePoint now) {
  auto due = table_.TakeDue(now);
  if (due.empty()) {
    return 0;
  }

  std::lock_guard lock(handler_mutex_);
  if (!handler_) {
    MEDIANODE_LOG_WARN("Dropping due deadlines without a handler", {IntField("count", static_cast<std::int64_t>(due.size()))});
    return 0;
  }

  for (const auto& deadline : due) {
    try {
      handler_->OnDeadline(deadline);
    } catch (const std::exception& e) {
      MEDIANODE_LOG_ERROR("Deadline handling failed", {StringField("node_id", deadline.node_id), StringField("kind", ToString(deadline.kind)),
                                                       StringField("error", e.what())});
    }
  }
  return due.size();
}

std::optional<Deadline> IdleReaper::Pending(const std::string& node_id) const {
  return table_.Find(node_id);
}

std::size_t IdleReaper::PendingCount() const {
  return table_.Size();
}

void IdleReaper::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&IdleReaper::Run, this);
}

void IdleReaper::Stop() {
  running_ = false;
  {
    std::lock_guard lock(wake_mutex_);
    wake_ = true;
  }
  wake_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::size_t IdleReaper::Drain() {
  Stop();
  return table_.Close().size();
}

void IdleReaper::Run() {
  while (running_) {
    FireDue(clock_->Now());

    auto wait = poll_interval_;
    if (auto next = table_.NextDue()) {
      const auto until_next = std::chrono::duration_cast<util::Duration>(*next - clock_->Now());
      wait                  = std::clamp(until_next, util::Duration(1), poll_interval_);
    }

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, wait, [&] { return wake_ || !running_; });
    wake_ = false;
  }
}

} // namespace medianode::reaper
