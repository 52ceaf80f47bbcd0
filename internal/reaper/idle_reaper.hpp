#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "deadline.hpp"
#include "deadline_table.hpp"

namespace medianode::reaper {

/*
  Background worker that fires node deadlines.

  Fires are dispatched to the DeadlineHandler outside of the table lock;
  the handler serializes them against registrations through the registry's
  per-node critical section.
*/
class IdleReaper {
 public:
  IdleReaper(std::shared_ptr<util::Clock> clock, util::Duration poll_interval);
  ~IdleReaper();

  IdleReaper(const IdleReaper&)            = delete;
  IdleReaper& operator=(const IdleReaper&) = delete;

  void SetHandler(DeadlineHandler* handler);

  Deadline Arm(const std::string& node_id, DeadlineKind kind, util::TimePoint at);
  bool     Cancel(const std::string& node_id);

  // Dispatches every deadline due at `now`. Returns how many were dispatched.
  std::size_t FireDue(util::TimePoint now);

  std::optional<Deadline> Pending(const std::string& node_id) const;
  std::size_t             PendingCount() const;

  void Start();
  void Stop();

  // Stops the worker and discards every pending deadline. Arm() calls made
  // afterwards are ignored and return generation 0.
  std::size_t Drain();

  const util::Clock& clock() const {
    return *clock_;
  }

 private:
  void Run();

  std::shared_ptr<util::Clock> clock_;
  util::Duration               poll_interval_;
  DeadlineTable                table_;

  std::mutex       handler_mutex_;
  DeadlineHandler* handler_ = nullptr;

  std::mutex              wake_mutex_;
  std::condition_variable wake_cv_;
  bool                    wake_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace medianode::reaper
