#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "deadline.hpp"

namespace medianode::reaper {

/*
  At most one live deadline per node id.

  Arm() replaces whatever was scheduled for the id; the replaced deadline
  can no longer be taken. Once closed, the table stays empty: Arm() stores
  nothing and returns a deadline with generation 0.
*/
class DeadlineTable {
 public:
  Deadline Arm(const std::string& node_id, DeadlineKind kind, util::TimePoint at);

  // Returns whether a deadline was scheduled for the id.
  bool Cancel(const std::string& node_id);

  // Removes and returns every deadline due at `now`, earliest first.
  std::vector<Deadline> TakeDue(util::TimePoint now);

  std::optional<Deadline>        Find(const std::string& node_id) const;
  std::optional<util::TimePoint> NextDue() const;

  // Removes every deadline and refuses later arming.
  std::vector<Deadline> Close();
  std::size_t           Size() const;

 private:
  mutable std::mutex                        mutex_;
  std::unordered_map<std::string, Deadline> deadlines_;
  std::uint64_t                             next_generation_ = 1;
  bool                                      closed_          = false;
};

} // namespace medianode::reaper
