#include "deadline_table.hpp"

#include <algorithm>

namespace medianode::reaper {

Deadline DeadlineTable::Arm(const std::string& node_id, DeadlineKind kind, util::TimePoint at) {
  std::lock_guard lock(mutex_);

  Deadline deadline;
  deadline.node_id = node_id;
  deadline.kind    = kind;
  deadline.at      = at;
  if (closed_) {
    return deadline;
  }

  deadline.generation = next_generation_++;
  deadlines_[node_id] = deadline;
  return deadline;
}

bool DeadlineTable::Cancel(const std::string& node_id) {
  std::lock_guard lock(mutex_);
  return deadlines_.erase(node_id) > 0;
}

std::vector<Deadline> DeadlineTable::TakeDue(util::TimePoint now) {
  std::lock_guard lock(mutex_);

  std::vector<Deadline> due;
  for (auto it = deadlines_.begin(); it != deadlines_.end();) {
    if (it->second.at > now) {
      ++it;
      continue;
    }
    due.push_back(std::move(it->second));
    it = deadlines_.erase(it);
  }

  std::sort(due.begin(), due.end(), [](const Deadline& a, const Deadline& b) {
    if (a.at != b.at) return a.at < b.at;
    return a.generation < b.generation;
  });
  return due;
}

std::optional<Deadline> DeadlineTable::Find(const std::string& node_id) const {
  std::lock_guard lock(mutex_);
  auto            it = deadlines_.find(node_id);
  if (it == deadlines_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<util::TimePoint> DeadlineTable::NextDue() const {
  std::lock_guard lock(mutex_);

  std::optional<util::TimePoint> next;
  for (const auto& [id, deadline] : deadlines_) {
    if (!next || deadline.at < *next) {
      next = deadline.at;
    }
  }
  return next;
}

std::vector<Deadline> DeadlineTable::Close() {
  std::lock_guard lock(mutex_);
  closed_ = true;

  std::vector<Deadline> drained;
  drained.reserve(deadlines_.size());
  for (auto& [id, deadline] : deadlines_) {
    drained.push_back(std::move(deadline));
  }
  deadlines_.clear();
  return drained;
}

std::size_t DeadlineTable::Size() const {
  std::lock_guard lock(mutex_);
  return deadlines_.size();
}

} // namespace medianode::reaper
