#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "internal/model/media_node.hpp"
#include "internal/util/errors.hpp"

namespace medianode::registry {

/*
  Directory of every known media node.

  Consistency model:
  - Each record has its own mutex. Mutate() runs a read-modify-write on a
    copy of the record under that mutex and commits the copy only if the
    callback returns normally, so a throwing callback leaves the record
    unchanged.
  - The id map is guarded by a shared mutex that is held only for lookups,
    inserts and removals, never while a record callback runs.
  - Lock order is record -> map. Nothing takes a record mutex while holding
    the map mutex.
  - The last committed state of each record is published through an atomic,
    so StateOf() never waits on a record mutex.
  - Removed ids are retired and cannot be inserted again.
*/
class MediaNodeRegistry {
 public:
  model::MediaNode                Get(const std::string& id) const;
  std::optional<model::MediaNode> Find(const std::string& id) const;

  void Insert(const model::MediaNode& node);
  void Upsert(const model::MediaNode& node);
  void Remove(const std::string& id);

  // Removes the record when `pred` holds for it, evaluated under the record
  // mutex. Returns whether the record was removed.
  template <typename Pred>
  bool RemoveIf(const std::string& id, Pred&& pred);

  template <typename Fn>
  auto Mutate(const std::string& id, Fn&& fn);

  std::vector<model::MediaNode>   Snapshot() const;
  std::optional<model::NodeState> StateOf(const std::string& id) const;

  std::size_t CountInState(model::NodeState state) const;
  std::size_t Size() const;
  bool        IsRetired(const std::string& id) const;

 private:
  struct Entry {
    explicit Entry(model::MediaNode initial) : node(std::move(initial)), published(node.state) {
    }

    std::mutex                     mutex;
    model::MediaNode               node;
    std::atomic<model::NodeState>  published;
    bool                           removed = false;
  };

  std::shared_ptr<Entry> Lookup(const std::string& id) const;
  void                   EraseLocked(const std::string& id, Entry& entry);

  static util::NodeNotFound NotFound(const std::string& id);

  mutable std::shared_mutex                               mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
  std::unordered_set<std::string>                         retired_;
};

template <typename Pred>
bool MediaNodeRegistry::RemoveIf(const std::string& id, Pred&& pred) {
  auto entry = Lookup(id);
  if (!entry) {
    throw NotFound(id);
  }

  std::lock_guard entry_lock(entry->mutex);
  if (entry->removed) {
    throw NotFound(id);
  }
  if (!pred(static_cast<const model::MediaNode&>(entry->node))) {
    return false;
  }

  EraseLocked(id, *entry);
  return true;
}

template <typename Fn>
auto MediaNodeRegistry::Mutate(const std::string& id, Fn&& fn) {
  auto entry = Lookup(id);
  if (!entry) {
    throw NotFound(id);
  }

  std::lock_guard entry_lock(entry->mutex);
  if (entry->removed) {
    throw NotFound(id);
  }

  model::MediaNode working = entry->node;
  if constexpr (std::is_void_v<std::invoke_result_t<Fn, model::MediaNode&>>) {
    fn(working);
    working.id  = entry->node.id;
    entry->node = std::move(working);
    entry->published.store(entry->node.state);
  } else {
    auto result = fn(working);
    working.id  = entry->node.id;
    entry->node = std::move(working);
    entry->published.store(entry->node.state);
    return result;
  }
}

} // namespace medianode::registry
