#include "internal/registry/media_node_registry.hpp"

#include <stdexcept>

namespace medianode::registry {

util::NodeNotFound MediaNodeRegistry::NotFound(const std::string& id) {
  return util::NodeNotFound("media node not found: " + id);
}

std::shared_ptr<MediaNodeRegistry::Entry> MediaNodeRegistry::Lookup(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto             it = entries_.find(id);
  if (it == entries_.end()) {
    return nullptr;
  }
  return it->second;
}

void MediaNodeRegistry::EraseLocked(const std::string& id, Entry& entry) {
  {
    std::unique_lock lock(mutex_);
    entries_.erase(id);
    retired_.insert(id);
  }
  entry.removed = true;
}

model::MediaNode MediaNodeRegistry::Get(const std::string& id) const {
  if (auto node = Find(id)) {
    return *node;
  }
  throw NotFound(id);
}

std::optional<model::MediaNode> MediaNodeRegistry::Find(const std::string& id) const {
  auto entry = Lookup(id);
  if (!entry) {
    return std::nullopt;
  }

  std::lock_guard entry_lock(entry->mutex);
  if (entry->removed) {
    return std::nullopt;
  }
  return entry->node;
}

void MediaNodeRegistry::Insert(const model::MediaNode& node) {
  if (node.id.empty()) {
    throw std::invalid_argument("media node id must not be empty");
  }

  std::unique_lock lock(mutex_);
  if (retired_.count(node.id) > 0) {
    throw util::AlreadyExists("media node id was retired and cannot be reused: " + node.id);
  }
  if (entries_.count(node.id) > 0) {
    throw util::AlreadyExists("media node already registered: " + node.id);
  }
  entries_.emplace(node.id, std::make_shared<Entry>(node));
}

void MediaNodeRegistry::Upsert(const model::MediaNode& node) {
  if (node.id.empty()) {
    throw std::invalid_argument("media node id must not be empty");
  }

  std::shared_ptr<Entry> entry;
  {
    std::unique_lock lock(mutex_);
    if (retired_.count(node.id) > 0) {
      throw util::AlreadyExists("media node id was retired and cannot be reused: " + node.id);
    }
    auto it = entries_.find(node.id);
    if (it == entries_.end()) {
      entries_.emplace(node.id, std::make_shared<Entry>(node));
      return;
    }
    entry = it->second;
  }

  std::lock_guard entry_lock(entry->mutex);
  if (entry->removed) {
    throw util::AlreadyExists("media node id was retired and cannot be reused: " + node.id);
  }
  entry->node = node;
  entry->published.store(node.state);
}

void MediaNodeRegistry::Remove(const std::string& id) {
  RemoveIf(id, [](const model::MediaNode&) { return true; });
}

std::vector<model::MediaNode> MediaNodeRegistry::Snapshot() const {
  std::vector<std::shared_ptr<Entry>> entries;
  {
    std::shared_lock lock(mutex_);
    entries.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
      entries.push_back(entry);
    }
  }

  std::vector<model::MediaNode> nodes;
  nodes.reserve(entries.size());
  for (const auto& entry : entries) {
    std::lock_guard entry_lock(entry->mutex);
    if (!entry->removed) {
      nodes.push_back(entry->node);
    }
  }
  return nodes;
}

std::optional<model::NodeState> MediaNodeRegistry::StateOf(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto             it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second->published.load();
}

std::size_t MediaNodeRegistry::CountInState(model::NodeState state) const {
  std::shared_lock lock(mutex_);
  std::size_t      count = 0;
  for (const auto& [id, entry] : entries_) {
    if (entry->published.load() == state) {
      ++count;
    }
  }
  return count;
}

std::size_t MediaNodeRegistry::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

bool MediaNodeRegistry::IsRetired(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return retired_.count(id) > 0;
}

} // namespace medianode::registry
