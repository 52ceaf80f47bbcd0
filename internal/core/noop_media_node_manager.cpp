#include "noop_media_node_manager.hpp"

namespace medianode::core {

void NoopMediaNodeManager::MediaNodeUsageRegistration(const model::MediaNode&, util::TimePoint, const std::vector<model::MediaNode>&) {
}

void NoopMediaNodeManager::MediaNodeUsageDeregistration(const model::MediaNode&, util::TimePoint) {
}

void NoopMediaNodeManager::DropIdleMediaNode(const std::string&) {
}

bool NoopMediaNodeManager::IsLaunching(const std::string&) const {
  return false;
}

bool NoopMediaNodeManager::IsCanceled(const std::string&) const {
  return false;
}

bool NoopMediaNodeManager::IsRunning(const std::string&) const {
  return true;
}

bool NoopMediaNodeManager::IsTerminating(const std::string&) const {
  return false;
}

bool NoopMediaNodeManager::IsWaitingIdleToTerminate(const std::string&) const {
  return false;
}

} // namespace medianode::core
