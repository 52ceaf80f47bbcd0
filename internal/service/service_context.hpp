#pragma once

#include <memory>

namespace medianode::core {
class MediaNodeManager;
class LifecycleMediaNodeManager;
} // namespace medianode::core
namespace medianode::registry {
class MediaNodeRegistry;
}
namespace medianode::provisioning {
class QueueingProvisioningGateway;
}
namespace medianode::util {
class Clock;
}

namespace medianode::service {

/*
  Dependency container shared by all services.

  `lifecycle` and `gateway` are null when lifecycle management is
  disabled; `manager` is then the no-op stand-in.
*/
struct ServiceContext {
  std::shared_ptr<medianode::core::MediaNodeManager>                   manager;
  std::shared_ptr<medianode::core::LifecycleMediaNodeManager>          lifecycle;
  std::shared_ptr<medianode::registry::MediaNodeRegistry>              registry;
  std::shared_ptr<medianode::provisioning::QueueingProvisioningGateway> gateway;
  std::shared_ptr<medianode::util::Clock>                              clock;
};

} // namespace medianode::service
