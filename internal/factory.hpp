#pragma once

#include <memory>

#include "config/config.pb.h"

namespace medianode::core {
class MediaNodeManager;
class LifecycleMediaNodeManager;
} // namespace medianode::core
namespace medianode::registry {
class MediaNodeRegistry;
}
namespace medianode::reaper {
class IdleReaper;
}
namespace medianode::provisioning {
class QueueingProvisioningGateway;
}
namespace medianode::service {
class MediaNodeService;
class ProvisioningService;
} // namespace medianode::service
namespace medianode::util {
class Clock;
}

namespace medianode::factory {

/*
  Application

  Owns all long-lived components used by the server. Everything here
  lives for the lifetime of the process. `lifecycle`, `reaper` and
  `gateway` are null when lifecycle management is disabled.
*/
struct Application {
  std::shared_ptr<util::Clock>                              clock;
  std::shared_ptr<registry::MediaNodeRegistry>              registry;
  std::shared_ptr<provisioning::QueueingProvisioningGateway> gateway;
  std::shared_ptr<reaper::IdleReaper>                       reaper;

  std::shared_ptr<core::MediaNodeManager>          manager;
  std::shared_ptr<core::LifecycleMediaNodeManager> lifecycle;

  std::shared_ptr<service::MediaNodeService>    media_node_service;
  std::shared_ptr<service::ProvisioningService> provisioning_service;

  // Starts the reaper thread and requests the initial fleet.
  void Start();

  // Rejects new registrations, drains deadlines and releases the
  // provisioner's long polls.
  void Shutdown();
};

/*
  Build

  Constructs the entire backend based on runtime config. This is the
  composition root of the application. `clock` defaults to the system
  clock.
*/
Application Build(const medianode::runtime::config::RuntimeConfig& config, std::shared_ptr<util::Clock> clock = nullptr);

} // namespace medianode::factory
