#include "factory.hpp"

#include <memory>
#include <utility>

#include "internal/autoscale/autoscale_decision_engine.hpp"
#include "internal/autoscale/autoscale_policy.hpp"
#include "internal/core/lifecycle_media_node_manager.hpp"
#include "internal/core/noop_media_node_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/provisioning/queueing_provisioning_gateway.hpp"
#include "internal/reaper/idle_reaper.hpp"
#include "internal/registry/media_node_registry.hpp"
#include "internal/service/media_node_service.hpp"
#include "internal/service/provisioning_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"

namespace medianode::factory {

using medianode::observability::BoolField;
using medianode::observability::IntField;
using medianode::runtime::config::RuntimeConfig;

namespace {

core::LifecycleOptions ToLifecycleOptions(const RuntimeConfig& config) {
  core::LifecycleOptions options;
  options.idle_grace_period         = util::FromProto(config.lifecycle().idle_grace_period());
  options.canceled_retention        = util::FromProto(config.lifecycle().canceled_retention());
  options.max_termination_retries   = config.provisioning().max_termination_retries();
  options.termination_retry_backoff = util::FromProto(config.provisioning().termination_retry_backoff());
  return options;
}

autoscale::AutoscaleOptions ToAutoscaleOptions(const RuntimeConfig& config) {
  autoscale::AutoscaleOptions options;
  options.enabled            = config.autoscale().enabled();
  options.node_capacity      = config.autoscale().node_capacity();
  options.min_spare_capacity = config.autoscale().min_spare_capacity();
  options.max_nodes          = config.autoscale().max_nodes();
  return options;
}

} // namespace

void Application::Start() {
  if (reaper) {
    reaper->Start();
  }
  if (lifecycle) {
    lifecycle->EnsureCapacity();
  }
}

void Application::Shutdown() {
  if (lifecycle) {
    lifecycle->Shutdown();
  }
  if (gateway) {
    gateway->Shutdown();
  }
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, std::shared_ptr<util::Clock> clock) {
  Application app;

  app.clock    = clock ? std::move(clock) : std::make_shared<util::SystemClock>();
  app.registry = std::make_shared<registry::MediaNodeRegistry>();

  service::ServiceContext ctx;
  ctx.registry = app.registry;
  ctx.clock    = app.clock;

  if (!config.lifecycle().enabled()) {
    app.manager = std::make_shared<core::NoopMediaNodeManager>();
    ctx.manager = app.manager;
    MEDIANODE_LOG_INFO("Media node lifecycle management disabled", {BoolField("lifecycle_enabled", false)});
  } else {
    // ------------------------------------------------------------------
    // Lifecycle core
    // ------------------------------------------------------------------
    app.gateway = std::make_shared<provisioning::QueueingProvisioningGateway>(app.clock, config.provisioning().max_pending_requests());
    app.reaper  = std::make_shared<reaper::IdleReaper>(app.clock, util::FromProto(config.lifecycle().reaper_poll_interval()));

    const auto autoscale_options = ToAutoscaleOptions(config);
    auto       policy            = std::make_shared<autoscale::AutoscalePolicy>(autoscale_options);
    auto       engine            = std::make_shared<autoscale::AutoscaleDecisionEngine>(policy, app.registry, app.gateway, app.clock);

    const auto lifecycle_options = ToLifecycleOptions(config);
    app.lifecycle = std::make_shared<core::LifecycleMediaNodeManager>(lifecycle_options, app.registry, app.reaper, engine, app.gateway, app.clock);
    app.manager   = app.lifecycle;

    ctx.manager   = app.manager;
    ctx.lifecycle = app.lifecycle;
    ctx.gateway   = app.gateway;

    MEDIANODE_LOG_INFO("Media node lifecycle management enabled",
                       {IntField("idle_grace_period_ms", lifecycle_options.idle_grace_period.count()),
                        BoolField("autoscale_enabled", autoscale_options.enabled),
                        IntField("node_capacity", autoscale_options.node_capacity),
                        IntField("min_spare_capacity", autoscale_options.min_spare_capacity),
                        IntField("max_nodes", autoscale_options.max_nodes)});
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.media_node_service   = std::make_shared<service::MediaNodeService>(ctx);
  app.provisioning_service = std::make_shared<service::ProvisioningService>(ctx);

  return app;
}

} // namespace medianode::factory
