#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "config/config.pb.h"

namespace medianode::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const medianode::runtime::config::RuntimeConfig& config) {
  if (!config.observability().otlp_endpoint().empty()) {
    return config.observability().otlp_endpoint();
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return "localhost:4317";
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> transition_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> provisioning_count;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   fleet_nodes_gauge;

  std::mutex                                    fleet_mutex;
  std::unordered_map<std::string, std::int64_t> fleet_nodes;
};

bool InitializeMetrics(const medianode::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = ResolveEndpoint(config);
  options.use_ssl_credentials = false;
  auto exporter               = otlp::OtlpGrpcMetricExporterFactory::Create(options);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", "media-node-manager"}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("media-node-manager", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("medianode.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("medianode.request.latency_ms", "Request latency in milliseconds", "ms");
  impl_->transition_count   = impl_->meter->CreateUInt64Counter("medianode.transition.count", "Media node state transitions", "1");
  impl_->provisioning_count = impl_->meter->CreateUInt64Counter("medianode.provisioning.count", "Launch and termination requests", "1");
  impl_->fleet_nodes_gauge  = impl_->meter->CreateInt64ObservableGauge("medianode.fleet.nodes", "Media nodes per lifecycle state", "1");
  impl_->fleet_nodes_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->fleet_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [node_state, count] : impl->fleet_nodes) {
          const std::initializer_list<AttributePair> attributes = {{"state", opentelemetry::nostd::string_view(node_state)}};
          int_result->Observe(count, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const std::string                          route_label(route);
  const std::initializer_list<AttributePair> attributes = {{"route", opentelemetry::nostd::string_view(route_label)}, {"success", success}};
  impl_->request_count->Add(1, attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const std::string                          route_label(route);
  const std::initializer_list<AttributePair> attributes = {{"route", opentelemetry::nostd::string_view(route_label)}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordTransition(std::string_view from, std::string_view to) {
  const std::string                          from_label(from);
  const std::string                          to_label(to);
  const std::initializer_list<AttributePair> attributes = {{"from", opentelemetry::nostd::string_view(from_label)}, {"to", opentelemetry::nostd::string_view(to_label)}};
  impl_->transition_count->Add(1, attributes);
}

void Metrics::RecordProvisioningRequest(std::string_view op, bool success) {
  const std::string                          op_label(op);
  const std::initializer_list<AttributePair> attributes = {{"op", opentelemetry::nostd::string_view(op_label)}, {"success", success}};
  impl_->provisioning_count->Add(1, attributes);
}

void Metrics::SetFleetNodes(std::string_view state, std::uint64_t count) {
  std::lock_guard<std::mutex> lock(impl_->fleet_mutex);
  impl_->fleet_nodes[std::string(state)] = static_cast<std::int64_t>(count);
}

} // namespace medianode::observability

#endif
