#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace medianode::service {

/*
  Runs one request handler with request metrics and error logging.

  Contract rejections are logged at warn level by the manager itself; here
  every failure is counted and logged once with its route.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view media_node_id, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      medianode::observability::Metrics::Instance().RecordRequest(route, true);
      medianode::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      medianode::observability::Metrics::Instance().RecordRequest(route, true);
      medianode::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    MEDIANODE_LOG_ERROR("RPC failed", {medianode::observability::StringField("route", route),
                                       medianode::observability::StringField("node_id", media_node_id),
                                       medianode::observability::StringField("error", ex.what())});
    medianode::observability::Metrics::Instance().RecordRequest(route, false);
    medianode::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace medianode::service
