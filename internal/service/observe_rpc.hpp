#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace impact::service {

/*
  Wraps one RPC body with a span, request/latency metrics and an error log.
  Exceptions are rethrown for the gRPC layer to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  impact::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("rpc.subject", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    impact::observability::Metrics::Instance().RecordRequest(route, success);
    impact::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    IMPACT_LOG_ERROR("RPC failed", {impact::observability::StringField("route", route), impact::observability::StringField("error", ex.what()),
                                    impact::observability::StringField("subject", subject)});
    finish(false);
    throw;
  }
}

} // namespace impact::service
