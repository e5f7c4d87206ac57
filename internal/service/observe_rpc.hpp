#pragma once

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/db/api/types.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "market/exchange/v1.hpp"

namespace market::service::detail {

inline constexpr std::size_t kDefaultPageLimit = 100;
inline constexpr std::size_t kMaxPageLimit     = 1000;

inline void RequireSender(const std::string& sender) {
  if (sender.empty()) {
    throw std::invalid_argument("sender principal is required");
  }
}

inline market::db::Pagination ToPagination(const market::exchange::v1::Page& page) {
  market::db::Pagination out;
  out.limit  = page.limit() == 0 ? kDefaultPageLimit : std::min<std::size_t>(page.limit(), kMaxPageLimit);
  out.offset = page.offset();
  return out;
}

inline std::string_view ErrorName(const std::exception& ex) {
  if (const auto* market_error = dynamic_cast<const market::util::MarketError*>(&ex)) {
    return market::util::ErrorCodeName(market_error->code());
  }
  if (dynamic_cast<const std::invalid_argument*>(&ex)) {
    return "INVALID_ARGUMENT";
  }
  return "INTERNAL";
}

/*
  Wraps one RPC in a span, request/latency metrics and a failure log.
  Exceptions are rethrown untouched for the gRPC adapter to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view principal, Fn&& fn) {
  market::observability::SpanScope span(route);
  if (!principal.empty()) {
    span.SetAttribute("market.principal", principal);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      market::observability::Metrics::Instance().RecordRequest(route, true);
      market::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      market::observability::Metrics::Instance().RecordRequest(route, true);
      market::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    MARKET_LOG_ERROR("RPC failed", {market::observability::StringField("route", route),
                                    market::observability::StringField("error_code", ErrorName(ex)),
                                    market::observability::StringField("error", ex.what()),
                                    market::observability::StringField("principal", principal)});
    market::observability::Metrics::Instance().RecordRequest(route, false);
    market::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace market::service::detail
