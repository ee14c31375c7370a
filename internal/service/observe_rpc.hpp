#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace backoffice::service {

/*
  Logs every failed call with its route and latency, then rethrows so the
  transport layer can map the exception to a status code.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      BACKOFFICE_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::IntField("latency_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      BACKOFFICE_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::IntField("latency_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    BACKOFFICE_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("subject", subject),
                                        observability::StringField("error", ex.what()), observability::IntField("latency_ms", elapsed_ms())});
    throw;
  }
}

} // namespace backoffice::service
