#pragma once

#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace datalens::service {

// Runs one service call, logging its latency at debug level and any
// exception at error level before rethrowing it.
template <typename Fn>
auto ObserveCall(std::string_view route, Fn&& fn) {
  const auto started_at = util::SteadyClock::now();
  const auto elapsed_ms = [&] { return util::MillisSince(started_at); };
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      DATALENS_LOG_DEBUG("call completed", {observability::StringField("route", route), observability::DoubleField("elapsed_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      DATALENS_LOG_DEBUG("call completed", {observability::StringField("route", route), observability::DoubleField("elapsed_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    DATALENS_LOG_ERROR("call failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                       observability::DoubleField("elapsed_ms", elapsed_ms())});
    throw;
  }
}

} // namespace datalens::service
