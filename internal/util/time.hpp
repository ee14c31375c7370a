#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace backoffice::util {

/*
  Time utilities. All clock reads go through NowFn.

  Components that make time-based decisions (cache expiry, quotation
  validity, receipt ordering) take a NowFn so tests can drive the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::int64_t ToUnixMillis(TimePoint tp);
TimePoint    FromUnixMillis(std::int64_t ms);

// "yyyy-MM-dd HH:mm:ss" in UTC, the store's display format.
std::string FormatTimestamp(TimePoint tp);

// "yyyy-MM-dd" in UTC.
std::string FormatDate(TimePoint tp);

// Parses "250ms", "30s", "5m", "1h". Throws std::invalid_argument.
std::chrono::milliseconds ParseDuration(std::string_view text);

} // namespace backoffice::util
