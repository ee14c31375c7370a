#include "time.hpp"

#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace backoffice::util {

namespace {

std::tm ToUtc(TimePoint tp) {
  const auto time = Clock::to_time_t(tp);
  std::tm    utc{};
  gmtime_r(&time, &utc);
  return utc;
}

std::string Format(TimePoint tp, const char* pattern) {
  const auto         utc = ToUtc(tp);
  std::ostringstream out;
  out << std::put_time(&utc, pattern);
  return out.str();
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

std::int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(std::int64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
}

std::string FormatTimestamp(TimePoint tp) {
  return Format(tp, "%Y-%m-%d %H:%M:%S");
}

std::string FormatDate(TimePoint tp) {
  return Format(tp, "%Y-%m-%d");
}

std::chrono::milliseconds ParseDuration(std::string_view text) {
  std::size_t digits = 0;
  while (digits < text.size() && text[digits] >= '0' && text[digits] <= '9') ++digits;
  if (digits == 0) {
    throw std::invalid_argument("duration must start with a number: '" + std::string(text) + "'");
  }

  std::int64_t value = 0;
  auto [ptr, ec]     = std::from_chars(text.data(), text.data() + digits, value);
  if (ec != std::errc{}) {
    throw std::invalid_argument("duration out of range: '" + std::string(text) + "'");
  }

  const auto unit = text.substr(digits);
  if (unit == "ms") return std::chrono::milliseconds(value);
  if (unit == "s") return std::chrono::seconds(value);
  if (unit == "m") return std::chrono::minutes(value);
  if (unit == "h") return std::chrono::hours(value);

  throw std::invalid_argument("unknown duration unit in '" + std::string(text) + "' (use ms, s, m or h)");
}

} // namespace backoffice::util
