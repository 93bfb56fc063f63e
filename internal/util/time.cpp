#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace cdn::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

google::protobuf::Timestamp MillisToProto(uint64_t ms) {
  return ToProto(FromUnixMillis(ms));
}

std::string FormatIso8601(TimePoint tp) {
  const auto  ms     = ToUnixMillis(tp);
  std::time_t secs   = static_cast<std::time_t>(ms / 1000);
  const auto  millis = static_cast<unsigned>(ms % 1000);

  std::tm utc{};
  gmtime_r(&secs, &utc);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03uZ", date, millis);
  return out;
}

std::string FormatIso8601(const google::protobuf::Timestamp& ts) {
  return FormatIso8601(FromProto(ts));
}

} // namespace cdn::util
