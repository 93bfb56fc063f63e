#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace cdn::util {

/*
  Time utilities: single place to control clock source.

  Persisted timestamps are UTC unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

google::protobuf::Timestamp MillisToProto(uint64_t ms);

// 2026-10-19T08:15:02.125Z
std::string FormatIso8601(TimePoint tp);
std::string FormatIso8601(const google::protobuf::Timestamp& ts);

} // namespace cdn::util
