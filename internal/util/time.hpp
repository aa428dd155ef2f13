#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace archstore::util {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable clock for rate limits and retention.
using ClockFn = std::function<TimePoint()>;

TimePoint Now();

// Monotonic source for deadlines; tests step it to force timeouts.
using SteadyFn = std::function<std::chrono::steady_clock::time_point()>;

std::chrono::steady_clock::time_point SteadyNow();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration);

// yyyy-MM-dd_HH-mm-ss in UTC, used in backup file names.
std::string FormatFileTimestamp(TimePoint tp);

} // namespace archstore::util
