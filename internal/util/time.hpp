#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace refiner::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Date      = std::chrono::sys_days;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Accepts "YYYY-MM-DD" or an ISO-8601 timestamp ("YYYY-MM-DDThh:mm:ss...").
std::optional<Date> ParseDate(std::string_view text);
std::string         FormatDate(Date date);

// Same month and day `years` later; Feb 29 clamps to Feb 28.
Date AddYears(Date date, int years);

} // namespace refiner::util
