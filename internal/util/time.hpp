#pragma once

#include <chrono>

#include "google/protobuf/timestamp.pb.h"

namespace market::util {

// Wall-clock helpers for reporting only; market logic runs on block heights.

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

} // namespace market::util
