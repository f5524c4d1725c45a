#pragma once

#include <chrono>
#include <thread>

#include "google/protobuf/duration.pb.h"

namespace lipsync::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis    = std::chrono::milliseconds;

TimePoint Now();

google::protobuf::Duration ToProto(Millis d);
Millis                     FromProto(const google::protobuf::Duration& d);

// Duration from config, or the fallback when the field was left unset.
Millis OrDefault(const google::protobuf::Duration& d, Millis fallback);

// Sleeps unless the duration is zero; tests configure zero intervals.
void SleepFor(Millis d);

} // namespace lipsync::util
