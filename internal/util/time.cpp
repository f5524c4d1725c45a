#include "internal/util/time.hpp"

namespace lipsync::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Duration ToProto(Millis d) {
  auto sec   = std::chrono::duration_cast<std::chrono::seconds>(d);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(d - sec);

  google::protobuf::Duration out;
  out.set_seconds(sec.count());
  out.set_nanos(static_cast<int32_t>(nanos.count()));
  return out;
}

Millis FromProto(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<Millis>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

Millis OrDefault(const google::protobuf::Duration& d, Millis fallback) {
  if (d.seconds() == 0 && d.nanos() == 0) {
    return fallback;
  }
  return FromProto(d);
}

void SleepFor(Millis d) {
  if (d.count() > 0) {
    std::this_thread::sleep_for(d);
  }
}

} // namespace lipsync::util
