#include "time.hpp"

namespace fleetq::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) +
                                                               std::chrono::nanoseconds(d.nanos()));
}

google::protobuf::Duration ToProto(std::chrono::milliseconds d) {
  auto sec   = std::chrono::duration_cast<std::chrono::seconds>(d);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(d - sec);

  google::protobuf::Duration out;
  out.set_seconds(sec.count());
  out.set_nanos(static_cast<int32_t>(nanos.count()));
  return out;
}

} // namespace fleetq::util
