#include "collab/util/Time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace collab::util {

std::string toIso8601(Timestamp tp) {
  using namespace std::chrono;
  const auto ms = toEpochMillis(tp);
  std::time_t t = static_cast<std::time_t>(ms / 1000);
  int millis = static_cast<int>(ms % 1000);
  if (millis < 0) { millis += 1000; --t; }

  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << millis << 'Z';
  return oss.str();
}

std::int64_t toEpochMillis(Timestamp tp) {
  using namespace std::chrono;
  return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

Timestamp fromEpochSeconds(std::int64_t s) {
  return Timestamp(std::chrono::seconds(s));
}

} // namespace collab::util
