#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace gate::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixSeconds(int64_t seconds) {
  return TimePoint{} + std::chrono::seconds(seconds);
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string ToIso8601(TimePoint tp) {
  const std::time_t t = static_cast<std::time_t>(ToUnixSeconds(tp));
  std::tm           utc{};
  gmtime_r(&t, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

TimePoint FromIso8601(const std::string& text) {
  std::tm            utc{};
  std::istringstream in(text);
  in >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    throw std::runtime_error("invalid ISO-8601 timestamp: " + text);
  }
  return FromUnixSeconds(static_cast<int64_t>(timegm(&utc)));
}

} // namespace gate::util
