#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace cloudstrap::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatLocal(TimePoint tp, const char* format) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           tm{};
  localtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, format);
  return out.str();
}

std::string FormatUtc(TimePoint tp, const char* format) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, format);
  return out.str();
}

} // namespace cloudstrap::util
