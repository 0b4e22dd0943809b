#include "spme/core/clock.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace spme::core {

std::string SystemClock::now_iso8601() {
  const auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

  std::tm utc{};
  gmtime_r(&time_t_now, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

}  // namespace spme::core
