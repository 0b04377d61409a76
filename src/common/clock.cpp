#include "sessionrelay/common/clock.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sessionrelay::common {

std::string now_rfc3339() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

} // namespace sessionrelay::common
