#include "actuation/clock_sector.hpp"

#include <cstddef>
#include <ctime>

namespace res_agent::actuation {

int clock_sector(const int hour) noexcept {
  const int wrapped = ((hour % 24) + 24) % 24;
  return wrapped / 4;
}

double clock_sector_angle(const int hour) noexcept {
  return kClockSectorAngles[static_cast<std::size_t>(clock_sector(hour))];
}

int local_hour(const std::chrono::system_clock::time_point when) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
  if (::localtime_r(&seconds, &local) == nullptr) {
    return 0;
  }
  return local.tm_hour;
}

}  // namespace res_agent::actuation
