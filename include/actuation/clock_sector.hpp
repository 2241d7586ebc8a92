#pragma once

#include <array>
#include <chrono>

namespace res_agent::actuation {

// Six 4-hour windows; sector = hour / 4.
inline constexpr std::array<double, 6> kClockSectorAngles = {-150.0, -90.0, -30.0, 30.0, 90.0, 150.0};

// Hours outside 0..23 wrap.
int clock_sector(int hour) noexcept;
double clock_sector_angle(int hour) noexcept;

// Local hour of day for `when`.
int local_hour(std::chrono::system_clock::time_point when);

}  // namespace res_agent::actuation
