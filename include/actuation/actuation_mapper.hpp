#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "actuation/actuator_driver.hpp"
#include "model/servo_command.hpp"
#include "model/telemetry_frame.hpp"

namespace res_agent::actuation {

using Clock = std::chrono::steady_clock;

struct ServoRange {
  double min_angle{-150.0};
  double max_angle{150.0};
};

struct WavemakerConfig {
  bool enabled{false};
  std::string port{"/dev/ttyACM2"};
  int min_level{20};
  int max_level{127};
};

struct ActuationConfig {
  bool enabled{false};
  std::string port{"/dev/ttyACM0"};
  // Empty: the clock servo shares the cube port.
  std::string clock_port{"/dev/ttyACM1"};
  int baud{9600};
  std::chrono::milliseconds default_speed{1000};
  double gain_deg{300.0};
  double offset_deg{-150.0};
  // Cube servo ids are 1..kCubeServoCount.
  std::array<ServoRange, model::kCubeServoCount> servos{};
  int clock_servo_id{1};
  ServoRange clock{};
  WavemakerConfig wavemaker{};
};

struct ActuationStats {
  std::uint64_t dispatched{0};
  std::uint64_t failures{0};
};

// Terminal stage: readout scores in, clamped and rate-limited servo commands out.
class ActuationMapper {
 public:
  // `clock` and `wavemaker` may be null: clock commands then go to `cubes`; relay and level commands are skipped.
  ActuationMapper(ActuationConfig config, std::unique_ptr<ActuatorDriver> cubes, std::unique_ptr<ActuatorDriver> clock,
                  std::unique_ptr<ActuatorDriver> wavemaker);

  // Pure planning step. Updates the rate-limit memory.
  std::vector<model::ServoCommand> plan(const std::vector<double>& readout, Clock::time_point now,
                                        std::chrono::system_clock::time_point wall);

  // Sends each command once; failures are logged and dropped. Returns the number accepted.
  std::size_t dispatch(const std::vector<model::ServoCommand>& commands);

  std::size_t apply(const std::vector<double>& readout, Clock::time_point now,
                    std::chrono::system_clock::time_point wall);

  bool engage();
  bool disengage();

  [[nodiscard]] const ActuationStats& stats() const noexcept { return stats_; }
  [[nodiscard]] const std::array<double, model::kCubeServoCount>& last_angles() const noexcept { return last_angles_; }
  [[nodiscard]] std::optional<double> last_clock_angle() const noexcept { return last_clock_angle_; }
  [[nodiscard]] int last_level() const noexcept { return last_level_.value_or(0); }
  [[nodiscard]] const ActuationConfig& config() const noexcept { return config_; }

 private:
  [[nodiscard]] int wave_level(const std::vector<double>& readout) const;
  ActuatorDriver* driver_for(model::ActuatorBus bus) const;

  ActuationConfig config_;
  std::unique_ptr<ActuatorDriver> cubes_;
  std::unique_ptr<ActuatorDriver> clock_;
  std::unique_ptr<ActuatorDriver> wavemaker_;

  std::array<double, model::kCubeServoCount> last_angles_{};
  std::optional<Clock::time_point> last_plan_{};
  std::optional<double> last_clock_angle_{};
  std::optional<int> last_level_{};
  ActuationStats stats_{};
};

}  // namespace res_agent::actuation
