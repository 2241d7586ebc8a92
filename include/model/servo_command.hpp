#pragma once

#include <cstdint>

namespace res_agent::model {

enum class CommandKind : std::uint8_t {
  ANGLE = 0,
  RELAY = 1,
  LEVEL = 2,
};

// Which serial controller a command is meant for.
enum class ActuatorBus : std::uint8_t {
  CUBES = 0,
  CLOCK = 1,
  WAVEMAKER = 2,
};

// angle_degrees is clamped to the servo range before dispatch.
struct ServoCommand {
  CommandKind kind{CommandKind::ANGLE};
  ActuatorBus bus{ActuatorBus::CUBES};
  int servo_id{0};
  double angle_degrees{0.0};
  bool relay_on{false};
  int level{0};
};

}  // namespace res_agent::model
