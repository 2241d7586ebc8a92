#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace res_agent::actuation {

// Command side of a microcontroller on a serial line. Each call reports whether the
// controller accepted the command; a false return is a transient write failure.
class ActuatorDriver {
 public:
  virtual bool set_angle(int servo_id, double angle_degrees) = 0;
  virtual bool set_relay(bool on) = 0;
  virtual bool set_level(int level) = 0;
  virtual const std::string& name() const = 0;
  virtual ~ActuatorDriver() = default;
};

struct SerialOptions {
  std::string port{"/dev/ttyACM0"};
  int baud{9600};
  std::chrono::milliseconds move_time{1000};
  std::chrono::milliseconds reply_timeout{20};
  bool require_reply{false};
};

// Throws std::runtime_error when the port cannot be opened or configured.
std::unique_ptr<ActuatorDriver> make_serial_driver(const SerialOptions& options);
// Accepts everything; used when a controller is not attached.
std::unique_ptr<ActuatorDriver> make_none_driver(const std::string& name);

// Servo board line protocol.
int angle_to_pulse(double angle_degrees) noexcept;
std::string format_servo_command(int servo_id, double angle_degrees, std::chrono::milliseconds move_time);
std::string format_relay_command(bool on);
std::string format_level_command(int level);
bool reply_is_error(const std::string& token) noexcept;

}  // namespace res_agent::actuation
