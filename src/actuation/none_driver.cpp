#include "actuation/actuator_driver.hpp"

#include <memory>
#include <string>
#include <utility>

namespace res_agent::actuation {
namespace {

class NoneActuatorDriver final : public ActuatorDriver {
 public:
  explicit NoneActuatorDriver(std::string name) : name_(std::move(name)) {}

  bool set_angle(int /*servo_id*/, double /*angle_degrees*/) override { return true; }
  bool set_relay(bool /*on*/) override { return true; }
  bool set_level(int /*level*/) override { return true; }
  const std::string& name() const override { return name_; }

 private:
  std::string name_;
};

}  // namespace

std::unique_ptr<ActuatorDriver> make_none_driver(const std::string& name) {
  return std::make_unique<NoneActuatorDriver>(name);
}

}  // namespace res_agent::actuation
