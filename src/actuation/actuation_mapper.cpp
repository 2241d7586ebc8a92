#include "actuation/actuation_mapper.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>
#include <limits>
#include <utility>

#include "actuation/clock_sector.hpp"

namespace res_agent::actuation {

ActuationMapper::ActuationMapper(ActuationConfig config, std::unique_ptr<ActuatorDriver> cubes,
                                 std::unique_ptr<ActuatorDriver> clock, std::unique_ptr<ActuatorDriver> wavemaker)
    : config_(std::move(config)),
      cubes_(std::move(cubes)),
      clock_(std::move(clock)),
      wavemaker_(std::move(wavemaker)) {
  for (std::size_t i = 0; i < last_angles_.size(); ++i) {
    const auto& range = config_.servos[i];
    last_angles_[i] = std::clamp(0.0, range.min_angle, range.max_angle);
  }
}

std::vector<model::ServoCommand> ActuationMapper::plan(const std::vector<double>& readout, const Clock::time_point now,
                                                       const std::chrono::system_clock::time_point wall) {
  std::vector<model::ServoCommand> commands;

  if (!readout.empty()) {
    double elapsed_ms = std::numeric_limits<double>::infinity();
    if (last_plan_.has_value()) {
      elapsed_ms = std::max(0.0, std::chrono::duration<double, std::milli>(now - *last_plan_).count());
    }
    const double speed_ms = static_cast<double>(config_.default_speed.count());

    for (std::size_t i = 0; i < model::kCubeServoCount; ++i) {
      const auto& range = config_.servos[i];
      // Fewer readout outputs than servos: wrap around.
      const double score = readout[i % readout.size()];
      double angle = config_.offset_deg + (config_.gain_deg * score);
      if (std::isnan(angle)) {
        angle = last_angles_[i];
      }
      angle = std::clamp(angle, range.min_angle, range.max_angle);

      if (last_plan_.has_value() && speed_ms > 0.0) {
        const double max_step = (range.max_angle - range.min_angle) * elapsed_ms / speed_ms;
        angle = std::clamp(angle, last_angles_[i] - max_step, last_angles_[i] + max_step);
      }

      last_angles_[i] = angle;
      model::ServoCommand command{};
      command.kind = model::CommandKind::ANGLE;
      command.bus = model::ActuatorBus::CUBES;
      command.servo_id = static_cast<int>(i) + 1;
      command.angle_degrees = angle;
      commands.push_back(command);
    }
    last_plan_ = now;
  }

  const double clock_angle =
      std::clamp(clock_sector_angle(local_hour(wall)), config_.clock.min_angle, config_.clock.max_angle);
  if (!last_clock_angle_.has_value() || *last_clock_angle_ != clock_angle) {
    model::ServoCommand command{};
    command.kind = model::CommandKind::ANGLE;
    command.bus = model::ActuatorBus::CLOCK;
    command.servo_id = config_.clock_servo_id;
    command.angle_degrees = clock_angle;
    commands.push_back(command);
    last_clock_angle_ = clock_angle;
  }

  if (config_.wavemaker.enabled && wavemaker_ != nullptr && !readout.empty()) {
    const int level = wave_level(readout);
    if (!last_level_.has_value() || *last_level_ != level) {
      model::ServoCommand command{};
      command.kind = model::CommandKind::LEVEL;
      command.bus = model::ActuatorBus::WAVEMAKER;
      command.level = level;
      commands.push_back(command);
      last_level_ = level;
    }
  }

  return commands;
}

std::size_t ActuationMapper::dispatch(const std::vector<model::ServoCommand>& commands) {
  std::size_t accepted = 0;
  for (const auto& command : commands) {
    ActuatorDriver* driver = driver_for(command.bus);
    if (driver == nullptr) {
      continue;
    }

    bool ok = false;
    switch (command.kind) {
      case model::CommandKind::ANGLE:
        ok = driver->set_angle(command.servo_id, command.angle_degrees);
        break;
      case model::CommandKind::RELAY:
        ok = driver->set_relay(command.relay_on);
        break;
      case model::CommandKind::LEVEL:
        ok = driver->set_level(command.level);
        break;
    }

    if (ok) {
      ++stats_.dispatched;
      ++accepted;
      continue;
    }

    ++stats_.failures;
    std::cerr << "[actuation] write to " << driver->name() << " failed; dropped ";
    if (command.kind == model::CommandKind::LEVEL) {
      std::cerr << "level " << command.level << '\n';
    } else if (command.kind == model::CommandKind::RELAY) {
      std::cerr << "relay " << (command.relay_on ? "on" : "off") << '\n';
    } else {
      std::cerr << "servo " << command.servo_id << " -> " << command.angle_degrees << " deg\n";
    }
  }
  return accepted;
}

std::size_t ActuationMapper::apply(const std::vector<double>& readout, const Clock::time_point now,
                                   const std::chrono::system_clock::time_point wall) {
  return dispatch(plan(readout, now, wall));
}

bool ActuationMapper::engage() {
  if (wavemaker_ == nullptr) {
    return true;
  }
  model::ServoCommand command{};
  command.kind = model::CommandKind::RELAY;
  command.bus = model::ActuatorBus::WAVEMAKER;
  command.relay_on = true;
  return dispatch({command}) == 1U;
}

bool ActuationMapper::disengage() {
  if (wavemaker_ == nullptr) {
    return true;
  }
  std::vector<model::ServoCommand> commands;
  if (config_.wavemaker.enabled) {
    model::ServoCommand stop{};
    stop.kind = model::CommandKind::LEVEL;
    stop.bus = model::ActuatorBus::WAVEMAKER;
    stop.level = 0;
    commands.push_back(stop);
  }
  model::ServoCommand relay{};
  relay.kind = model::CommandKind::RELAY;
  relay.bus = model::ActuatorBus::WAVEMAKER;
  relay.relay_on = false;
  commands.push_back(relay);

  last_level_ = 0;
  return dispatch(commands) == commands.size();
}

int ActuationMapper::wave_level(const std::vector<double>& readout) const {
  if (readout.size() < 2U) {
    return 0;
  }
  const auto predicted =
      static_cast<std::size_t>(std::distance(readout.begin(), std::max_element(readout.begin(), readout.end())));
  if (predicted == 0) {
    return 0;
  }

  const int span = config_.wavemaker.max_level - config_.wavemaker.min_level;
  const double fraction = static_cast<double>(predicted) / static_cast<double>(readout.size() - 1U);
  const int level = config_.wavemaker.min_level + static_cast<int>(std::lround(span * fraction));
  return std::clamp(level, config_.wavemaker.min_level, config_.wavemaker.max_level);
}

ActuatorDriver* ActuationMapper::driver_for(const model::ActuatorBus bus) const {
  switch (bus) {
    case model::ActuatorBus::CUBES:
      return cubes_.get();
    case model::ActuatorBus::CLOCK:
      return clock_ != nullptr ? clock_.get() : cubes_.get();
    case model::ActuatorBus::WAVEMAKER:
      return wavemaker_.get();
  }
  return nullptr;
}

}  // namespace res_agent::actuation
