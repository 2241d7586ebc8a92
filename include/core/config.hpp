#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "actuation/actuation_mapper.hpp"
#include "link/reliable_link.hpp"
#include "reservoir/reservoir_node.hpp"
#include "topology/router.hpp"
#include "training/training_supervisor.hpp"

namespace res_agent::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"res"};
  bool enabled{false};
};

struct MotionConfig {
  std::string csv_path{};
  bool loop{true};
  std::uint64_t every_ticks{1};
};

struct AgentConfig {
  std::string node_name{};
  std::chrono::milliseconds tick_interval{100};
  topology::TopologyConfig topology{};
  link::LinkConfig link{};
  reservoir::NodeOptions node{};
  training::TrainingConfig training{};
  actuation::ActuationConfig actuation{};
  MotionConfig motion{};
  bool publish_health{true};
  bool stdout_debug{false};
  RedisConfig redis{};
};

// Throws std::runtime_error naming the offending key.
AgentConfig load_agent_config(const std::string& path);

// Cross-key checks; load_agent_config runs this after parsing.
void validate_agent_config(AgentConfig& config);

}  // namespace res_agent::core
