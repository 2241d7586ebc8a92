#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "core/agent.hpp"
#include "core/config.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const res_agent::core::AgentConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | node=" << config.node_name
         << " | tick_interval_ms=" << config.tick_interval.count()
         << " | state_dim=" << config.node.reservoir.state_dim
         << " | input_dim=" << config.node.reservoir.input_dim
         << " | training=" << (config.training.enabled ? "true" : "false")
         << " | actuation=" << (config.actuation.enabled ? "true" : "false")
         << " | motion_csv=" << (config.motion.csv_path.empty() ? "none" : config.motion.csv_path)
         << " | publish_health=" << (config.publish_health ? "true" : "false")
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/node.yaml";

  res_agent::core::AgentConfig config{};
  std::unique_ptr<res_agent::core::Agent> agent;
  try {
    config = res_agent::core::load_agent_config(config_path);
    if (argc > 2) {
      config.node_name = argv[2];
    }
    std::cerr << format_config_settings(config, config_path) << '\n';
    agent = std::make_unique<res_agent::core::Agent>(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  while (g_shutdown_requested == 0 && !agent->halted()) {
    agent->run_for_ticks(1);
  }

  if (agent->halted()) {
    std::cerr << "[agent] node halted; exiting\n";
  } else {
    std::cerr << "[agent] shutdown signal received; exiting cleanly\n";
  }
  agent->stop();

  return 0;
}
