#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "wire/codec.hpp"

namespace res_agent::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

long long parse_integer(const std::string& key, const std::string& value, const long long min, const long long max) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::logic_error&) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (parsed < min || parsed > max) {
    throw std::runtime_error(key + " must be in range " + std::to_string(min) + ".." + std::to_string(max));
  }
  return parsed;
}

double parse_real(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::logic_error&) {
    throw std::runtime_error(key + " must be a number");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be a number");
  }
  return parsed;
}

topology::NodeEntry& topology_node(AgentConfig& config, const std::string& name) {
  for (auto& node : config.topology.nodes) {
    if (node.name == name) {
      return node;
    }
  }
  config.topology.nodes.push_back(topology::NodeEntry{name, {}, model::NodeRole::RELAY});
  return config.topology.nodes.back();
}

void apply_topology_key(AgentConfig& config, const std::string& key, const std::string& value) {
  // topology.<name>.<field>
  const std::string rest = key.substr(std::string("topology.").size());
  const auto dot = rest.rfind('.');
  if (dot == std::string::npos || dot == 0) {
    throw std::runtime_error(key + ": expected topology.<node>.<field>");
  }
  const std::string name = rest.substr(0, dot);
  const std::string field = rest.substr(dot + 1);
  auto& node = topology_node(config, name);

  if (field == "address" || field == "ip") {
    node.address = value;
    return;
  }
  if (field == "role") {
    if (!model::parse_role(value, node.role)) {
      throw std::runtime_error(key + " must be one of source|relay|trainer|builder|sink");
    }
    return;
  }
  if (field == "destination") {
    auto& edges = config.topology.edges;
    const auto existing =
        std::find_if(edges.begin(), edges.end(), [&name](const topology::Edge& edge) { return edge.from == name; });
    if (value.empty() || value == "none") {
      if (existing != edges.end()) {
        edges.erase(existing);
      }
      return;
    }
    if (existing != edges.end()) {
      existing->to = value;
    } else {
      edges.push_back(topology::Edge{name, value});
    }
  }
}

void apply_servo_key(AgentConfig& config, const std::string& key, const std::string& value) {
  // actuation.servos.<id>.<field>
  const std::string rest = key.substr(std::string("actuation.servos.").size());
  const auto dot = rest.find('.');
  if (dot == std::string::npos) {
    throw std::runtime_error(key + ": expected actuation.servos.<id>.<field>");
  }
  const auto id = parse_integer(key, rest.substr(0, dot), 1, static_cast<long long>(model::kCubeServoCount));
  auto& range = config.actuation.servos[static_cast<std::size_t>(id - 1)];
  const std::string field = rest.substr(dot + 1);
  if (field == "min_angle") {
    range.min_angle = parse_real(key, value);
  } else if (field == "max_angle") {
    range.max_angle = parse_real(key, value);
  }
}

void apply_key_value(AgentConfig& config, const std::string& key, const std::string& value) {
  if (key == "tick_rate_hz") {
    const auto hz = std::stoi(value);
    if (hz <= 0) {
      throw std::runtime_error("tick_rate_hz must be greater than 0");
    }

    if (hz > 1000) {
      throw std::runtime_error("tick_rate_hz must be less than or equal to 1000");
    }

    config.tick_interval = std::chrono::milliseconds(1000 / hz);
    return;
  }

  if (key == "node.name") {
    config.node_name = value;
    return;
  }

  if (key.rfind("topology.", 0) == 0) {
    apply_topology_key(config, key, value);
    return;
  }

  if (key == "link.ack_timeout_ms") {
    config.link.ack_timeout = std::chrono::milliseconds(parse_integer(key, value, 1, 600000));
    return;
  }
  if (key == "link.backoff_factor") {
    config.link.backoff_factor = parse_real(key, value);
    if (config.link.backoff_factor < 1.0) {
      throw std::runtime_error("link.backoff_factor must be at least 1.0");
    }
    return;
  }
  if (key == "link.max_attempts") {
    config.link.max_attempts = static_cast<std::uint32_t>(parse_integer(key, value, 1, 1000));
    return;
  }
  if (key == "link.reorder_timeout_ms") {
    config.link.reorder_timeout = std::chrono::milliseconds(parse_integer(key, value, 1, 600000));
    return;
  }
  if (key == "link.dedup_window") {
    config.link.dedup_window = static_cast<std::size_t>(parse_integer(key, value, 1, 1000000));
    return;
  }
  if (key == "link.send_queue_capacity") {
    config.link.send_queue_capacity = static_cast<std::size_t>(parse_integer(key, value, 1, 100000));
    return;
  }
  if (key == "link.retransmit_history") {
    config.link.retransmit_history = static_cast<std::size_t>(parse_integer(key, value, 0, 100000));
    return;
  }
  if (key == "link.on_degraded") {
    if (value == "skip") {
      config.node.on_degraded = reservoir::DegradedPolicy::kSkip;
    } else if (value == "halt") {
      config.node.on_degraded = reservoir::DegradedPolicy::kHalt;
    } else {
      throw std::runtime_error("link.on_degraded must be skip or halt");
    }
    return;
  }

  auto& reservoir = config.node.reservoir;
  if (key == "reservoir.state_dim") {
    reservoir.state_dim = static_cast<std::size_t>(parse_integer(key, value, 1, 4096));
    return;
  }
  if (key == "reservoir.input_dim") {
    reservoir.input_dim = static_cast<std::size_t>(parse_integer(key, value, 1, 4096));
    return;
  }
  if (key == "reservoir.leak_rate") {
    reservoir.leak_rate = parse_real(key, value);
    if (!(reservoir.leak_rate > 0.0 && reservoir.leak_rate <= 1.0)) {
      throw std::runtime_error("reservoir.leak_rate must be in (0, 1]");
    }
    return;
  }
  if (key == "reservoir.spectral_radius") {
    reservoir.spectral_radius = parse_real(key, value);
    if (reservoir.spectral_radius < 0.0) {
      throw std::runtime_error("reservoir.spectral_radius must not be negative");
    }
    return;
  }
  if (key == "reservoir.input_scaling") {
    reservoir.input_scaling = parse_real(key, value);
    if (reservoir.input_scaling <= 0.0) {
      throw std::runtime_error("reservoir.input_scaling must be greater than 0");
    }
    return;
  }
  if (key == "reservoir.connectivity") {
    reservoir.connectivity = parse_real(key, value);
    if (reservoir.connectivity < 0.0 || reservoir.connectivity > 1.0) {
      throw std::runtime_error("reservoir.connectivity must be in [0, 1]");
    }
    return;
  }
  if (key == "reservoir.seed") {
    reservoir.seed = static_cast<std::uint32_t>(parse_integer(key, value, 0, 4294967295LL));
    return;
  }
  if (key == "reservoir.input_timeout_ms") {
    config.node.input_timeout = std::chrono::milliseconds(parse_integer(key, value, 0, 3600000));
    return;
  }

  auto& training = config.training;
  if (key == "training.enabled") {
    training.enabled = parse_bool(value);
    return;
  }
  if (key == "training.classes") {
    training.classes = static_cast<std::size_t>(parse_integer(key, value, 2, 64));
    return;
  }
  if (key == "training.capacity") {
    training.capacity = static_cast<std::size_t>(parse_integer(key, value, 2, 10000000));
    return;
  }
  if (key == "training.train_ratio") {
    training.train_ratio = parse_real(key, value);
    if (!(training.train_ratio > 0.0 && training.train_ratio < 1.0)) {
      throw std::runtime_error("training.train_ratio must be in (0, 1)");
    }
    return;
  }
  if (key == "training.ridge_lambda") {
    training.ridge_lambda = parse_real(key, value);
    if (training.ridge_lambda < 0.0) {
      throw std::runtime_error("training.ridge_lambda must not be negative");
    }
    return;
  }
  if (key == "training.every_examples") {
    training.every_examples = static_cast<std::size_t>(parse_integer(key, value, 0, 10000000));
    return;
  }
  if (key == "training.every_seconds") {
    training.every = std::chrono::milliseconds(parse_integer(key, value, 0, 86400) * 1000);
    return;
  }
  if (key == "training.activity_min") {
    training.activity_min = parse_real(key, value);
    return;
  }
  if (key == "training.activity_max") {
    training.activity_max = parse_real(key, value);
    return;
  }
  if (key == "training.model_path") {
    training.model_path = value;
    return;
  }

  auto& actuation = config.actuation;
  if (key.rfind("actuation.servos.", 0) == 0) {
    apply_servo_key(config, key, value);
    return;
  }
  if (key == "actuation.enabled") {
    actuation.enabled = parse_bool(value);
    return;
  }
  if (key == "actuation.port") {
    actuation.port = value;
    return;
  }
  if (key == "actuation.clock_port") {
    actuation.clock_port = value;
    return;
  }
  if (key == "actuation.baud") {
    actuation.baud = static_cast<int>(parse_integer(key, value, 1200, 230400));
    return;
  }
  if (key == "actuation.default_speed_ms") {
    actuation.default_speed = std::chrono::milliseconds(parse_integer(key, value, 0, 60000));
    return;
  }
  if (key == "actuation.gain_deg") {
    actuation.gain_deg = parse_real(key, value);
    return;
  }
  if (key == "actuation.offset_deg") {
    actuation.offset_deg = parse_real(key, value);
    return;
  }
  if (key == "actuation.clock.id") {
    actuation.clock_servo_id = static_cast<int>(parse_integer(key, value, 0, 253));
    return;
  }
  if (key == "actuation.clock.min_angle") {
    actuation.clock.min_angle = parse_real(key, value);
    return;
  }
  if (key == "actuation.clock.max_angle") {
    actuation.clock.max_angle = parse_real(key, value);
    return;
  }
  if (key == "actuation.wavemaker.enabled") {
    actuation.wavemaker.enabled = parse_bool(value);
    return;
  }
  if (key == "actuation.wavemaker.port") {
    actuation.wavemaker.port = value;
    return;
  }
  if (key == "actuation.wavemaker.min_level") {
    actuation.wavemaker.min_level = static_cast<int>(parse_integer(key, value, 1, 255));
    return;
  }
  if (key == "actuation.wavemaker.max_level") {
    actuation.wavemaker.max_level = static_cast<int>(parse_integer(key, value, 1, 255));
    return;
  }

  if (key == "motion.csv_path") {
    config.motion.csv_path = value;
    return;
  }
  if (key == "motion.loop") {
    config.motion.loop = parse_bool(value);
    return;
  }
  if (key == "motion.every_ticks") {
    config.motion.every_ticks = static_cast<std::uint64_t>(parse_integer(key, value, 1, 1000000));
    return;
  }

  if (key == "agent.publish_health") {
    config.publish_health = parse_bool(value);
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "redis.key_prefix") {
    config.redis.key_prefix = value;
    return;
  }

  if (key == "redis.address") {
    config.redis.enabled = !value.empty();
    if (value.rfind("unix://", 0) == 0) {
      config.redis.unix_socket = value.substr(std::string("unix://").size());
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    if (!value.empty() && value.front() == '/') {
      config.redis.unix_socket = value;
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    config.redis.unix_socket.clear();
    const auto split = value.find(':');
    if (split == std::string::npos) {
      config.redis.host = value;
      return;
    }

    config.redis.host = value.substr(0, split);
    const auto parsed_port = std::stoi(value.substr(split + 1));
    if (parsed_port <= 0 || parsed_port > 65535) {
      throw std::runtime_error("redis.address port must be in range 1..65535");
    }

    config.redis.port = static_cast<std::uint16_t>(parsed_port);
    return;
  }
}

}  // namespace

void validate_agent_config(AgentConfig& config) {
  const auto& reservoir = config.node.reservoir;
  const std::size_t model_bytes = 4 + 8 + 2 + 2 + (config.training.classes * (reservoir.state_dim + 1U) * 8U) + 32 + 8;
  if (model_bytes > wire::kMaxPayloadSize) {
    throw std::runtime_error("training.classes x (reservoir.state_dim + 1) readout does not fit one MODEL_UPDATE");
  }

  if (!(config.training.activity_max > config.training.activity_min)) {
    throw std::runtime_error("training.activity_max must be greater than training.activity_min");
  }

  for (std::size_t i = 0; i < config.actuation.servos.size(); ++i) {
    if (!(config.actuation.servos[i].max_angle > config.actuation.servos[i].min_angle)) {
      throw std::runtime_error("actuation.servos." + std::to_string(i + 1) + " max_angle must exceed min_angle");
    }
  }
  if (!(config.actuation.clock.max_angle > config.actuation.clock.min_angle)) {
    throw std::runtime_error("actuation.clock max_angle must exceed min_angle");
  }
  if (config.actuation.wavemaker.max_level < config.actuation.wavemaker.min_level) {
    throw std::runtime_error("actuation.wavemaker.max_level must not be below min_level");
  }

  // The source bins activity with the same classes the trainer fits.
  config.node.classes = config.training.classes;
  config.node.activity_min = config.training.activity_min;
  config.node.activity_max = config.training.activity_max;
}

AgentConfig load_agent_config(const std::string& path) {
  AgentConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      sections.resize(depth);
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate_agent_config(config);
  return config;
}

}  // namespace res_agent::core
