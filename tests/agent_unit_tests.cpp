#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

#include "actuation/actuator_driver.hpp"
#include "core/agent.hpp"
#include "core/config.hpp"
#include "core/sampler.hpp"
#include "link/memory_network.hpp"
#include "model/telemetry_frame.hpp"
#include "motion/motion_source.hpp"
#include "sinks/redis_ts.hpp"

using res_agent::core::Agent;
using res_agent::core::AgentConfig;
using res_agent::core::AgentDeps;
using res_agent::core::Sampler;
using res_agent::core::load_agent_config;
using res_agent::model::NodeRole;
using res_agent::model::telemetry_frame;
using res_agent::motion::CsvMotionOptions;
using res_agent::motion::CsvMotionSource;
using res_agent::sinks::RedisTsOptions;
using res_agent::sinks::RedisTsSink;

namespace {

struct RedisMockState {
  std::vector<std::string> last_argv{};
  int command_argv_calls{0};
};

RedisMockState g_redis_mock{};

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

void redisFree(redisContext* c) { std::free(c); }

void* redisCommand(redisContext*, const char*, ...) {
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = REDIS_REPLY_STATUS;
  return reply;
}

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t*) {
  g_redis_mock.command_argv_calls += 1;
  g_redis_mock.last_argv.clear();
  for (int i = 0; i < argc; ++i) {
    g_redis_mock.last_argv.emplace_back(argv[i]);
  }
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = REDIS_REPLY_ARRAY;
  return reply;
}

void freeReplyObject(void* reply) { std::free(reply); }

}  // extern "C"

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::filesystem::path write_temp(const std::string& name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path;
}

bool config_throws(const std::string& name, const std::string& content) {
  const auto path = write_temp(name, content);
  bool threw = false;
  try {
    (void)load_agent_config(path.string());
  } catch (const std::exception&) {
    threw = true;
  }
  std::filesystem::remove(path);
  return threw;
}

std::optional<std::string> metric_value(const std::string& key) {
  for (std::size_t i = 0; i + 2 < g_redis_mock.last_argv.size(); ++i) {
    if (g_redis_mock.last_argv[i] == key) {
      return g_redis_mock.last_argv[i + 2];
    }
  }
  return std::nullopt;
}

int test_sampler_should_sample_every() {
  Sampler sampler;

  if (!sampler.should_sample_every(1)) {
    return fail("test_sampler_should_sample_every", "tick 0 should sample every 1");
  }
  if (!sampler.should_sample_every(5)) {
    return fail("test_sampler_should_sample_every", "tick 0 should sample every 5");
  }
  if (sampler.should_sample_every(0)) {
    return fail("test_sampler_should_sample_every", "every 0 must never sample");
  }

  sampler.advance();
  if (sampler.should_sample_every(5)) {
    return fail("test_sampler_should_sample_every", "tick 1 should not sample every 5");
  }

  for (int i = 0; i < 4; ++i) {
    sampler.advance();
  }
  if (!sampler.should_sample_every(5)) {
    return fail("test_sampler_should_sample_every", "tick 5 should sample every 5");
  }

  return 0;
}

int test_config_parses_topology_and_actuation() {
  const auto path = write_temp("res_agent_topology.yaml",
                               "tick_rate_hz: 20\n"
                               "node:\n"
                               "  name: res01\n"
                               "topology:\n"
                               "  res00:\n"
                               "    address: 127.0.0.1:9400\n"
                               "    role: builder\n"
                               "    destination: res01\n"
                               "  res01:\n"
                               "    address: 127.0.0.1:9401  # trailing comment\n"
                               "    role: trainer\n"
                               "    destination: none\n"
                               "link:\n"
                               "  max_attempts: 7\n"
                               "  on_degraded: halt\n"
                               "training:\n"
                               "  enabled: true\n"
                               "  classes: 3\n"
                               "actuation:\n"
                               "  enabled: true\n"
                               "  clock_port: /dev/ttyUSB1\n"
                               "  servos:\n"
                               "    4:\n"
                               "      min_angle: -120\n"
                               "      max_angle: 120\n"
                               "  wavemaker:\n"
                               "    enabled: yes\n"
                               "    max_level: 100\n");

  const auto config = load_agent_config(path.string());
  std::filesystem::remove(path);

  if (config.node_name != "res01" || config.tick_interval != std::chrono::milliseconds(50)) {
    return fail("test_config_parses_topology_and_actuation", "node name or tick rate not parsed");
  }
  if (config.topology.nodes.size() != 2 || config.topology.nodes[0].role != NodeRole::BUILDER ||
      config.topology.nodes[1].address != "127.0.0.1:9401" || config.topology.nodes[1].role != NodeRole::TRAINER) {
    return fail("test_config_parses_topology_and_actuation", "topology nodes not parsed");
  }
  if (config.topology.edges.size() != 1 || config.topology.edges[0].from != "res00" ||
      config.topology.edges[0].to != "res01") {
    return fail("test_config_parses_topology_and_actuation", "destination none should leave a terminal node");
  }
  if (config.link.max_attempts != 7U || config.node.on_degraded != res_agent::reservoir::DegradedPolicy::kHalt) {
    return fail("test_config_parses_topology_and_actuation", "link settings not parsed");
  }
  if (!config.training.enabled || config.training.classes != 3U || config.node.classes != 3U) {
    return fail("test_config_parses_topology_and_actuation", "training classes should reach the node options");
  }
  if (!config.actuation.enabled || config.actuation.clock_port != "/dev/ttyUSB1" ||
      config.actuation.servos[3].min_angle != -120.0 || config.actuation.servos[3].max_angle != 120.0 ||
      config.actuation.servos[0].max_angle != 150.0) {
    return fail("test_config_parses_topology_and_actuation", "servo ranges not parsed");
  }
  if (!config.actuation.wavemaker.enabled || config.actuation.wavemaker.max_level != 100) {
    return fail("test_config_parses_topology_and_actuation", "wavemaker settings not parsed");
  }
  if (config.redis.enabled) {
    return fail("test_config_parses_topology_and_actuation", "redis should remain disabled when section is missing");
  }

  return 0;
}

int test_config_parsing_edge_cases() {
  if (!config_throws("res_agent_bad_port.yaml", "redis:\n  address: localhost:99999\n")) {
    return fail("test_config_parsing_edge_cases", "bad redis port should throw");
  }
  if (!config_throws("res_agent_bad_int.yaml", "reservoir:\n  state_dim: fifty\n")) {
    return fail("test_config_parsing_edge_cases", "non-integer state_dim should throw");
  }
  if (!config_throws("res_agent_bad_role.yaml", "topology:\n  res00:\n    role: leader\n")) {
    return fail("test_config_parsing_edge_cases", "unknown role should throw");
  }
  if (!config_throws("res_agent_bad_activity.yaml", "training:\n  activity_min: 50\n  activity_max: 50\n")) {
    return fail("test_config_parsing_edge_cases", "activity_max <= activity_min should throw");
  }
  if (!config_throws("res_agent_bad_servo.yaml", "actuation:\n  servos:\n    6:\n      min_angle: 0\n")) {
    return fail("test_config_parsing_edge_cases", "servo id outside 1..5 should throw");
  }
  if (!config_throws("res_agent_bad_ratio.yaml", "training:\n  train_ratio: 1.0\n")) {
    return fail("test_config_parsing_edge_cases", "train_ratio of 1 should throw");
  }
  if (!config_throws("res_agent_oversize.yaml", "reservoir:\n  state_dim: 4000\ntraining:\n  classes: 64\n")) {
    return fail("test_config_parsing_edge_cases", "readout larger than one datagram should throw");
  }
  const auto unix_socket = write_temp("res_agent_unix_redis.yaml", "redis:\n  address: unix:///var/run/redis/redis.sock\n");
  const auto unix_config = load_agent_config(unix_socket.string());
  std::filesystem::remove(unix_socket);
  if (!unix_config.redis.enabled || unix_config.redis.unix_socket != "/var/run/redis/redis.sock") {
    return fail("test_config_parsing_edge_cases", "unix socket redis address should parse");
  }

  bool missing_threw = false;
  try {
    (void)load_agent_config("/nonexistent/res_agent.yaml");
  } catch (const std::runtime_error&) {
    missing_threw = true;
  }
  if (!missing_threw) {
    return fail("test_config_parsing_edge_cases", "missing config file should throw");
  }

  return 0;
}

int test_csv_motion_source() {
  const auto path = write_temp("res_agent_motion.csv",
                               "timestamp,entrance,hall,t_sin,t_cos\n"
                               "1700000000,10.5,20\n"
                               "\n"
                               "1700000000123,1,2,0.1,0.2\n"
                               "1700000001,oops,2\n");

  CsvMotionSource looping(CsvMotionOptions{path.string(), true});
  if (looping.region_count() != 2 || looping.region_names()[1] != "hall") {
    std::filesystem::remove(path);
    return fail("test_csv_motion_source", "time features and timestamp must not count as regions");
  }

  const auto first = looping.next_batch();
  if (!first.has_value() || first->size() != 2 || (*first)[0].magnitude != 10.5 ||
      (*first)[0].timestamp_ms != 1700000000000ULL || (*first)[1].region_id != 1 || (*first)[0].frame_index != 0) {
    std::filesystem::remove(path);
    return fail("test_csv_motion_source", "first row should parse with second timestamps scaled to ms");
  }

  const auto second = looping.next_batch();
  if (!second.has_value() || (*second)[0].timestamp_ms != 1700000000123ULL || (*second)[1].magnitude != 2.0) {
    std::filesystem::remove(path);
    return fail("test_csv_motion_source", "millisecond timestamps should pass through and blank lines be skipped");
  }

  if (looping.next_batch().has_value()) {
    std::filesystem::remove(path);
    return fail("test_csv_motion_source", "malformed row should be a missed batch");
  }

  const auto wrapped = looping.next_batch();
  if (!wrapped.has_value() || (*wrapped)[0].magnitude != 10.5 || (*wrapped)[0].frame_index != 3) {
    std::filesystem::remove(path);
    return fail("test_csv_motion_source", "looping source should restart after the last row");
  }

  CsvMotionSource once(CsvMotionOptions{path.string(), false});
  int batches = 0;
  for (int i = 0; i < 6; ++i) {
    if (once.next_batch().has_value()) {
      ++batches;
    }
  }
  std::filesystem::remove(path);
  if (batches != 2) {
    return fail("test_csv_motion_source", "non-looping source should stop at end of file");
  }

  bool threw = false;
  try {
    CsvMotionSource missing(CsvMotionOptions{"/nonexistent/motion.csv", true});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_csv_motion_source", "missing motion file should throw");
  }

  return 0;
}

int test_redis_sink_publish_logic() {
  g_redis_mock = {};

  RedisTsOptions options;
  options.publish_health = false;
  options.key_prefix = "edge:test";

  RedisTsSink sink(options);
  telemetry_frame frame{};
  frame.link.acked = 12;
  frame.accuracy = 0.75F;

  if (!sink.publish(frame)) {
    return fail("test_redis_sink_publish_logic", "publish should succeed with mock redis");
  }
  if (g_redis_mock.command_argv_calls != 1) {
    return fail("test_redis_sink_publish_logic", "expected one TS.MADD call");
  }
  if (g_redis_mock.last_argv.empty() || g_redis_mock.last_argv.front() != "TS.MADD") {
    return fail("test_redis_sink_publish_logic", "TS.MADD command not emitted");
  }

  const auto acked = metric_value("edge:test:link:acked");
  const auto accuracy = metric_value("edge:test:readout:accuracy");
  if (!acked.has_value() || acked->find("12") != 0 || !accuracy.has_value() || accuracy->find("0.75") != 0) {
    return fail("test_redis_sink_publish_logic", "link and readout metrics missing from TS.MADD payload");
  }

  for (const auto& arg : g_redis_mock.last_argv) {
    if (arg.find("agent:heartbeat") != std::string::npos) {
      return fail("test_redis_sink_publish_logic", "health metrics should be omitted when disabled");
    }
  }

  return 0;
}

int test_redis_health_metrics_include_error_counter() {
  g_redis_mock = {};

  RedisTsOptions options;
  options.publish_health = true;
  options.key_prefix = "edge:test";
  options.enabled_metrics = {"agent:redis_errors", "actuation:servo_1"};

  RedisTsSink sink(options);
  telemetry_frame frame{};
  frame.agent.redis_errors = 3;
  frame.servo_angle[0] = -45.0F;

  if (!sink.publish(frame)) {
    return fail("test_redis_health_metrics_include_error_counter", "publish should succeed with mock redis");
  }

  const auto errors = metric_value("edge:test:agent:redis_errors");
  if (!errors.has_value() || errors->find('3') == std::string::npos) {
    return fail("test_redis_health_metrics_include_error_counter", "expected agent:redis_errors metric in TS.MADD payload");
  }
  const auto servo = metric_value("edge:test:actuation:servo1");
  if (!servo.has_value() || servo->find("-45") != 0) {
    return fail("test_redis_health_metrics_include_error_counter", "expected servo angle in TS.MADD payload");
  }
  // Command name plus two enabled metrics, three arguments each.
  if (g_redis_mock.last_argv.size() != 7U) {
    return fail("test_redis_health_metrics_include_error_counter", "only enabled metrics should be published");
  }

  return 0;
}

class SteadyMotion final : public res_agent::motion::MotionVectorSource {
 public:
  std::optional<std::vector<res_agent::model::MovementVector>> next_batch() override {
    std::vector<res_agent::model::MovementVector> batch;
    for (std::uint16_t region = 0; region < 5; ++region) {
      res_agent::model::MovementVector vector{};
      vector.region_id = region;
      vector.magnitude = 40.0 + (20.0 * region) + static_cast<double>(frame_ % 7);
      vector.frame_index = frame_;
      vector.timestamp_ms = 1700000000000ULL + (frame_ * 100ULL);
      batch.push_back(vector);
    }
    ++frame_;
    return batch;
  }
  void rewind() override { frame_ = 0; }

 private:
  std::uint64_t frame_{0};
};

struct AngleLog {
  std::vector<std::pair<int, double>> angles;
};

class AngleRecorder final : public res_agent::actuation::ActuatorDriver {
 public:
  explicit AngleRecorder(std::shared_ptr<AngleLog> log) : log_(std::move(log)) {}

  bool set_angle(const int servo_id, const double angle_degrees) override {
    log_->angles.emplace_back(servo_id, angle_degrees);
    return true;
  }
  bool set_relay(bool) override { return true; }
  bool set_level(int) override { return true; }
  const std::string& name() const override { return name_; }

 private:
  std::shared_ptr<AngleLog> log_;
  std::string name_{"recorder"};
};

AgentConfig chain_config(const std::string& self) {
  AgentConfig config{};
  config.node_name = self;
  config.tick_interval = std::chrono::milliseconds(10);
  config.topology.nodes = {{"res00", "mem:res00", NodeRole::SOURCE},
                           {"res01", "mem:res01", NodeRole::RELAY},
                           {"res02", "mem:res02", NodeRole::SINK}};
  config.topology.edges = {{"res00", "res01"}, {"res01", "res02"}};
  config.link.ack_timeout = std::chrono::milliseconds(50);
  config.link.max_attempts = 4;
  config.node.reservoir.state_dim = 16;
  config.node.reservoir.input_dim = 8;
  config.node.reservoir.connectivity = 0.3;
  config.training.classes = 5;
  config.node.classes = 5;
  config.publish_health = true;
  config.stdout_debug = false;
  return config;
}

int test_end_to_end_chain_drives_servos() {
  res_agent::link::MemoryNetwork network;

  AgentDeps source_deps{};
  source_deps.transport = network.endpoint("mem:res00");
  source_deps.motion = std::make_unique<SteadyMotion>();

  AgentDeps relay_deps{};
  relay_deps.transport = network.endpoint("mem:res01");

  auto angles = std::make_shared<AngleLog>();
  auto clock = std::make_shared<AngleLog>();
  AgentDeps sink_deps{};
  sink_deps.transport = network.endpoint("mem:res02");
  sink_deps.cube_driver = std::make_unique<AngleRecorder>(angles);
  sink_deps.clock_driver = std::make_unique<AngleRecorder>(clock);

  auto sink_config = chain_config("res02");
  sink_config.actuation.enabled = true;
  sink_config.actuation.clock_port.clear();
  sink_config.actuation.default_speed = std::chrono::milliseconds(0);
  sink_config.actuation.gain_deg = 1.0e6;
  sink_config.actuation.offset_deg = -5.0e5;
  sink_config.actuation.servos[3].min_angle = -120.0;
  sink_config.actuation.servos[3].max_angle = 120.0;

  Agent source(chain_config("res00"), std::move(source_deps));
  Agent relay(chain_config("res01"), std::move(relay_deps));
  Agent sink(std::move(sink_config), std::move(sink_deps));

  if (!source.route().downstream.has_value() || source.route().downstream->address != "mem:res01" ||
      sink.route().downstream.has_value() || sink.route().upstream.size() != 1U) {
    return fail("test_end_to_end_chain_drives_servos", "chain route resolution mismatch");
  }

  for (int round = 0; round < 60; ++round) {
    (void)source.run_for_ticks(1);
    (void)relay.run_for_ticks(1);
    (void)sink.run_for_ticks(1);
  }
  for (int round = 0; round < 20; ++round) {
    (void)relay.run_for_ticks(1);
    (void)sink.run_for_ticks(1);
  }

  const auto source_link = source.link_stats();
  if (source_link.sent == 0 || source_link.acked == 0) {
    return fail("test_end_to_end_chain_drives_servos", "source should send STATE messages and see acks");
  }
  if (!relay.node().has_state() || !sink.node().has_state()) {
    return fail("test_end_to_end_chain_drives_servos", "state should propagate through every hop");
  }
  if (sink.link_stats().decode_errors != 0 || sink.link_stats().gap_skips != 0) {
    return fail("test_end_to_end_chain_drives_servos", "lossless fabric should not report gaps");
  }

  if (angles->angles.size() < 5U || sink.actuation() == nullptr || sink.actuation()->stats().failures != 0) {
    return fail("test_end_to_end_chain_drives_servos", "sink should drive the cube servos");
  }
  for (const auto& [servo_id, angle] : angles->angles) {
    const double limit = servo_id == 4 ? 120.0 : 150.0;
    if (servo_id < 1 || servo_id > 5 || std::fabs(angle) > limit) {
      return fail("test_end_to_end_chain_drives_servos", "servo angle escaped its configured range");
    }
  }
  if (clock->angles.size() != 1U) {
    return fail("test_end_to_end_chain_drives_servos", "clock servo should move once within one hour sector");
  }

  const auto& frame = sink.frame();
  if (frame.state_sequence == 0 || frame.state_norm <= 0.0F || frame.agent.heartbeat_ms == 0) {
    return fail("test_end_to_end_chain_drives_servos", "telemetry frame should reflect the sink state");
  }

  source.stop();
  relay.stop();
  sink.stop();

  if (source.link_stats().queue_depth != 0 || source.node().state() != res_agent::model::node_state::SHUT_DOWN) {
    return fail("test_end_to_end_chain_drives_servos", "stop should drain the send queue and shut the node down");
  }

  return 0;
}

// A fixed number of identical batches, then missed ticks.
class FixedMotion final : public res_agent::motion::MotionVectorSource {
 public:
  FixedMotion(double magnitude, std::uint64_t batches) : magnitude_(magnitude), batches_(batches) {}

  std::optional<std::vector<res_agent::model::MovementVector>> next_batch() override {
    if (frame_ >= batches_) {
      return std::nullopt;
    }
    std::vector<res_agent::model::MovementVector> batch;
    for (std::uint16_t region = 0; region < 5; ++region) {
      res_agent::model::MovementVector vector{};
      vector.region_id = region;
      vector.magnitude = region % 2 == 0 ? magnitude_ : -magnitude_;
      vector.frame_index = frame_;
      vector.timestamp_ms = 1700000000000ULL + (frame_ * 100ULL);
      batch.push_back(vector);
    }
    ++frame_;
    return batch;
  }
  void rewind() override { frame_ = 0; }

 private:
  double magnitude_;
  std::uint64_t batches_;
  std::uint64_t frame_{0};
};

struct ChainRun {
  std::vector<std::pair<int, double>> angles;
  std::vector<double> sink_state;
};

ChainRun run_chain(const double magnitude, const std::uint64_t batches) {
  res_agent::link::MemoryNetwork network;

  AgentDeps source_deps{};
  source_deps.transport = network.endpoint("mem:res00");
  source_deps.motion = std::make_unique<FixedMotion>(magnitude, batches);

  AgentDeps relay_deps{};
  relay_deps.transport = network.endpoint("mem:res01");

  auto angles = std::make_shared<AngleLog>();
  AgentDeps sink_deps{};
  sink_deps.transport = network.endpoint("mem:res02");
  sink_deps.cube_driver = std::make_unique<AngleRecorder>(angles);
  sink_deps.clock_driver = std::make_unique<AngleRecorder>(std::make_shared<AngleLog>());

  auto sink_config = chain_config("res02");
  sink_config.actuation.enabled = true;
  sink_config.actuation.clock_port.clear();
  sink_config.actuation.default_speed = std::chrono::milliseconds(0);
  sink_config.actuation.gain_deg = 1.0e6;
  sink_config.actuation.offset_deg = -5.0e5;

  Agent source(chain_config("res00"), std::move(source_deps));
  Agent relay(chain_config("res01"), std::move(relay_deps));
  Agent sink(std::move(sink_config), std::move(sink_deps));

  const std::size_t expected = static_cast<std::size_t>(batches) * res_agent::model::kCubeServoCount;
  for (int round = 0; round < 300 && angles->angles.size() < expected; ++round) {
    (void)source.run_for_ticks(1);
    (void)relay.run_for_ticks(1);
    (void)sink.run_for_ticks(1);
  }

  source.stop();
  relay.stop();
  sink.stop();
  return ChainRun{angles->angles, sink.node().reservoir_state().values};
}

int test_chain_clamps_out_of_range_input_like_clamped_input() {
  constexpr std::uint64_t kBatches = 12;
  // The reservoir bounds each input component at 1e12.
  const ChainRun extreme = run_chain(1.0e300, kBatches);
  const ChainRun clamped = run_chain(1.0e12, kBatches);

  const std::size_t expected = static_cast<std::size_t>(kBatches) * res_agent::model::kCubeServoCount;
  if (extreme.angles.size() != expected || clamped.angles.size() != expected) {
    return fail("test_chain_clamps_out_of_range_input_like_clamped_input", "every batch should reach the sink servos");
  }
  for (std::size_t i = 0; i < expected; ++i) {
    if (extreme.angles[i].first != clamped.angles[i].first || extreme.angles[i].second != clamped.angles[i].second) {
      return fail("test_chain_clamps_out_of_range_input_like_clamped_input", "sink commands differ between chains");
    }
    if (std::fabs(extreme.angles[i].second) > 150.0) {
      return fail("test_chain_clamps_out_of_range_input_like_clamped_input", "sink angle escaped the servo range");
    }
  }
  if (extreme.sink_state != clamped.sink_state) {
    return fail("test_chain_clamps_out_of_range_input_like_clamped_input", "sink states differ between chains");
  }
  for (const double value : extreme.sink_state) {
    if (!(value >= -1.0 && value <= 1.0)) {
      return fail("test_chain_clamps_out_of_range_input_like_clamped_input", "sink state left [-1, 1]");
    }
  }
  return 0;
}

int test_unknown_self_is_rejected() {
  res_agent::link::MemoryNetwork network;
  AgentDeps deps{};
  deps.transport = network.endpoint("mem:ghost");

  bool threw = false;
  try {
    Agent ghost(chain_config("ghost"), std::move(deps));
  } catch (const res_agent::topology::UnknownPeer& ex) {
    threw = ex.peer() == "ghost";
  }
  if (!threw) {
    return fail("test_unknown_self_is_rejected", "node missing from topology should raise UnknownPeer");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_sampler_should_sample_every(); rc != 0) return rc;
  if (int rc = test_config_parses_topology_and_actuation(); rc != 0) return rc;
  if (int rc = test_config_parsing_edge_cases(); rc != 0) return rc;
  if (int rc = test_csv_motion_source(); rc != 0) return rc;
  if (int rc = test_redis_sink_publish_logic(); rc != 0) return rc;
  if (int rc = test_redis_health_metrics_include_error_counter(); rc != 0) return rc;
  if (int rc = test_end_to_end_chain_drives_servos(); rc != 0) return rc;
  if (int rc = test_chain_clamps_out_of_range_input_like_clamped_input(); rc != 0) return rc;
  if (int rc = test_unknown_self_is_rejected(); rc != 0) return rc;

  std::cout << "[PASS] agent unit tests\n";
  return 0;
}
