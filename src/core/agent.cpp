#include "core/agent.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/timestamp.hpp"
#include "training/model_store.hpp"
#include "wire/codec.hpp"

namespace res_agent::core {
namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kIngressPoll{20};
constexpr std::chrono::milliseconds kEgressIdleWait{100};
constexpr std::chrono::milliseconds kTrainerPoll{100};

topology::Route resolve_self(const topology::TopologyRouter& router, const std::string& name) {
  if (name.empty()) {
    throw std::runtime_error("node.name is required");
  }
  return router.resolve(name);
}

std::unique_ptr<actuation::ActuatorDriver> open_serial_or_none(const actuation::SerialOptions& options) {
  try {
    return actuation::make_serial_driver(options);
  } catch (const std::runtime_error& ex) {
    std::cerr << "[agent] " << ex.what() << "; falling back to none driver\n";
    return actuation::make_none_driver(options.port);
  }
}

std::vector<std::string> enabled_redis_metrics(const AgentConfig& config) {
  std::vector<std::string> metrics;
  for (const auto& metric : sinks::RedisTsSink::known_metrics()) {
    if (metric.rfind("actuation:", 0) == 0 && !config.actuation.enabled) {
      continue;
    }
    if (metric == "readout:examples_buffered" && !config.training.enabled) {
      continue;
    }
    if (metric.rfind("agent:", 0) == 0 && !config.publish_health) {
      continue;
    }
    metrics.push_back(metric);
  }
  return metrics;
}

}  // namespace

Agent::Agent(AgentConfig config, AgentDeps deps)
    : config_(std::move(config)),
      router_(config_.topology),
      route_(resolve_self(router_, config_.node_name)),
      tick_interval_(config_.tick_interval),
      publish_health_(config_.publish_health),
      publish_stdout_(config_.stdout_debug) {
  resolve_dependencies(deps);

  endpoint_ = std::make_unique<link::LinkEndpoint>(route_.identity.name, *transport_, config_.link);
  if (route_.downstream.has_value()) {
    endpoint_->connect_downstream(route_.downstream->name, route_.downstream->address);
  }

  holder_ = make_model_holder();
  if (config_.training.enabled) {
    trainer_ = std::make_unique<training::TrainingSupervisor>(config_.training, config_.node.reservoir.state_dim,
                                                              holder_);
  }
  if (config_.actuation.enabled) {
    mapper_ = std::make_unique<actuation::ActuationMapper>(config_.actuation, std::move(deps.cube_driver),
                                                           std::move(deps.clock_driver),
                                                           std::move(deps.wavemaker_driver));
  }
  wire_node();

  std::cerr << "[agent] node " << route_.identity.name << " (" << model::to_string(route_.identity.role)
            << ") listening on " << route_.identity.listen_address;
  if (route_.downstream.has_value()) {
    std::cerr << "; downstream " << route_.downstream->name << " at " << route_.downstream->address;
  } else {
    std::cerr << "; terminal";
  }
  std::cerr << "; upstreams=" << route_.upstream.size() << (router_.is_ring(route_.identity.name) ? " (ring)" : "")
            << '\n';

  if (config_.redis.enabled) {
    sinks::RedisTsOptions options{};
    options.host = config_.redis.host;
    options.port = config_.redis.port;
    options.unix_socket = config_.redis.unix_socket;
    options.key_prefix = config_.redis.key_prefix + ":" + route_.identity.name;
    options.publish_health = config_.publish_health;
    options.enabled_metrics = enabled_redis_metrics(config_);
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(options);

    if (redis_sink_->check_connectivity()) {
      if (!options.unix_socket.empty()) {
        std::cerr << "[agent] redis connectivity confirmed at unix://" << options.unix_socket << '\n';
      } else {
        std::cerr << "[agent] redis connectivity confirmed at " << options.host << ':' << options.port << '\n';
      }
    } else {
      if (!options.unix_socket.empty()) {
        std::cerr << "[agent] redis connectivity check failed at unix://" << options.unix_socket << '\n';
      } else {
        std::cerr << "[agent] redis connectivity check failed at " << options.host << ':' << options.port << '\n';
      }
    }
  }

  if (mapper_ != nullptr && !mapper_->engage()) {
    std::cerr << "[agent] relay engage failed; continuing\n";
  }

  node_->start(Clock::now());
  start_threads();
}

Agent::~Agent() { stop(); }

void Agent::resolve_dependencies(AgentDeps& deps) {
  transport_ = deps.transport != nullptr ? std::move(deps.transport)
                                         : link::make_udp_transport(route_.identity.listen_address);

  motion_ = std::move(deps.motion);
  const auto role = route_.identity.role;
  const bool reads_motion = role == model::NodeRole::SOURCE || role == model::NodeRole::BUILDER;
  if (motion_ == nullptr && reads_motion && !config_.motion.csv_path.empty()) {
    motion_ = std::make_unique<motion::CsvMotionSource>(
        motion::CsvMotionOptions{config_.motion.csv_path, config_.motion.loop});
  }

  if (!config_.actuation.enabled) {
    return;
  }

  actuation::SerialOptions serial{};
  serial.baud = config_.actuation.baud;
  serial.move_time = config_.actuation.default_speed;

  if (deps.cube_driver == nullptr) {
    serial.port = config_.actuation.port;
    deps.cube_driver = open_serial_or_none(serial);
  }
  if (deps.clock_driver == nullptr && !config_.actuation.clock_port.empty() &&
      config_.actuation.clock_port != config_.actuation.port) {
    serial.port = config_.actuation.clock_port;
    deps.clock_driver = open_serial_or_none(serial);
  }
  if (deps.wavemaker_driver == nullptr && config_.actuation.wavemaker.enabled) {
    serial.port = config_.actuation.wavemaker.port;
    deps.wavemaker_driver = open_serial_or_none(serial);
  }
}

std::shared_ptr<model::ModelHolder> Agent::make_model_holder() const {
  const std::size_t classes = config_.training.classes;
  const std::size_t state_dim = config_.node.reservoir.state_dim;
  const auto& path = config_.training.model_path;

  if (!path.empty() && std::filesystem::exists(path)) {
    auto loaded = training::load_model(path);
    if (loaded.outputs != classes || loaded.inputs != state_dim + 1U) {
      throw std::runtime_error("model file " + path + " does not match training.classes and reservoir.state_dim");
    }
    std::cerr << "[agent] loaded readout #" << loaded.updates_performed << " from " << path << '\n';
    return std::make_shared<model::ModelHolder>(std::move(loaded));
  }
  return std::make_shared<model::ModelHolder>(model::ReadoutModel::passthrough(classes, state_dim));
}

void Agent::wire_node() {
  node_ = std::make_unique<reservoir::ReservoirNode>(route_.identity, config_.node, holder_);

  if (auto* sender = endpoint_->sender(); sender != nullptr) {
    node_->set_emitter([this](model::Message message) {
      const auto result = endpoint_->sender()->send(std::move(message));
      wake_egress();
      return result;
    });
    sender->set_degraded_handler([this](const model::Message& /*message*/) { node_->notify_outbound_degraded(); });

    if (trainer_ != nullptr) {
      trainer_->set_publisher([this](const model::ReadoutModel& readout) {
        model::Message message{};
        message.payload_type = model::PayloadType::MODEL_UPDATE;
        message.payload = wire::encode_model_payload(readout);
        if (endpoint_->sender()->send(std::move(message)) == link::SendResult::kClosed) {
          std::cerr << "[trainer] link closed; readout #" << readout.updates_performed << " not propagated\n";
        }
        wake_egress();
      });
    }
  }

  endpoint_->receiver().set_gap_handler(
      [this](const std::string& /*source*/, std::uint32_t /*first_missing*/, std::uint32_t /*resumed_at*/) {
        node_->notify_inbound_degraded();
      });

  node_->set_observer([this](const reservoir::ReservoirState& state, const int label) { on_state_update(state, label); });
}

void Agent::start_threads() {
  ingress_thread_ = std::thread([this] { ingress_loop(); });
  if (endpoint_->sender() != nullptr) {
    egress_thread_ = std::thread([this] { egress_loop(); });
  }
  if (trainer_ != nullptr) {
    trainer_thread_ = std::thread([this] { trainer_loop(); });
  }
}

AgentStats Agent::run_for_ticks(const std::size_t total_ticks) {
  AgentStats stats{};

  if (first_tick_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
  }

  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    if (stopped_ || halted()) {
      break;
    }
    const auto cycle_start = std::chrono::steady_clock::now();

    collect_motion(stats);
    drain_inbox(stats);
    node_->tick(cycle_start);
    fill_frame();
    publish_sinks(stats);

    const auto cycle_end = std::chrono::steady_clock::now();
    const auto actual_period_ms = previous_cycle_start_.has_value()
                                      ? std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(cycle_start - *previous_cycle_start_).count()
                                      : 0.0F;
    const auto compute_ms = std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(cycle_end - cycle_start).count();
    update_agent_health(actual_period_ms, compute_ms);
    previous_cycle_start_ = cycle_start;

    ++stats.ticks_executed;
    sampler_.advance();

    next_wakeup_ += tick_interval_;
    std::this_thread::sleep_until(next_wakeup_);
  }

  return stats;
}

void Agent::stop() {
  if (stopped_) {
    return;
  }
  stopped_ = true;

  if (trainer_thread_.joinable()) {
    {
      std::lock_guard<std::mutex> lock(trainer_mutex_);
      stop_trainer_.store(true);
    }
    trainer_cv_.notify_all();
    trainer_thread_.join();
  }

  if (auto* sender = endpoint_->sender(); sender != nullptr) {
    sender->close();
  }
  if (egress_thread_.joinable()) {
    {
      std::lock_guard<std::mutex> lock(egress_mutex_);
      stop_egress_.store(true);
      egress_wake_ = true;
    }
    egress_cv_.notify_all();
    egress_thread_.join();
  }

  stop_ingress_.store(true);
  if (ingress_thread_.joinable()) {
    ingress_thread_.join();
  }

  if (mapper_ != nullptr && !mapper_->disengage()) {
    std::cerr << "[agent] actuator disengage failed\n";
  }
  node_->stop();

  const auto counters = endpoint_->stats();
  std::cerr << "[agent] stopped: sent=" << counters.sent << " acked=" << counters.acked << " exhausted=" << counters.exhausted
            << " gap_skips=" << counters.gap_skips << '\n';
}

bool Agent::halted() const noexcept { return node_->state() == model::node_state::SHUT_DOWN; }

void Agent::ingress_loop() {
  while (!stop_ingress_.load()) {
    const auto status = endpoint_->poll_transport(kIngressPoll, Clock::now());
    if (status.has_value()) {
      if (*status != wire::DecodeStatus::kOk) {
        node_->notify_inbound_degraded();
      }
      wake_egress();
    }

    auto released = endpoint_->receiver().release(Clock::now());
    if (!released.empty()) {
      std::lock_guard<std::mutex> lock(inbox_mutex_);
      for (auto& message : released) {
        inbox_.push_back(std::move(message));
      }
    }
  }
}

void Agent::egress_loop() {
  auto* sender = endpoint_->sender();
  std::unique_lock<std::mutex> lock(egress_mutex_);
  while (true) {
    lock.unlock();
    sender->poll(Clock::now());
    const bool drained = stop_egress_.load() && sender->idle();
    const auto deadline = sender->next_deadline();
    lock.lock();
    if (drained) {
      break;
    }

    auto wake_at = Clock::now() + kEgressIdleWait;
    if (deadline.has_value() && *deadline < wake_at) {
      wake_at = *deadline;
    }
    egress_cv_.wait_until(lock, wake_at, [this] { return egress_wake_; });
    egress_wake_ = false;
  }
}

void Agent::trainer_loop() {
  std::unique_lock<std::mutex> lock(trainer_mutex_);
  while (!stop_trainer_.load()) {
    trainer_cv_.wait_for(lock, kTrainerPoll, [this] { return stop_trainer_.load(); });
    if (stop_trainer_.load()) {
      break;
    }
    lock.unlock();
    trainer_->maybe_train(Clock::now());
    lock.lock();
  }
}

void Agent::wake_egress() {
  {
    std::lock_guard<std::mutex> lock(egress_mutex_);
    egress_wake_ = true;
  }
  egress_cv_.notify_one();
}

void Agent::collect_motion(AgentStats& stats) {
  if (motion_ == nullptr || !sampler_.should_sample_every(config_.motion.every_ticks)) {
    return;
  }

  auto batch = motion_->next_batch();
  if (!batch.has_value()) {
    ++stats.missed_batches;
    return;
  }
  ++stats.motion_batches;
  node_->ingest(*batch, Clock::now());
}

void Agent::drain_inbox(AgentStats& stats) {
  std::deque<model::Message> pending;
  {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    pending.swap(inbox_);
  }
  for (const auto& message : pending) {
    node_->on_message(message, Clock::now());
    ++stats.messages_processed;
  }
}

void Agent::on_state_update(const reservoir::ReservoirState& state, const int label) {
  if (trainer_ != nullptr && label >= 0) {
    trainer_->record(state.values, label);
  }
  if (mapper_ != nullptr) {
    const auto readout = holder_->current();
    mapper_->apply(readout->predict(state.values), Clock::now(), std::chrono::system_clock::now());
  }
}

void Agent::fill_frame() {
  frame_.timestamp = unix_timestamp_now_ns() / 1'000'000ULL;

  const auto& state = node_->reservoir_state();
  double sum = 0.0;
  double squares = 0.0;
  for (const double value : state.values) {
    sum += value;
    squares += value * value;
  }
  frame_.state_norm = static_cast<float>(std::sqrt(squares));
  frame_.state_mean = state.values.empty() ? 0.0F : static_cast<float>(sum / static_cast<double>(state.values.size()));
  frame_.state_sequence = state.last_updated;
  frame_.degraded_reemits = static_cast<std::uint32_t>(node_->stats().degraded_reemits);
  frame_.state = node_->state();

  const auto counters = endpoint_->stats();
  frame_.link.sent = counters.sent;
  frame_.link.retransmits = counters.retransmits;
  frame_.link.acked = counters.acked;
  frame_.link.exhausted = counters.exhausted;
  frame_.link.duplicates = counters.duplicates;
  frame_.link.gap_skips = counters.gap_skips;
  frame_.link.decode_errors = counters.decode_errors;
  frame_.link.queue_depth = counters.queue_depth;

  const auto readout = holder_->current();
  frame_.accuracy = static_cast<float>(readout->metrics.accuracy);
  frame_.precision = static_cast<float>(readout->metrics.precision);
  frame_.recall = static_cast<float>(readout->metrics.recall);
  frame_.f1 = static_cast<float>(readout->metrics.f1);
  frame_.train_size = readout->metrics.train_size;
  frame_.test_size = readout->metrics.test_size;
  frame_.updates_performed = readout->updates_performed;
  frame_.examples_buffered = trainer_ != nullptr ? static_cast<std::uint32_t>(trainer_->buffer().size()) : 0U;

  if (mapper_ != nullptr) {
    const auto& angles = mapper_->last_angles();
    for (std::size_t i = 0; i < model::kCubeServoCount; ++i) {
      frame_.servo_angle[i] = static_cast<float>(angles[i]);
    }
    frame_.clock_angle = static_cast<float>(mapper_->last_clock_angle().value_or(0.0));
    frame_.wave_level = mapper_->last_level();
    frame_.actuator_failures = static_cast<std::uint32_t>(mapper_->stats().failures);
  }
}

void Agent::publish_sinks(AgentStats& stats) {
  ++stats.sink_cycles;
  frame_.agent.redis_errors = 0;

  if (publish_stdout_) {
    stdout_sink_.publish(frame_);
  }

  if (redis_sink_ != nullptr) {
    const bool ok = redis_sink_->publish(frame_);
    if (!ok) {
      ++frame_.agent.redis_errors;
      if (redis_was_ok_) {
        std::cerr << "[redis] publish failed\n";
        redis_was_ok_ = false;
      }
    } else if (!redis_was_ok_) {
      std::cerr << "[redis] publish recovered\n";
      redis_was_ok_ = true;
    }
  }
}

void Agent::update_agent_health(const float actual_period_ms, const float compute_time_ms) {
  if (!publish_health_) {
    return;
  }

  const auto tick_ms = std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(tick_interval_).count();

  frame_.agent.loop_jitter_ms = std::fabs(actual_period_ms - tick_ms);
  frame_.agent.compute_time_ms = compute_time_ms;
  frame_.agent.heartbeat_ms = unix_timestamp_now_ns() / 1'000'000ULL;
  if (compute_time_ms > tick_ms) {
    ++frame_.agent.missed_cycles;
  }
}

}  // namespace res_agent::core
