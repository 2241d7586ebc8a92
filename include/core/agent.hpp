#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "actuation/actuation_mapper.hpp"
#include "actuation/actuator_driver.hpp"
#include "core/config.hpp"
#include "core/sampler.hpp"
#include "link/reliable_link.hpp"
#include "link/transport.hpp"
#include "model/model_holder.hpp"
#include "model/telemetry_frame.hpp"
#include "motion/motion_source.hpp"
#include "reservoir/reservoir_node.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"
#include "topology/router.hpp"
#include "training/training_supervisor.hpp"

namespace res_agent::core {

struct AgentStats {
  std::size_t ticks_executed{0};
  std::size_t motion_batches{0};
  std::size_t missed_batches{0};
  std::size_t messages_processed{0};
  std::size_t sink_cycles{0};
};

// External collaborators of a node. Anything left null is built from the config.
struct AgentDeps {
  std::unique_ptr<link::Transport> transport{};
  std::unique_ptr<motion::MotionVectorSource> motion{};
  std::unique_ptr<actuation::ActuatorDriver> cube_driver{};
  std::unique_ptr<actuation::ActuatorDriver> clock_driver{};
  std::unique_ptr<actuation::ActuatorDriver> wavemaker_driver{};
};

// One pipeline node: link threads, optional trainer thread, and a tick loop run by the caller.
class Agent {
 public:
  // Throws UnknownPeer or std::runtime_error on a topology or startup error.
  explicit Agent(AgentConfig config, AgentDeps deps = {});
  ~Agent();

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  AgentStats run_for_ticks(std::size_t total_ticks);

  // Drains queued sends within their retry budget, disengages actuators, joins threads.
  void stop();

  [[nodiscard]] bool halted() const noexcept;
  [[nodiscard]] const topology::Route& route() const noexcept { return route_; }
  [[nodiscard]] const reservoir::ReservoirNode& node() const noexcept { return *node_; }
  [[nodiscard]] const model::telemetry_frame& frame() const noexcept { return frame_; }
  [[nodiscard]] link::LinkStats link_stats() const { return endpoint_->stats(); }
  [[nodiscard]] std::shared_ptr<const model::ReadoutModel> readout() const { return holder_->current(); }
  [[nodiscard]] const training::TrainingSupervisor* trainer() const noexcept { return trainer_.get(); }
  [[nodiscard]] const actuation::ActuationMapper* actuation() const noexcept { return mapper_.get(); }

 private:
  void resolve_dependencies(AgentDeps& deps);
  std::shared_ptr<model::ModelHolder> make_model_holder() const;
  void wire_node();
  void start_threads();

  void ingress_loop();
  void egress_loop();
  void trainer_loop();
  void wake_egress();

  void collect_motion(AgentStats& stats);
  void drain_inbox(AgentStats& stats);
  void on_state_update(const reservoir::ReservoirState& state, int label);
  void fill_frame();
  void publish_sinks(AgentStats& stats);
  void update_agent_health(float actual_period_ms, float compute_time_ms);

  AgentConfig config_;
  topology::TopologyRouter router_;
  topology::Route route_;

  std::unique_ptr<link::Transport> transport_;
  std::unique_ptr<link::LinkEndpoint> endpoint_;
  std::shared_ptr<model::ModelHolder> holder_;
  std::unique_ptr<reservoir::ReservoirNode> node_;
  std::unique_ptr<training::TrainingSupervisor> trainer_;
  std::unique_ptr<actuation::ActuationMapper> mapper_;
  std::unique_ptr<motion::MotionVectorSource> motion_;

  std::mutex inbox_mutex_;
  std::deque<model::Message> inbox_;

  std::mutex egress_mutex_;
  std::condition_variable egress_cv_;
  bool egress_wake_{false};

  std::mutex trainer_mutex_;
  std::condition_variable trainer_cv_;

  std::atomic<bool> stop_ingress_{false};
  std::atomic<bool> stop_egress_{false};
  std::atomic<bool> stop_trainer_{false};
  bool stopped_{false};

  std::thread ingress_thread_;
  std::thread egress_thread_;
  std::thread trainer_thread_;

  std::chrono::milliseconds tick_interval_{};
  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_tick_{true};
  std::optional<std::chrono::steady_clock::time_point> previous_cycle_start_{};
  Sampler sampler_{};
  model::telemetry_frame frame_{};
  bool publish_health_{true};
  bool publish_stdout_{true};

  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  bool redis_was_ok_{true};
};

}  // namespace res_agent::core
