#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "link/reliable_link.hpp"
#include "model/message.hpp"
#include "model/model_holder.hpp"
#include "model/movement.hpp"
#include "model/telemetry_frame.hpp"
#include "reservoir/reservoir.hpp"

namespace res_agent::reservoir {

using Clock = std::chrono::steady_clock;

enum class DegradedPolicy : std::uint8_t {
  kSkip = 0,
  kHalt,
};

struct ReservoirState {
  std::string node_id;
  std::vector<double> values;
  std::uint32_t last_updated{0};
};

struct NodeOptions {
  ReservoirConfig reservoir{};
  DegradedPolicy on_degraded{DegradedPolicy::kSkip};
  // 0 disables the silence check.
  std::chrono::milliseconds input_timeout{0};
  std::size_t classes{2};
  double activity_min{20.0};
  double activity_max{127.0};
};

struct NodeStats {
  std::uint64_t updates{0};
  std::uint64_t emitted{0};
  std::uint64_t degraded_reemits{0};
  std::uint64_t rejected{0};
  std::uint64_t model_swaps{0};
};

// IDLE -> AWAITING_INPUT -> UPDATING -> FORWARDING -> AWAITING_INPUT ... -> SHUT_DOWN.
// Driven from a single thread; only the notify_* calls may come from link threads.
class ReservoirNode {
 public:
  using Emitter = std::function<link::SendResult(model::Message)>;
  using UpdateObserver = std::function<void(const ReservoirState&, int label)>;

  ReservoirNode(model::NodeIdentity identity, NodeOptions options, std::shared_ptr<model::ModelHolder> model);

  // No emitter makes this a terminal node.
  void set_emitter(Emitter emitter);
  void set_observer(UpdateObserver observer);

  void start(Clock::time_point now);
  void stop();

  // Local motion batch. Builders forward it as VECTOR; everyone else folds it into the state.
  bool ingest(const std::vector<model::MovementVector>& batch, Clock::time_point now);

  // Returns true when the message changed the state or the readout.
  bool on_message(const model::Message& message, Clock::time_point now);

  void notify_inbound_degraded() noexcept;
  void notify_outbound_degraded() noexcept;

  // Applies pending degradation: re-emits the held state or halts, per policy.
  void tick(Clock::time_point now);

  [[nodiscard]] model::node_state state() const noexcept { return state_; }
  [[nodiscard]] const ReservoirState& reservoir_state() const noexcept { return reservoir_state_; }
  [[nodiscard]] bool has_state() const noexcept { return has_state_; }
  [[nodiscard]] int last_label() const noexcept { return last_label_; }
  [[nodiscard]] const NodeStats& stats() const noexcept { return stats_; }
  [[nodiscard]] const Reservoir& reservoir() const noexcept { return reservoir_; }
  [[nodiscard]] const model::NodeIdentity& identity() const noexcept { return identity_; }

 private:
  void update(const std::vector<double>& input, std::uint32_t origin_sequence, int label, Clock::time_point now);
  void emit_state();
  void emit(model::PayloadType type, std::vector<std::uint8_t> payload);
  void mark_input(Clock::time_point now);
  bool apply_model_update(const model::Message& message);

  model::NodeIdentity identity_;
  NodeOptions options_;
  Reservoir reservoir_;
  std::shared_ptr<model::ModelHolder> model_;
  Emitter emitter_{};
  UpdateObserver observer_{};

  model::node_state state_{model::node_state::IDLE};
  ReservoirState reservoir_state_{};
  bool has_state_{false};
  int last_label_{-1};
  Clock::time_point last_input_at_{};
  bool silent_{false};
  std::uint32_t forwarded_update_{0};
  NodeStats stats_{};

  std::atomic<bool> inbound_degraded_{false};
  std::atomic<bool> outbound_degraded_{false};
};

const char* to_string(model::node_state state) noexcept;

}  // namespace res_agent::reservoir
