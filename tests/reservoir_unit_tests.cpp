#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <vector>

#include "link/reliable_link.hpp"
#include "model/message.hpp"
#include "model/model_holder.hpp"
#include "model/movement.hpp"
#include "model/readout_model.hpp"
#include "reservoir/input_encoding.hpp"
#include "reservoir/reservoir.hpp"
#include "reservoir/reservoir_node.hpp"
#include "wire/codec.hpp"

using res_agent::link::SendResult;
using res_agent::model::Message;
using res_agent::model::ModelHolder;
using res_agent::model::MovementVector;
using res_agent::model::NodeIdentity;
using res_agent::model::NodeRole;
using res_agent::model::PayloadType;
using res_agent::model::ReadoutModel;
using res_agent::model::node_state;
using res_agent::reservoir::Clock;
using res_agent::reservoir::DegradedPolicy;
using res_agent::reservoir::NodeOptions;
using res_agent::reservoir::Reservoir;
using res_agent::reservoir::ReservoirConfig;
using res_agent::reservoir::ReservoirNode;
using res_agent::reservoir::ReservoirState;

namespace {

using namespace std::chrono_literals;

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool bounded(const std::vector<double>& values) {
  for (const double value : values) {
    if (!std::isfinite(value) || value < -1.0 || value > 1.0) {
      return false;
    }
  }
  return true;
}

NodeOptions small_options() {
  NodeOptions options{};
  options.reservoir.state_dim = 8;
  options.reservoir.input_dim = 4;
  options.reservoir.connectivity = 0.5;
  options.classes = 5;
  return options;
}

std::shared_ptr<ModelHolder> holder_for(const NodeOptions& options) {
  return std::make_shared<ModelHolder>(ReadoutModel::passthrough(options.classes, options.reservoir.state_dim));
}

// Collects whatever the node hands to its link.
struct Capture {
  std::vector<Message> sent;
  std::vector<node_state> states_at_send;
};

ReservoirNode::Emitter capture_into(Capture& capture, const ReservoirNode* node) {
  return [&capture, node](Message message) {
    capture.sent.push_back(std::move(message));
    capture.states_at_send.push_back(node->state());
    return SendResult::kQueued;
  };
}

Message state_message(const std::vector<double>& values, const std::uint32_t origin, const int label) {
  res_agent::wire::StatePayload payload{};
  payload.origin_sequence = origin;
  payload.target_label = static_cast<std::int16_t>(label);
  payload.values = values;
  Message message{};
  message.source_id = "up";
  message.payload_type = PayloadType::STATE;
  message.payload = res_agent::wire::encode_state_payload(payload);
  return message;
}

Message model_message(const ReadoutModel& readout) {
  Message message{};
  message.source_id = "up";
  message.payload_type = PayloadType::MODEL_UPDATE;
  message.payload = res_agent::wire::encode_model_payload(readout);
  return message;
}

int test_state_stays_bounded_under_extreme_input() {
  ReservoirConfig config{};
  config.input_scaling = 1000.0;
  const Reservoir reservoir(config);

  std::vector<double> state(config.state_dim, 0.0);
  const std::vector<double> extreme(config.input_dim, 1.0e300);
  std::vector<double> hostile(config.input_dim, std::numeric_limits<double>::quiet_NaN());
  hostile[0] = std::numeric_limits<double>::infinity();
  hostile[1] = -std::numeric_limits<double>::infinity();

  for (int i = 0; i < 200; ++i) {
    reservoir.update(state, (i % 2) == 0 ? extreme : hostile);
    if (!bounded(state)) {
      return fail("test_state_stays_bounded_under_extreme_input", "state left [-1, 1]");
    }
  }

  reservoir.update(state, {});
  if (!bounded(state) || state.size() != config.state_dim) {
    return fail("test_state_stays_bounded_under_extreme_input", "short input should be zero padded");
  }
  return 0;
}

int test_weights_are_deterministic_per_seed() {
  ReservoirConfig config{};
  const Reservoir first(config);
  const Reservoir second(config);
  if (first.input_weights() != second.input_weights() || first.recurrent_weights() != second.recurrent_weights()) {
    return fail("test_weights_are_deterministic_per_seed", "same seed must give identical weights");
  }

  config.seed = 43;
  const Reservoir other(config);
  if (other.recurrent_weights() == first.recurrent_weights()) {
    return fail("test_weights_are_deterministic_per_seed", "different seed should give different weights");
  }

  const double radius = res_agent::reservoir::estimate_spectral_radius(first.recurrent_weights(), 50, 42);
  if (std::fabs(radius - 0.9) > 1e-6) {
    return fail("test_weights_are_deterministic_per_seed", "recurrent weights should be scaled to the target radius");
  }
  return 0;
}

int test_invalid_reservoir_config_throws() {
  ReservoirConfig zero{};
  zero.state_dim = 0;
  ReservoirConfig leak{};
  leak.leak_rate = 1.5;

  int thrown = 0;
  for (const auto& config : {zero, leak}) {
    try {
      const Reservoir reservoir(config);
    } catch (const std::invalid_argument&) {
      ++thrown;
    }
  }
  if (thrown != 2) {
    return fail("test_invalid_reservoir_config_throws", "zero dimension and leak > 1 should throw");
  }
  return 0;
}

int test_activity_classification() {
  using res_agent::reservoir::classify_activity;
  if (classify_activity(0.0, 20.0, 127.0, 5) != 0 || classify_activity(20.0, 20.0, 127.0, 5) != 0 ||
      classify_activity(127.0, 20.0, 127.0, 5) != 4 || classify_activity(1000.0, 20.0, 127.0, 5) != 4 ||
      classify_activity(73.5, 20.0, 127.0, 5) != 2) {
    return fail("test_activity_classification", "bins should clamp at both ends");
  }
  if (classify_activity(50.0, 10.0, 10.0, 5) != -1 || classify_activity(std::nan(""), 0.0, 1.0, 2) != -1 ||
      classify_activity(0.5, 0.0, 1.0, 0) != -1) {
    return fail("test_activity_classification", "degenerate inputs should give no label");
  }

  const std::vector<MovementVector> batch{MovementVector{2, 30.0}, MovementVector{0, 10.0}, MovementVector{1, 20.0}};
  const auto input = res_agent::reservoir::encode_motion_input(batch, 8, 6ULL * 3600ULL * 1000ULL);
  if (input.size() != 8 || input[0] != 10.0 || input[1] != 20.0 || input[2] != 30.0 ||
      std::fabs(input[3] - 1.0) > 1e-12 || std::fabs(input[4]) > 1e-12 || input[7] != 0.0) {
    return fail("test_activity_classification", "motion input should be region ordered with the time pair");
  }
  if (res_agent::reservoir::mean_magnitude(batch) != 20.0) {
    return fail("test_activity_classification", "mean magnitude mismatch");
  }
  return 0;
}

int test_node_state_machine_and_forwarding() {
  const auto options = small_options();
  ReservoirNode node(NodeIdentity{"relay", "a:1", "b:1", NodeRole::RELAY}, options, holder_for(options));

  Capture capture;
  node.set_emitter(capture_into(capture, &node));
  std::vector<node_state> observed;
  std::vector<int> labels;
  node.set_observer([&observed, &labels, &node](const ReservoirState& state, const int label) {
    observed.push_back(node.state());
    labels.push_back(label);
    (void)state;
  });

  const auto now = Clock::time_point{} + 1s;
  if (node.on_message(state_message({0.5, -0.5}, 7, 3), now) || node.stats().rejected != 1) {
    return fail("test_node_state_machine_and_forwarding", "idle node must reject input");
  }

  node.start(now);
  if (node.state() != node_state::AWAITING_INPUT) {
    return fail("test_node_state_machine_and_forwarding", "start should await input");
  }
  if (!node.on_message(state_message({0.5, -0.5}, 7, 3), now)) {
    return fail("test_node_state_machine_and_forwarding", "STATE should update the node");
  }
  if (node.state() != node_state::AWAITING_INPUT || observed != std::vector<node_state>{node_state::UPDATING} ||
      labels != std::vector<int>{3}) {
    return fail("test_node_state_machine_and_forwarding", "update should pass through UPDATING");
  }
  if (capture.sent.size() != 1 || capture.states_at_send.front() != node_state::FORWARDING) {
    return fail("test_node_state_machine_and_forwarding", "state should be forwarded in FORWARDING");
  }

  res_agent::wire::StatePayload forwarded{};
  if (!res_agent::wire::decode_state_payload(capture.sent.front().payload, forwarded) ||
      forwarded.origin_sequence != 7 || forwarded.target_label != 3 || forwarded.values != node.reservoir_state().values ||
      !bounded(forwarded.values)) {
    return fail("test_node_state_machine_and_forwarding", "forwarded payload should carry the new state");
  }

  node.stop();
  if (node.state() != node_state::SHUT_DOWN || node.on_message(state_message({0.1}, 8, 0), now)) {
    return fail("test_node_state_machine_and_forwarding", "stopped node must reject input");
  }
  return 0;
}

int test_source_labels_and_builder_forwards_vectors() {
  const auto options = small_options();
  const auto now = Clock::time_point{} + 1s;
  std::vector<MovementVector> busy{MovementVector{0, 127.0, 0.0, 0.0, 9, 1'700'000'000'000ULL},
                                   MovementVector{1, 127.0, 0.0, 0.0, 9, 1'700'000'000'000ULL}};

  ReservoirNode source(NodeIdentity{"src", "a:1", "b:1", NodeRole::SOURCE}, options, holder_for(options));
  Capture source_capture;
  source.set_emitter(capture_into(source_capture, &source));
  source.start(now);
  if (!source.ingest(busy, now) || source.last_label() != 4 || source.reservoir_state().last_updated != 9) {
    return fail("test_source_labels_and_builder_forwards_vectors", "source should label from activity");
  }
  if (source_capture.sent.size() != 1 || source_capture.sent[0].payload_type != PayloadType::STATE) {
    return fail("test_source_labels_and_builder_forwards_vectors", "source should forward STATE");
  }

  ReservoirNode builder(NodeIdentity{"build", "a:1", "b:1", NodeRole::BUILDER}, options, holder_for(options));
  Capture builder_capture;
  builder.set_emitter(capture_into(builder_capture, &builder));
  builder.start(now);
  if (!builder.ingest(busy, now) || builder.has_state() || builder.stats().updates != 0) {
    return fail("test_source_labels_and_builder_forwards_vectors", "builder should not update its own state");
  }
  res_agent::wire::VectorPayload payload{};
  if (builder_capture.sent.size() != 1 || builder_capture.sent[0].payload_type != PayloadType::VECTOR ||
      !res_agent::wire::decode_vector_payload(builder_capture.sent[0].payload, payload) ||
      payload.vectors != busy) {
    return fail("test_source_labels_and_builder_forwards_vectors", "builder should forward the batch as VECTOR");
  }

  ReservoirNode relay(NodeIdentity{"relay", "b:1", "c:1", NodeRole::RELAY}, options, holder_for(options));
  relay.start(now);
  if (!relay.on_message(builder_capture.sent[0], now) || relay.last_label() != 4) {
    return fail("test_source_labels_and_builder_forwards_vectors", "VECTOR should be folded in downstream");
  }
  return 0;
}

int test_degraded_input_reemits_held_state() {
  const auto options = small_options();
  ReservoirNode node(NodeIdentity{"relay", "a:1", "b:1", NodeRole::RELAY}, options, holder_for(options));
  Capture capture;
  node.set_emitter(capture_into(capture, &node));
  const auto now = Clock::time_point{} + 1s;
  node.start(now);

  node.notify_inbound_degraded();
  node.tick(now);
  if (!capture.sent.empty()) {
    return fail("test_degraded_input_reemits_held_state", "nothing to re-emit before the first update");
  }

  (void)node.on_message(state_message({0.9, 0.1}, 3, 1), now);
  const auto held = node.reservoir_state().values;

  Message broken{};
  broken.payload_type = PayloadType::STATE;
  broken.payload = {0x01, 0x02};
  if (node.on_message(broken, now)) {
    return fail("test_degraded_input_reemits_held_state", "malformed STATE should be dropped");
  }
  node.tick(now);

  res_agent::wire::StatePayload reemitted{};
  if (capture.sent.size() != 2 || !res_agent::wire::decode_state_payload(capture.sent[1].payload, reemitted) ||
      reemitted.values != held || reemitted.origin_sequence != 3 || node.stats().degraded_reemits != 1) {
    return fail("test_degraded_input_reemits_held_state", "held state should be re-emitted unchanged");
  }

  node.tick(now);
  if (capture.sent.size() != 2) {
    return fail("test_degraded_input_reemits_held_state", "degradation is consumed by one tick");
  }
  return 0;
}

int test_input_timeout_reemits_once_per_period() {
  auto options = small_options();
  options.input_timeout = 100ms;
  ReservoirNode node(NodeIdentity{"relay", "a:1", "b:1", NodeRole::RELAY}, options, holder_for(options));
  Capture capture;
  node.set_emitter(capture_into(capture, &node));
  const auto t0 = Clock::time_point{} + 1s;
  node.start(t0);
  (void)node.on_message(state_message({0.2}, 1, 0), t0);

  node.tick(t0 + 50ms);
  node.tick(t0 + 100ms);
  node.tick(t0 + 150ms);
  node.tick(t0 + 200ms);
  if (capture.sent.size() != 3 || node.stats().degraded_reemits != 2) {
    return fail("test_input_timeout_reemits_once_per_period", "silence should re-emit once per timeout");
  }
  return 0;
}

int test_outbound_degraded_policy() {
  const auto now = Clock::time_point{} + 1s;
  auto options = small_options();

  ReservoirNode skipping(NodeIdentity{"skip", "a:1", "b:1", NodeRole::RELAY}, options, holder_for(options));
  skipping.start(now);
  skipping.notify_outbound_degraded();
  skipping.tick(now);
  if (skipping.state() != node_state::AWAITING_INPUT) {
    return fail("test_outbound_degraded_policy", "skip policy keeps the node running");
  }

  options.on_degraded = DegradedPolicy::kHalt;
  ReservoirNode halting(NodeIdentity{"halt", "a:1", "b:1", NodeRole::RELAY}, options, holder_for(options));
  halting.start(now);
  halting.notify_outbound_degraded();
  halting.tick(now);
  if (halting.state() != node_state::SHUT_DOWN) {
    return fail("test_outbound_degraded_policy", "halt policy should shut the node down");
  }
  return 0;
}

int test_model_update_swap_forward_and_stale() {
  const auto options = small_options();
  auto holder = holder_for(options);
  ReservoirNode node(NodeIdentity{"relay", "a:1", "b:1", NodeRole::RELAY}, options, holder);
  Capture capture;
  node.set_emitter(capture_into(capture, &node));
  const auto now = Clock::time_point{} + 1s;
  node.start(now);

  auto next = ReadoutModel::passthrough(options.classes, options.reservoir.state_dim);
  next.weights.front() = 2.0;
  next.updates_performed = 1;
  if (!node.on_message(model_message(next), now) || !(*holder->current() == next) ||
      node.stats().model_swaps != 1) {
    return fail("test_model_update_swap_forward_and_stale", "newer readout should be applied");
  }
  if (capture.sent.size() != 1 || capture.sent[0].payload_type != PayloadType::MODEL_UPDATE ||
      capture.sent[0].payload != res_agent::wire::encode_model_payload(next)) {
    return fail("test_model_update_swap_forward_and_stale", "readout should be forwarded unchanged");
  }

  if (node.on_message(model_message(next), now) || capture.sent.size() != 1) {
    return fail("test_model_update_swap_forward_and_stale", "repeated readout must not circulate again");
  }

  auto foreign = ReadoutModel::passthrough(options.classes, 20);
  foreign.updates_performed = 2;
  if (!node.on_message(model_message(foreign), now) || holder->current()->updates_performed != 1 ||
      capture.sent.size() != 2) {
    return fail("test_model_update_swap_forward_and_stale", "foreign shape should be forwarded, not applied");
  }
  if (node.on_message(model_message(foreign), now) || capture.sent.size() != 2) {
    return fail("test_model_update_swap_forward_and_stale", "foreign shape must be forwarded once");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_state_stays_bounded_under_extreme_input(); rc != 0) return rc;
  if (int rc = test_weights_are_deterministic_per_seed(); rc != 0) return rc;
  if (int rc = test_invalid_reservoir_config_throws(); rc != 0) return rc;
  if (int rc = test_activity_classification(); rc != 0) return rc;
  if (int rc = test_node_state_machine_and_forwarding(); rc != 0) return rc;
  if (int rc = test_source_labels_and_builder_forwards_vectors(); rc != 0) return rc;
  if (int rc = test_degraded_input_reemits_held_state(); rc != 0) return rc;
  if (int rc = test_input_timeout_reemits_once_per_period(); rc != 0) return rc;
  if (int rc = test_outbound_degraded_policy(); rc != 0) return rc;
  if (int rc = test_model_update_swap_forward_and_stale(); rc != 0) return rc;

  std::cout << "[PASS] reservoir unit tests\n";
  return 0;
}
