#include "reservoir/reservoir_node.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "reservoir/input_encoding.hpp"
#include "wire/codec.hpp"

namespace res_agent::reservoir {

const char* to_string(const model::node_state state) noexcept {
  switch (state) {
    case model::node_state::IDLE:
      return "idle";
    case model::node_state::AWAITING_INPUT:
      return "awaiting_input";
    case model::node_state::UPDATING:
      return "updating";
    case model::node_state::FORWARDING:
      return "forwarding";
    case model::node_state::SHUT_DOWN:
      return "shut_down";
  }
  return "unknown";
}

ReservoirNode::ReservoirNode(model::NodeIdentity identity, NodeOptions options,
                             std::shared_ptr<model::ModelHolder> model)
    : identity_(std::move(identity)),
      options_(options),
      reservoir_(options_.reservoir),
      model_(std::move(model)) {
  reservoir_state_.node_id = identity_.name;
  reservoir_state_.values.assign(reservoir_.state_dim(), 0.0);
}

void ReservoirNode::set_emitter(Emitter emitter) { emitter_ = std::move(emitter); }

void ReservoirNode::set_observer(UpdateObserver observer) { observer_ = std::move(observer); }

void ReservoirNode::start(const Clock::time_point now) {
  if (state_ != model::node_state::IDLE) {
    return;
  }
  last_input_at_ = now;
  state_ = model::node_state::AWAITING_INPUT;
}

void ReservoirNode::stop() {
  if (state_ == model::node_state::SHUT_DOWN) {
    return;
  }
  state_ = model::node_state::SHUT_DOWN;
  std::cerr << "[node] " << identity_.name << " shut down after " << stats_.updates << " updates\n";
}

bool ReservoirNode::ingest(const std::vector<model::MovementVector>& batch, const Clock::time_point now) {
  if (state_ != model::node_state::AWAITING_INPUT) {
    ++stats_.rejected;
    return false;
  }
  if (batch.empty()) {
    return false;
  }

  const std::uint64_t frame_index = batch.front().frame_index;
  const std::uint64_t timestamp_ms = batch.front().timestamp_ms;

  if (identity_.role == model::NodeRole::BUILDER) {
    mark_input(now);
    wire::VectorPayload payload{};
    payload.frame_index = frame_index;
    payload.timestamp_ms = timestamp_ms;
    payload.vectors = batch;
    if (payload.vectors.size() > wire::kMaxVectorsPerBatch) {
      std::cerr << "[node] batch of " << batch.size() << " regions truncated to " << wire::kMaxVectorsPerBatch << '\n';
      payload.vectors.resize(wire::kMaxVectorsPerBatch);
    }
    state_ = model::node_state::FORWARDING;
    emit(model::PayloadType::VECTOR, wire::encode_vector_payload(payload));
    state_ = model::node_state::AWAITING_INPUT;
    return true;
  }

  const int label = classify_activity(mean_magnitude(batch), options_.activity_min, options_.activity_max,
                                      options_.classes);
  update(encode_motion_input(batch, reservoir_.input_dim(), timestamp_ms), static_cast<std::uint32_t>(frame_index),
         label, now);
  return true;
}

bool ReservoirNode::on_message(const model::Message& message, const Clock::time_point now) {
  if (state_ != model::node_state::AWAITING_INPUT) {
    ++stats_.rejected;
    return false;
  }

  switch (message.payload_type) {
    case model::PayloadType::VECTOR: {
      wire::VectorPayload payload{};
      if (!wire::decode_vector_payload(message.payload, payload)) {
        std::cerr << "[node] malformed VECTOR payload from " << message.source_id << " seq=" << message.sequence_number
                  << '\n';
        notify_inbound_degraded();
        return false;
      }
      if (payload.vectors.empty()) {
        return false;
      }
      return ingest(payload.vectors, now);
    }
    case model::PayloadType::STATE: {
      wire::StatePayload payload{};
      if (!wire::decode_state_payload(message.payload, payload)) {
        std::cerr << "[node] malformed STATE payload from " << message.source_id << " seq=" << message.sequence_number
                  << '\n';
        notify_inbound_degraded();
        return false;
      }
      update(encode_state_input(payload.values, reservoir_.input_dim()), payload.origin_sequence,
             payload.target_label, now);
      return true;
    }
    case model::PayloadType::MODEL_UPDATE:
      return apply_model_update(message);
    case model::PayloadType::ACK:
      break;
  }
  return false;
}

void ReservoirNode::notify_inbound_degraded() noexcept { inbound_degraded_.store(true); }

void ReservoirNode::notify_outbound_degraded() noexcept { outbound_degraded_.store(true); }

void ReservoirNode::tick(const Clock::time_point now) {
  if (state_ != model::node_state::AWAITING_INPUT) {
    return;
  }

  if (outbound_degraded_.exchange(false)) {
    if (options_.on_degraded == DegradedPolicy::kHalt) {
      std::cerr << "[node] downstream link degraded; halting " << identity_.name << '\n';
      stop();
      return;
    }
    std::cerr << "[node] downstream link degraded; skipping this hop's contribution for the cycle\n";
  }

  bool reemit = inbound_degraded_.exchange(false);
  if (!reemit && options_.input_timeout.count() > 0 && (now - last_input_at_) >= options_.input_timeout) {
    if (!silent_) {
      std::cerr << "[node] no input for " << options_.input_timeout.count() << "ms; holding last state\n";
      silent_ = true;
    }
    last_input_at_ = now;
    reemit = true;
  }

  if (!reemit || !has_state_) {
    return;
  }

  ++stats_.degraded_reemits;
  state_ = model::node_state::FORWARDING;
  emit_state();
  state_ = model::node_state::AWAITING_INPUT;
}

void ReservoirNode::update(const std::vector<double>& input, const std::uint32_t origin_sequence, const int label,
                           const Clock::time_point now) {
  mark_input(now);

  state_ = model::node_state::UPDATING;
  reservoir_.update(reservoir_state_.values, input);
  reservoir_state_.last_updated = origin_sequence;
  has_state_ = true;
  last_label_ = label;
  ++stats_.updates;

  if (observer_) {
    observer_(reservoir_state_, label);
  }

  state_ = model::node_state::FORWARDING;
  emit_state();
  state_ = model::node_state::AWAITING_INPUT;
}

void ReservoirNode::emit_state() {
  wire::StatePayload payload{};
  payload.origin_sequence = reservoir_state_.last_updated;
  payload.target_label = static_cast<std::int16_t>(last_label_);
  payload.values = reservoir_state_.values;
  emit(model::PayloadType::STATE, wire::encode_state_payload(payload));
}

void ReservoirNode::emit(const model::PayloadType type, std::vector<std::uint8_t> payload) {
  if (!emitter_) {
    return;
  }

  model::Message message{};
  message.payload_type = type;
  message.payload = std::move(payload);
  if (emitter_(std::move(message)) != link::SendResult::kClosed) {
    ++stats_.emitted;
  }
}

void ReservoirNode::mark_input(const Clock::time_point now) {
  last_input_at_ = now;
  if (silent_) {
    std::cerr << "[node] input resumed\n";
    silent_ = false;
  }
}

bool ReservoirNode::apply_model_update(const model::Message& message) {
  model::ReadoutModel next{};
  if (!wire::decode_model_payload(message.payload, next) || !next.valid()) {
    std::cerr << "[node] malformed MODEL_UPDATE from " << message.source_id << '\n';
    return false;
  }

  const auto current = model_->current();
  const std::uint32_t seen = std::max(current != nullptr ? current->updates_performed : 0U, forwarded_update_);
  if (next.updates_performed <= seen) {
    // Already handled; a ring brings every update back to its trainer.
    return false;
  }
  forwarded_update_ = next.updates_performed;

  if (static_cast<std::size_t>(next.inputs) == reservoir_.state_dim() + 1U) {
    model_->publish(next);
    ++stats_.model_swaps;
    std::cerr << "[node] readout #" << next.updates_performed << " applied (accuracy=" << next.metrics.accuracy
              << ")\n";
  } else {
    std::cerr << "[node] readout #" << next.updates_performed << " expects " << (next.inputs - 1)
              << " state components; forwarding without applying\n";
  }

  emit(model::PayloadType::MODEL_UPDATE, message.payload);
  return true;
}

}  // namespace res_agent::reservoir
