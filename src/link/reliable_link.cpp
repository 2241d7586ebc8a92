#include "link/reliable_link.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/timestamp.hpp"

namespace res_agent::link {
namespace {

std::uint64_t now_us() {
  return core::unix_timestamp_now_ns() / 1000ULL;
}

}  // namespace

const char* to_string(const SendResult result) noexcept {
  switch (result) {
    case SendResult::kQueued:
      return "queued";
    case SendResult::kQueuedWithEviction:
      return "queued with eviction";
    case SendResult::kClosed:
      return "closed";
  }
  return "unknown";
}

ReliableSender::ReliableSender(std::string local_id, std::string peer_id, std::string peer_address,
                               Transport& transport, LinkConfig config)
    : local_id_(std::move(local_id)),
      peer_id_(std::move(peer_id)),
      peer_address_(std::move(peer_address)),
      transport_(transport),
      config_(config) {
  if (local_id_.size() > wire::kMaxIdLength || peer_id_.size() > wire::kMaxIdLength) {
    throw std::length_error("node id exceeds wire limit");
  }
  if (config_.max_attempts == 0) {
    config_.max_attempts = 1;
  }
}

SendResult ReliableSender::send(model::Message message) {
  if (message.payload.size() > wire::kMaxPayloadSize) {
    throw std::length_error("payload exceeds wire limit");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return SendResult::kClosed;
  }

  message.source_id = local_id_;
  message.destination_id = peer_id_;
  if (message.created_at_us == 0) {
    message.created_at_us = now_us();
  }

  SendResult result = SendResult::kQueued;
  if (config_.send_queue_capacity > 0 && queue_.size() >= config_.send_queue_capacity) {
    // Sequence numbers are assigned on dequeue, so eviction never opens a hole at the receiver.
    std::cerr << "[link] send queue to " << peer_id_ << " full; evicting oldest "
              << model::to_string(queue_.front().message.payload_type) << '\n';
    queue_.pop_front();
    result = SendResult::kQueuedWithEviction;
  }

  queue_.push_back(Outgoing{std::move(message), {}});
  stats_.queue_depth = static_cast<std::uint32_t>(queue_.size());
  return result;
}

void ReliableSender::on_ack(const model::Message& ack, Clock::time_point /*now*/) {
  wire::AckKind kind = wire::AckKind::ACK;
  if (!wire::decode_ack_payload(ack.payload, kind)) {
    std::cerr << "[link] malformed ack from " << ack.source_id << '\n';
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const std::uint32_t sequence = ack.sequence_number;

  if (kind == wire::AckKind::RETRANSMIT_REQUEST) {
    if (std::find(retransmit_requests_.begin(), retransmit_requests_.end(), sequence) == retransmit_requests_.end()) {
      retransmit_requests_.push_back(sequence);
    }
    return;
  }

  if (in_flight_.has_value() && in_flight_->message.sequence_number == sequence) {
    ++stats_.acked;
    in_flight_.reset();
    return;
  }

  const auto it = std::find_if(history_.begin(), history_.end(), [sequence](const Outgoing& outgoing) {
    return outgoing.message.sequence_number == sequence;
  });
  if (it != history_.end()) {
    ++stats_.acked;
    history_.erase(it);
  }
}

void ReliableSender::poll(const Clock::time_point now) {
  std::vector<model::Message> degraded;
  DegradedHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const std::uint32_t sequence : retransmit_requests_) {
      if (in_flight_.has_value() && in_flight_->message.sequence_number == sequence) {
        transmit(in_flight_->encoded);
        ++stats_.retransmits;
        continue;
      }
      const auto it = std::find_if(history_.begin(), history_.end(), [sequence](const Outgoing& outgoing) {
        return outgoing.message.sequence_number == sequence;
      });
      if (it != history_.end()) {
        transmit(it->encoded);
        ++stats_.retransmits;
        history_.erase(it);
      }
    }
    retransmit_requests_.clear();

    while (true) {
      if (!in_flight_.has_value()) {
        if (queue_.empty()) {
          break;
        }

        Outgoing next = std::move(queue_.front());
        queue_.pop_front();
        next.message.sequence_number = next_sequence_++;
        next.encoded = wire::encode(next.message);

        InFlight flight{};
        flight.message = std::move(next.message);
        flight.encoded = std::move(next.encoded);
        flight.attempts = 1;
        flight.timeout = config_.ack_timeout;
        flight.deadline = now + flight.timeout;
        in_flight_ = std::move(flight);
        transmit(in_flight_->encoded);
        ++stats_.sent;
        break;
      }

      if (now < in_flight_->deadline) {
        break;
      }

      if (in_flight_->attempts >= config_.max_attempts) {
        ++stats_.exhausted;
        degraded.push_back(in_flight_->message);
        remember(Outgoing{std::move(in_flight_->message), std::move(in_flight_->encoded)});
        in_flight_.reset();
        continue;
      }

      ++in_flight_->attempts;
      const auto scaled = std::llround(static_cast<double>(in_flight_->timeout.count()) * config_.backoff_factor);
      in_flight_->timeout = std::chrono::milliseconds(std::max<long long>(scaled, 1));
      in_flight_->deadline = now + in_flight_->timeout;
      transmit(in_flight_->encoded);
      ++stats_.retransmits;
      break;
    }

    stats_.queue_depth = static_cast<std::uint32_t>(queue_.size());
    handler = degraded_handler_;
  }

  for (const auto& message : degraded) {
    std::cerr << "[link] degraded: " << model::to_string(message.payload_type) << " seq=" << message.sequence_number
              << " to " << peer_id_ << " unacknowledged after " << config_.max_attempts << " attempts\n";
    if (handler) {
      handler(message);
    }
  }
}

void ReliableSender::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
}

bool ReliableSender::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

bool ReliableSender::idle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.empty() && !in_flight_.has_value() && retransmit_requests_.empty();
}

std::optional<Clock::time_point> ReliableSender::next_deadline() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!in_flight_.has_value()) {
    return std::nullopt;
  }
  return in_flight_->deadline;
}

LinkStats ReliableSender::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

std::uint32_t ReliableSender::next_sequence() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_sequence_;
}

void ReliableSender::set_degraded_handler(DegradedHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  degraded_handler_ = std::move(handler);
}

void ReliableSender::transmit(const std::vector<std::uint8_t>& encoded) {
  if (!transport_.send_to(peer_address_, encoded)) {
    // The retry timer covers local send failures the same way as losses on the wire.
    std::cerr << "[link] transport send to " << peer_address_ << " failed\n";
  }
}

void ReliableSender::remember(Outgoing outgoing) {
  if (config_.retransmit_history == 0) {
    return;
  }
  history_.push_back(std::move(outgoing));
  while (history_.size() > config_.retransmit_history) {
    history_.pop_front();
  }
}

ReliableReceiver::ReliableReceiver(std::string local_id, Transport& transport, LinkConfig config)
    : local_id_(std::move(local_id)), transport_(transport), config_(config) {}

void ReliableReceiver::on_message(const model::Message& message, const std::string& reply_address,
                                  const Clock::time_point now) {
  if (message.payload_type == model::PayloadType::ACK) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto& stream = streams_[message.source_id];
  stream.reply_address = reply_address;
  const std::uint32_t sequence = message.sequence_number;

  // Every arrival is acknowledged, duplicates included.
  reply(reply_address, message.source_id, sequence, wire::AckKind::ACK);

  // A sequence already passed but stamped after everything accepted so far comes from a restarted sender.
  // Retransmissions reuse the original stamp, so late duplicates never qualify.
  if (sequence < stream.next_expected && message.created_at_us > stream.newest_created_at_us) {
    std::cerr << "[link] " << message.source_id << " restarted its sequence at " << sequence << " (expected "
              << stream.next_expected << ")\n";
    stream = Stream{};
    stream.reply_address = reply_address;
  }

  if (is_duplicate(stream, sequence)) {
    ++stats_.duplicates;
    return;
  }

  stream.newest_created_at_us = std::max(stream.newest_created_at_us, message.created_at_us);
  stream.pending.emplace(sequence, message);
  if (sequence != stream.next_expected) {
    if (!stream.hole_since.has_value()) {
      stream.hole_since = now;
    }
    if (!stream.retransmit_requested) {
      reply(reply_address, message.source_id, stream.next_expected, wire::AckKind::RETRANSMIT_REQUEST);
      stream.retransmit_requested = true;
    }
  }
}

std::vector<model::Message> ReliableReceiver::release(const Clock::time_point now) {
  std::vector<model::Message> released;
  std::vector<GapEvent> gaps;
  GapHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [source_id, stream] : streams_) {
      while (!stream.pending.empty()) {
        auto head = stream.pending.begin();
        if (head->first == stream.next_expected) {
          remember(stream, head->first);
          released.push_back(std::move(head->second));
          stream.pending.erase(head);
          ++stream.next_expected;
          stream.hole_since.reset();
          stream.retransmit_requested = false;
          continue;
        }

        if (!stream.hole_since.has_value()) {
          stream.hole_since = now;
        }
        if (!stream.retransmit_requested && !stream.reply_address.empty()) {
          reply(stream.reply_address, source_id, stream.next_expected, wire::AckKind::RETRANSMIT_REQUEST);
          stream.retransmit_requested = true;
        }
        if ((now - *stream.hole_since) < config_.reorder_timeout) {
          break;
        }

        gaps.push_back(GapEvent{source_id, stream.next_expected, head->first});
        ++stats_.gap_skips;
        stream.next_expected = head->first;
        stream.hole_since.reset();
        stream.retransmit_requested = false;
      }

      if (stream.pending.empty()) {
        stream.hole_since.reset();
        stream.retransmit_requested = false;
      }
    }
    handler = gap_handler_;
  }

  for (const auto& gap : gaps) {
    std::cerr << "[link] gap from " << gap.source_id << ": seq " << gap.first_missing << ".." << (gap.resumed_at - 1)
              << " treated as lost\n";
    if (handler) {
      handler(gap.source_id, gap.first_missing, gap.resumed_at);
    }
  }
  return released;
}

LinkStats ReliableReceiver::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

std::size_t ReliableReceiver::buffered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto& [_, stream] : streams_) {
    total += stream.pending.size();
  }
  return total;
}

void ReliableReceiver::set_gap_handler(GapHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  gap_handler_ = std::move(handler);
}

void ReliableReceiver::reply(const std::string& address, const std::string& destination, const std::uint32_t sequence,
                             const wire::AckKind kind) {
  model::Message ack{};
  ack.source_id = local_id_;
  ack.destination_id = destination;
  ack.sequence_number = sequence;
  ack.payload_type = model::PayloadType::ACK;
  ack.payload = wire::encode_ack_payload(kind);
  ack.created_at_us = now_us();
  if (!transport_.send_to(address, wire::encode(ack))) {
    std::cerr << "[link] ack to " << address << " failed\n";
  }
}

void ReliableReceiver::remember(Stream& stream, const std::uint32_t sequence) {
  if (config_.dedup_window == 0) {
    return;
  }
  stream.recent.push_back(sequence);
  stream.recent_set.insert(sequence);
  while (stream.recent.size() > config_.dedup_window) {
    stream.recent_set.erase(stream.recent.front());
    stream.recent.pop_front();
  }
}

bool ReliableReceiver::is_duplicate(const Stream& stream, const std::uint32_t sequence) const {
  return sequence < stream.next_expected || stream.recent_set.count(sequence) != 0U ||
         stream.pending.count(sequence) != 0U;
}

LinkEndpoint::LinkEndpoint(std::string local_id, Transport& transport, LinkConfig config)
    : local_id_(std::move(local_id)), transport_(transport), config_(config), receiver_(local_id_, transport, config) {}

void LinkEndpoint::connect_downstream(const std::string& peer_id, const std::string& peer_address) {
  sender_ = std::make_unique<ReliableSender>(local_id_, peer_id, peer_address, transport_, config_);
}

std::optional<wire::DecodeStatus> LinkEndpoint::poll_transport(const std::chrono::milliseconds timeout,
                                                               const Clock::time_point now) {
  auto datagram = transport_.receive(timeout);
  if (!datagram.has_value()) {
    return std::nullopt;
  }
  return dispatch(*datagram, now);
}

wire::DecodeStatus LinkEndpoint::dispatch(const Datagram& datagram, const Clock::time_point now) {
  model::Message message{};
  const auto status = wire::decode(datagram.bytes, message);
  if (status != wire::DecodeStatus::kOk) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++decode_errors_;
    }
    std::cerr << "[link] dropped datagram from " << datagram.from << ": " << wire::to_string(status) << '\n';
    return status;
  }

  if (!message.destination_id.empty() && message.destination_id != local_id_) {
    std::cerr << "[link] ignoring " << model::to_string(message.payload_type) << " addressed to "
              << message.destination_id << '\n';
    return status;
  }

  if (message.payload_type == model::PayloadType::ACK) {
    if (sender_ != nullptr && message.source_id == sender_->peer_id()) {
      sender_->on_ack(message, now);
    }
    return status;
  }

  receiver_.on_message(message, datagram.from, now);
  return status;
}

LinkStats LinkEndpoint::stats() const {
  LinkStats merged = receiver_.stats();
  if (sender_ != nullptr) {
    const auto outbound = sender_->stats();
    merged.sent = outbound.sent;
    merged.retransmits = outbound.retransmits;
    merged.acked = outbound.acked;
    merged.exhausted = outbound.exhausted;
    merged.queue_depth = outbound.queue_depth;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  merged.decode_errors = decode_errors_;
  return merged;
}

}  // namespace res_agent::link
