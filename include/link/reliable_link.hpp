#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "link/transport.hpp"
#include "model/message.hpp"
#include "wire/codec.hpp"

namespace res_agent::link {

using Clock = std::chrono::steady_clock;

struct LinkConfig {
  std::chrono::milliseconds ack_timeout{500};
  double backoff_factor{2.0};
  std::uint32_t max_attempts{5};
  std::chrono::milliseconds reorder_timeout{2000};
  std::size_t dedup_window{256};
  std::size_t send_queue_capacity{64};
  std::size_t retransmit_history{16};
};

struct LinkStats {
  std::uint64_t sent{0};
  std::uint64_t retransmits{0};
  std::uint64_t acked{0};
  std::uint64_t exhausted{0};
  std::uint64_t duplicates{0};
  std::uint64_t gap_skips{0};
  std::uint64_t decode_errors{0};
  std::uint32_t queue_depth{0};
};

enum class SendResult : std::uint8_t {
  kQueued = 0,
  kQueuedWithEviction,
  kClosed,
};

// Outbound half of a link: stop-and-wait, one message in flight per link.
// The queue behind the in-flight message keeps accepting sends.
class ReliableSender {
 public:
  using DegradedHandler = std::function<void(const model::Message&)>;

  ReliableSender(std::string local_id, std::string peer_id, std::string peer_address, Transport& transport,
                 LinkConfig config = {});

  ReliableSender(const ReliableSender&) = delete;
  ReliableSender& operator=(const ReliableSender&) = delete;

  // Stamps source, destination and the next sequence number of this link.
  SendResult send(model::Message message);

  void on_ack(const model::Message& ack, Clock::time_point now);
  void poll(Clock::time_point now);

  void close();
  [[nodiscard]] bool closed() const;
  [[nodiscard]] bool idle() const;
  [[nodiscard]] std::optional<Clock::time_point> next_deadline() const;
  [[nodiscard]] LinkStats stats() const;
  [[nodiscard]] std::uint32_t next_sequence() const;
  [[nodiscard]] const std::string& peer_id() const noexcept { return peer_id_; }
  [[nodiscard]] const std::string& peer_address() const noexcept { return peer_address_; }

  void set_degraded_handler(DegradedHandler handler);

 private:
  struct InFlight {
    model::Message message;
    std::vector<std::uint8_t> encoded;
    std::uint32_t attempts{0};
    std::chrono::milliseconds timeout{0};
    Clock::time_point deadline{};
  };

  struct Outgoing {
    model::Message message;
    std::vector<std::uint8_t> encoded;
  };

  void transmit(const std::vector<std::uint8_t>& encoded);
  void remember(Outgoing outgoing);

  std::string local_id_;
  std::string peer_id_;
  std::string peer_address_;
  Transport& transport_;
  LinkConfig config_;

  mutable std::mutex mutex_;
  std::deque<Outgoing> queue_;
  std::optional<InFlight> in_flight_;
  std::deque<Outgoing> history_;
  std::vector<std::uint32_t> retransmit_requests_;
  std::uint32_t next_sequence_{0};
  bool closed_{false};
  LinkStats stats_{};
  DegradedHandler degraded_handler_{};
};

// Inbound half: acknowledges, deduplicates and releases each source's messages in sequence order.
class ReliableReceiver {
 public:
  using GapHandler = std::function<void(const std::string& source_id, std::uint32_t first_missing,
                                        std::uint32_t resumed_at)>;

  ReliableReceiver(std::string local_id, Transport& transport, LinkConfig config = {});

  ReliableReceiver(const ReliableReceiver&) = delete;
  ReliableReceiver& operator=(const ReliableReceiver&) = delete;

  void on_message(const model::Message& message, const std::string& reply_address, Clock::time_point now);

  // Drains everything releasable now; holes older than reorder_timeout are skipped.
  std::vector<model::Message> release(Clock::time_point now);

  [[nodiscard]] LinkStats stats() const;
  [[nodiscard]] std::size_t buffered() const;

  void set_gap_handler(GapHandler handler);

 private:
  struct Stream {
    std::uint32_t next_expected{0};
    std::map<std::uint32_t, model::Message> pending;
    std::deque<std::uint32_t> recent;
    std::unordered_set<std::uint32_t> recent_set;
    std::optional<Clock::time_point> hole_since;
    bool retransmit_requested{false};
    std::string reply_address;
    std::uint64_t newest_created_at_us{0};
  };

  struct GapEvent {
    std::string source_id;
    std::uint32_t first_missing;
    std::uint32_t resumed_at;
  };

  void reply(const std::string& address, const std::string& destination, std::uint32_t sequence,
             wire::AckKind kind);
  void remember(Stream& stream, std::uint32_t sequence);
  [[nodiscard]] bool is_duplicate(const Stream& stream, std::uint32_t sequence) const;

  std::string local_id_;
  Transport& transport_;
  LinkConfig config_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Stream> streams_;
  LinkStats stats_{};
  GapHandler gap_handler_{};
};

// One transport shared by the downstream sender and the upstream receiver of a node.
class LinkEndpoint {
 public:
  LinkEndpoint(std::string local_id, Transport& transport, LinkConfig config = {});

  void connect_downstream(const std::string& peer_id, const std::string& peer_address);

  // Receives at most one datagram and routes it. Returns the decode status of that datagram,
  // or nullopt when nothing arrived.
  std::optional<wire::DecodeStatus> poll_transport(std::chrono::milliseconds timeout, Clock::time_point now);
  wire::DecodeStatus dispatch(const Datagram& datagram, Clock::time_point now);

  [[nodiscard]] ReliableSender* sender() noexcept { return sender_.get(); }
  [[nodiscard]] const ReliableSender* sender() const noexcept { return sender_.get(); }
  [[nodiscard]] ReliableReceiver& receiver() noexcept { return receiver_; }
  [[nodiscard]] LinkStats stats() const;
  [[nodiscard]] const std::string& local_id() const noexcept { return local_id_; }

 private:
  std::string local_id_;
  Transport& transport_;
  LinkConfig config_;
  std::unique_ptr<ReliableSender> sender_;
  ReliableReceiver receiver_;
  mutable std::mutex mutex_;
  std::uint64_t decode_errors_{0};
};

const char* to_string(SendResult result) noexcept;

}  // namespace res_agent::link
