#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

#include "link/transport.hpp"

namespace res_agent::link {

struct MemoryNetworkOptions {
  double loss_probability{0.0};
  double duplicate_probability{0.0};
  bool reorder{false};
  std::uint32_t seed{1};
};

// In-process datagram fabric. Endpoints must not outlive the network.
class MemoryNetwork {
 public:
  explicit MemoryNetwork(MemoryNetworkOptions options = {});

  MemoryNetwork(const MemoryNetwork&) = delete;
  MemoryNetwork& operator=(const MemoryNetwork&) = delete;

  std::unique_ptr<Transport> endpoint(const std::string& address);

  void set_loss_probability(double probability);

  [[nodiscard]] std::uint64_t dropped() const;
  [[nodiscard]] std::uint64_t duplicated() const;
  [[nodiscard]] std::size_t pending(const std::string& address) const;

 private:
  friend class MemoryEndpoint;

  bool deliver(const std::string& from, const std::string& to, const std::vector<std::uint8_t>& bytes);
  std::optional<Datagram> take(const std::string& address, std::chrono::milliseconds timeout);

  MemoryNetworkOptions options_;
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::unordered_map<std::string, std::deque<Datagram>> mailboxes_;
  std::mt19937 rng_;
  std::uint64_t dropped_{0};
  std::uint64_t duplicated_{0};
};

}  // namespace res_agent::link
