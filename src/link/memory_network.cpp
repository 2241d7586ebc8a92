#include "link/memory_network.hpp"

#include <utility>

namespace res_agent::link {

class MemoryEndpoint final : public Transport {
 public:
  MemoryEndpoint(MemoryNetwork& network, std::string address) : network_(network), address_(std::move(address)) {}

  bool send_to(const std::string& address, const std::vector<std::uint8_t>& bytes) override {
    return network_.deliver(address_, address, bytes);
  }

  std::optional<Datagram> receive(const std::chrono::milliseconds timeout) override {
    return network_.take(address_, timeout);
  }

  const std::string& local_address() const override { return address_; }

 private:
  MemoryNetwork& network_;
  std::string address_;
};

MemoryNetwork::MemoryNetwork(MemoryNetworkOptions options) : options_(options), rng_(options.seed) {}

std::unique_ptr<Transport> MemoryNetwork::endpoint(const std::string& address) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    mailboxes_[address];
  }
  return std::make_unique<MemoryEndpoint>(*this, address);
}

void MemoryNetwork::set_loss_probability(const double probability) {
  std::lock_guard<std::mutex> lock(mutex_);
  options_.loss_probability = probability;
}

std::uint64_t MemoryNetwork::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

std::uint64_t MemoryNetwork::duplicated() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return duplicated_;
}

std::size_t MemoryNetwork::pending(const std::string& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = mailboxes_.find(address);
  return it == mailboxes_.end() ? 0 : it->second.size();
}

bool MemoryNetwork::deliver(const std::string& from, const std::string& to, const std::vector<std::uint8_t>& bytes) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = mailboxes_.find(to);
    if (it == mailboxes_.end()) {
      // Nobody bound there; the datagram is lost like on a real LAN.
      ++dropped_;
      return true;
    }

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (coin(rng_) < options_.loss_probability) {
      ++dropped_;
      return true;
    }

    it->second.push_back(Datagram{from, bytes});
    if (coin(rng_) < options_.duplicate_probability) {
      it->second.push_back(Datagram{from, bytes});
      ++duplicated_;
    }
  }
  ready_.notify_all();
  return true;
}

std::optional<Datagram> MemoryNetwork::take(const std::string& address, const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto& mailbox = mailboxes_[address];
  if (mailbox.empty() && timeout.count() > 0) {
    ready_.wait_for(lock, timeout, [&mailbox]() { return !mailbox.empty(); });
  }
  if (mailbox.empty()) {
    return std::nullopt;
  }

  std::size_t index = 0;
  if (options_.reorder && mailbox.size() > 1) {
    std::uniform_int_distribution<std::size_t> pick(0, mailbox.size() - 1);
    index = pick(rng_);
  }

  Datagram datagram = std::move(mailbox[index]);
  mailbox.erase(mailbox.begin() + static_cast<std::ptrdiff_t>(index));
  return datagram;
}

}  // namespace res_agent::link
