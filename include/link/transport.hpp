#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace res_agent::link {

struct Datagram {
  std::string from;
  std::vector<std::uint8_t> bytes;
};

// Best-effort datagram delivery: packets may be dropped, duplicated or reordered.
class Transport {
 public:
  virtual bool send_to(const std::string& address, const std::vector<std::uint8_t>& bytes) = 0;
  virtual std::optional<Datagram> receive(std::chrono::milliseconds timeout) = 0;
  virtual const std::string& local_address() const = 0;
  virtual ~Transport() = default;
};

// Binds a UDP socket to "host:port". Throws std::runtime_error when the address cannot be bound.
std::unique_ptr<Transport> make_udp_transport(const std::string& listen_address);

bool split_host_port(const std::string& address, std::string& host, std::uint16_t& port);

}  // namespace res_agent::link
