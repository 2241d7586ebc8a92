#include "link/transport.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace res_agent::link {
namespace {

constexpr std::size_t kReceiveBufferSize = 65536;

bool resolve_ipv4(const std::string& address, sockaddr_in& out) {
  std::string host;
  std::uint16_t port = 0;
  if (!split_host_port(address, host, port)) {
    return false;
  }

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;
  addrinfo* result = nullptr;
  const char* node = host.empty() || host == "*" ? nullptr : host.c_str();
  if (node == nullptr) {
    hints.ai_flags = AI_PASSIVE;
  }
  if (getaddrinfo(node, std::to_string(port).c_str(), &hints, &result) != 0 || result == nullptr) {
    return false;
  }

  std::memcpy(&out, result->ai_addr, sizeof(sockaddr_in));
  freeaddrinfo(result);
  return true;
}

std::string format_address(const sockaddr_in& address) {
  char buffer[INET_ADDRSTRLEN]{};
  if (inet_ntop(AF_INET, &address.sin_addr, buffer, sizeof(buffer)) == nullptr) {
    return {};
  }
  return std::string(buffer) + ':' + std::to_string(ntohs(address.sin_port));
}

class UdpTransport final : public Transport {
 public:
  explicit UdpTransport(std::string listen_address) : local_address_(std::move(listen_address)) {
    sockaddr_in bind_address{};
    if (!resolve_ipv4(local_address_, bind_address)) {
      throw std::runtime_error("unable to resolve listen address: " + local_address_);
    }

    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
      throw std::runtime_error(std::string("socket() failed: ") + std::strerror(errno));
    }

    const int reuse = 1;
    (void)::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    if (::bind(fd_, reinterpret_cast<const sockaddr*>(&bind_address), sizeof(bind_address)) != 0) {
      const std::string reason = std::strerror(errno);
      ::close(fd_);
      fd_ = -1;
      throw std::runtime_error("bind " + local_address_ + " failed: " + reason);
    }
  }

  ~UdpTransport() override {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  bool send_to(const std::string& address, const std::vector<std::uint8_t>& bytes) override {
    sockaddr_in destination{};
    if (!resolve_ipv4(address, destination)) {
      std::cerr << "[link] unable to resolve peer address " << address << '\n';
      return false;
    }

    const ssize_t sent = ::sendto(fd_, bytes.data(), bytes.size(), 0, reinterpret_cast<const sockaddr*>(&destination),
                                  sizeof(destination));
    return sent == static_cast<ssize_t>(bytes.size());
  }

  std::optional<Datagram> receive(const std::chrono::milliseconds timeout) override {
    pollfd descriptor{};
    descriptor.fd = fd_;
    descriptor.events = POLLIN;
    const int ready = ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
    if (ready <= 0 || (descriptor.revents & POLLIN) == 0) {
      return std::nullopt;
    }

    Datagram datagram{};
    datagram.bytes.resize(kReceiveBufferSize);
    sockaddr_in from{};
    socklen_t from_size = sizeof(from);
    const ssize_t received = ::recvfrom(fd_, datagram.bytes.data(), datagram.bytes.size(), 0,
                                        reinterpret_cast<sockaddr*>(&from), &from_size);
    if (received < 0) {
      return std::nullopt;
    }

    datagram.bytes.resize(static_cast<std::size_t>(received));
    datagram.from = format_address(from);
    return datagram;
  }

  const std::string& local_address() const override { return local_address_; }

 private:
  std::string local_address_;
  int fd_{-1};
};

}  // namespace

bool split_host_port(const std::string& address, std::string& host, std::uint16_t& port) {
  const auto split = address.rfind(':');
  if (split == std::string::npos || split + 1 >= address.size()) {
    return false;
  }

  try {
    const auto parsed_port = std::stoi(address.substr(split + 1));
    if (parsed_port <= 0 || parsed_port > 65535) {
      return false;
    }
    port = static_cast<std::uint16_t>(parsed_port);
  } catch (const std::exception&) {
    return false;
  }

  host = address.substr(0, split);
  return true;
}

std::unique_ptr<Transport> make_udp_transport(const std::string& listen_address) {
  return std::make_unique<UdpTransport>(listen_address);
}

}  // namespace res_agent::link
