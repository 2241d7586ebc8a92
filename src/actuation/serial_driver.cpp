#include "actuation/actuator_driver.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace res_agent::actuation {
namespace {

constexpr int kPulseCenter = 1500;
constexpr int kPulseMin = 500;
constexpr int kPulseMax = 2500;
constexpr double kPulsePerDegree = 1000.0 / 150.0;
constexpr std::size_t kMaxReplyLength = 64;

speed_t to_speed(const int baud) {
  switch (baud) {
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    case 230400:
      return B230400;
    default:
      throw std::runtime_error("unsupported serial baud rate: " + std::to_string(baud));
  }
}

class SerialActuatorDriver final : public ActuatorDriver {
 public:
  explicit SerialActuatorDriver(SerialOptions options) : options_(std::move(options)) {
    const speed_t speed = to_speed(options_.baud);
    fd_ = ::open(options_.port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
      throw std::runtime_error("unable to open serial port " + options_.port + ": " + std::strerror(errno));
    }

    termios tty{};
    if (::tcgetattr(fd_, &tty) != 0) {
      const std::string reason = std::strerror(errno);
      ::close(fd_);
      throw std::runtime_error("tcgetattr failed on " + options_.port + ": " + reason);
    }

    ::cfmakeraw(&tty);
    tty.c_cflag |= (CLOCAL | CREAD);
    tty.c_cflag &= ~CSTOPB;
    tty.c_cflag &= ~PARENB;
    tty.c_cflag &= ~CSIZE;
    tty.c_cflag |= CS8;
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;

    ::cfsetispeed(&tty, speed);
    ::cfsetospeed(&tty, speed);

    if (::tcsetattr(fd_, TCSANOW, &tty) != 0) {
      const std::string reason = std::strerror(errno);
      ::close(fd_);
      throw std::runtime_error("tcsetattr failed on " + options_.port + ": " + reason);
    }
    ::tcflush(fd_, TCIOFLUSH);
  }

  ~SerialActuatorDriver() override {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  SerialActuatorDriver(const SerialActuatorDriver&) = delete;
  SerialActuatorDriver& operator=(const SerialActuatorDriver&) = delete;

  bool set_angle(const int servo_id, const double angle_degrees) override {
    return transact(format_servo_command(servo_id, angle_degrees, options_.move_time));
  }

  bool set_relay(const bool on) override { return transact(format_relay_command(on)); }

  bool set_level(const int level) override { return transact(format_level_command(level)); }

  const std::string& name() const override { return options_.port; }

 private:
  bool transact(const std::string& command) {
    if (!write_all(command)) {
      return false;
    }

    std::string token;
    if (!read_reply(token)) {
      if (options_.require_reply) {
        std::cerr << "[serial] " << options_.port << ": no reply\n";
        return false;
      }
      return true;
    }
    if (reply_is_error(token)) {
      std::cerr << "[serial] " << options_.port << " rejected command: " << token << '\n';
      return false;
    }
    return true;
  }

  bool write_all(const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
      const ssize_t rc = ::write(fd_, data.data() + written, data.size() - written);
      if (rc < 0) {
        if (errno == EINTR) {
          continue;
        }
        std::cerr << "[serial] write to " << options_.port << " failed: " << std::strerror(errno) << '\n';
        return false;
      }
      written += static_cast<std::size_t>(rc);
    }
    return true;
  }

  // One line with surrounding whitespace stripped. False when nothing arrived in time.
  bool read_reply(std::string& token) {
    token.clear();
    const auto deadline = std::chrono::steady_clock::now() + options_.reply_timeout;
    while (token.size() < kMaxReplyLength) {
      const auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        break;
      }

      pollfd pfd{};
      pfd.fd = fd_;
      pfd.events = POLLIN;
      const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
      if (ready <= 0) {
        break;
      }

      char c = 0;
      const ssize_t rc = ::read(fd_, &c, 1);
      if (rc <= 0) {
        break;
      }
      if (c == '\n') {
        break;
      }
      if (c != '\r') {
        token.push_back(c);
      }
    }

    const auto first = std::find_if_not(token.begin(), token.end(), [](unsigned char ch) { return std::isspace(ch) != 0; });
    token.erase(token.begin(), first);
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back())) != 0) {
      token.pop_back();
    }
    return !token.empty();
  }

  SerialOptions options_;
  int fd_{-1};
};

}  // namespace

int angle_to_pulse(const double angle_degrees) noexcept {
  if (std::isnan(angle_degrees)) {
    return kPulseCenter;
  }
  const double pulse = static_cast<double>(kPulseCenter) + (angle_degrees * kPulsePerDegree);
  return static_cast<int>(std::lround(std::clamp(pulse, static_cast<double>(kPulseMin), static_cast<double>(kPulseMax))));
}

std::string format_servo_command(const int servo_id, const double angle_degrees,
                                 const std::chrono::milliseconds move_time) {
  return "#" + std::to_string(servo_id) + "P" + std::to_string(angle_to_pulse(angle_degrees)) + "T" +
         std::to_string(move_time.count()) + "\r\n";
}

std::string format_relay_command(const bool on) { return on ? "on\n" : "off\n"; }

std::string format_level_command(const int level) { return std::to_string(level) + "\n"; }

bool reply_is_error(const std::string& token) noexcept {
  if (token.size() < 3) {
    return false;
  }
  return std::tolower(static_cast<unsigned char>(token[0])) == 'e' &&
         std::tolower(static_cast<unsigned char>(token[1])) == 'r' &&
         std::tolower(static_cast<unsigned char>(token[2])) == 'r';
}

std::unique_ptr<ActuatorDriver> make_serial_driver(const SerialOptions& options) {
  return std::make_unique<SerialActuatorDriver>(options);
}

}  // namespace res_agent::actuation
