#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace res_agent::model {

enum class PayloadType : std::uint8_t {
  VECTOR = 0,
  STATE = 1,
  MODEL_UPDATE = 2,
  ACK = 3,
};

enum class NodeRole : std::uint8_t {
  SOURCE = 0,
  RELAY = 1,
  TRAINER = 2,
  BUILDER = 3,
  SINK = 4,
};

// Fixed at process start.
struct NodeIdentity {
  std::string name;
  std::string listen_address;
  std::string send_address;
  NodeRole role{NodeRole::RELAY};
};

struct Message {
  std::string source_id;
  std::string destination_id;
  std::uint32_t sequence_number{0};
  PayloadType payload_type{PayloadType::VECTOR};
  std::vector<std::uint8_t> payload;
  std::uint64_t created_at_us{0};

  friend bool operator==(const Message&, const Message&) = default;
};

const char* to_string(PayloadType type) noexcept;
const char* to_string(NodeRole role) noexcept;
bool parse_role(const std::string& text, NodeRole& role) noexcept;

}  // namespace res_agent::model
