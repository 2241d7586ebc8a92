#include "model/message.hpp"

namespace res_agent::model {

const char* to_string(const PayloadType type) noexcept {
  switch (type) {
    case PayloadType::VECTOR:
      return "VECTOR";
    case PayloadType::STATE:
      return "STATE";
    case PayloadType::MODEL_UPDATE:
      return "MODEL_UPDATE";
    case PayloadType::ACK:
      return "ACK";
  }
  return "UNKNOWN";
}

const char* to_string(const NodeRole role) noexcept {
  switch (role) {
    case NodeRole::SOURCE:
      return "source";
    case NodeRole::RELAY:
      return "relay";
    case NodeRole::TRAINER:
      return "trainer";
    case NodeRole::BUILDER:
      return "builder";
    case NodeRole::SINK:
      return "sink";
  }
  return "unknown";
}

bool parse_role(const std::string& text, NodeRole& role) noexcept {
  if (text == "source") {
    role = NodeRole::SOURCE;
  } else if (text == "relay") {
    role = NodeRole::RELAY;
  } else if (text == "trainer") {
    role = NodeRole::TRAINER;
  } else if (text == "builder") {
    role = NodeRole::BUILDER;
  } else if (text == "sink") {
    role = NodeRole::SINK;
  } else {
    return false;
  }
  return true;
}

}  // namespace res_agent::model
