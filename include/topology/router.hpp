#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "model/message.hpp"

namespace res_agent::topology {

// A configured destination or node name with no resolvable address.
class UnknownPeer : public std::runtime_error {
 public:
  explicit UnknownPeer(const std::string& name);

  [[nodiscard]] const std::string& peer() const noexcept { return peer_; }

 private:
  std::string peer_;
};

struct NodeEntry {
  std::string name;
  std::string address;
  model::NodeRole role{model::NodeRole::RELAY};
};

// Directed edge: messages produced at `from` are sent to `to`.
struct Edge {
  std::string from;
  std::string to;
};

struct TopologyConfig {
  std::vector<NodeEntry> nodes;
  std::vector<Edge> edges;
};

struct Peer {
  std::string name;
  std::string address;
};

struct Route {
  model::NodeIdentity identity;
  std::vector<Peer> upstream;
  std::optional<Peer> downstream;
};

// Resolved once at construction; nothing here changes afterwards.
class TopologyRouter {
 public:
  // Throws UnknownPeer when an edge names a node without an address and
  // std::runtime_error on duplicate names or a node with two destinations.
  explicit TopologyRouter(TopologyConfig config);

  [[nodiscard]] Route resolve(const std::string& self) const;
  [[nodiscard]] const std::string& address_of(const std::string& name) const;

  // Node names visited from `origin` following destinations. A ring ends with `origin` repeated.
  [[nodiscard]] std::vector<std::string> path_from(const std::string& origin) const;
  [[nodiscard]] bool is_ring(const std::string& origin) const;

  [[nodiscard]] const std::vector<NodeEntry>& nodes() const noexcept { return nodes_; }
  [[nodiscard]] const std::vector<Edge>& edges() const noexcept { return edges_; }

 private:
  [[nodiscard]] const NodeEntry& entry(const std::string& name) const;

  std::vector<NodeEntry> nodes_;
  std::vector<Edge> edges_;
  std::unordered_map<std::string, std::size_t> index_;
  std::unordered_map<std::string, std::string> destination_;
};

}  // namespace res_agent::topology
