#include "topology/router.hpp"

#include <unordered_set>
#include <utility>

namespace res_agent::topology {

UnknownPeer::UnknownPeer(const std::string& name)
    : std::runtime_error("unknown peer '" + name + "': no resolvable address"), peer_(name) {}

TopologyRouter::TopologyRouter(TopologyConfig config)
    : nodes_(std::move(config.nodes)), edges_(std::move(config.edges)) {
  for (std::size_t i = 0; i < nodes_.size(); ++i) {
    if (nodes_[i].name.empty()) {
      throw std::runtime_error("topology node with empty name");
    }
    if (!index_.emplace(nodes_[i].name, i).second) {
      throw std::runtime_error("topology node '" + nodes_[i].name + "' defined twice");
    }
  }

  for (const auto& edge : edges_) {
    // Both ends must be addressable before the process starts talking.
    (void)address_of(edge.from);
    (void)address_of(edge.to);

    if (!destination_.emplace(edge.from, edge.to).second) {
      throw std::runtime_error("topology node '" + edge.from + "' has more than one destination");
    }
  }
}

Route TopologyRouter::resolve(const std::string& self) const {
  const auto& own = entry(self);

  Route route{};
  route.identity.name = own.name;
  route.identity.listen_address = own.address;
  route.identity.role = own.role;

  for (const auto& edge : edges_) {
    if (edge.to == self) {
      route.upstream.push_back(Peer{edge.from, address_of(edge.from)});
    }
  }

  const auto it = destination_.find(self);
  if (it != destination_.end()) {
    route.downstream = Peer{it->second, address_of(it->second)};
    route.identity.send_address = route.downstream->address;
  }
  return route;
}

const std::string& TopologyRouter::address_of(const std::string& name) const {
  const auto& found = entry(name);
  if (found.address.empty()) {
    throw UnknownPeer(name);
  }
  return found.address;
}

std::vector<std::string> TopologyRouter::path_from(const std::string& origin) const {
  (void)entry(origin);

  std::vector<std::string> path{origin};
  std::unordered_set<std::string> visited{origin};
  std::string current = origin;
  while (true) {
    const auto it = destination_.find(current);
    if (it == destination_.end()) {
      break;
    }
    const std::string& next = it->second;
    if (visited.count(next) != 0U) {
      if (next == origin) {
        path.push_back(next);
      }
      break;
    }
    path.push_back(next);
    visited.insert(next);
    current = next;
  }
  return path;
}

bool TopologyRouter::is_ring(const std::string& origin) const {
  const auto path = path_from(origin);
  return path.size() > 1U && path.back() == origin;
}

const NodeEntry& TopologyRouter::entry(const std::string& name) const {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    throw UnknownPeer(name);
  }
  return nodes_[it->second];
}

}  // namespace res_agent::topology
