#pragma once

#include <cstdint>
#include <utility>
#include <vector>

namespace res_agent::model {

struct PixelBox {
  int x{0};
  int y{0};
  int width{0};
  int height{0};
};

// Defined by the camera side; read-only here.
struct Region {
  std::uint16_t id{0};
  std::vector<std::pair<int, int>> cells;
  PixelBox bbox{};
};

struct MovementVector {
  std::uint16_t region_id{0};
  double magnitude{0.0};
  double dx{0.0};
  double dy{0.0};
  std::uint64_t frame_index{0};
  std::uint64_t timestamp_ms{0};

  friend bool operator==(const MovementVector&, const MovementVector&) = default;
};

}  // namespace res_agent::model
