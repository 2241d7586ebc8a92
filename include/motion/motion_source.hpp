#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "model/movement.hpp"

namespace res_agent::motion {

// One batch of movement vectors per sampling tick. nullopt is a missed tick, not an error.
class MotionVectorSource {
 public:
  virtual std::optional<std::vector<model::MovementVector>> next_batch() = 0;
  virtual void rewind() = 0;
  virtual ~MotionVectorSource() = default;
};

struct CsvMotionOptions {
  std::string path{};
  bool loop{true};
};

// Replays a recorded movement CSV. Header row names the columns; `timestamp` (epoch s or ms)
// is optional, `t_sin`/`t_cos` are ignored, every other column is one region in column order.
class CsvMotionSource final : public MotionVectorSource {
 public:
  // Throws std::runtime_error when the file cannot be opened or has no region columns.
  explicit CsvMotionSource(CsvMotionOptions options);

  std::optional<std::vector<model::MovementVector>> next_batch() override;
  void rewind() override;

  [[nodiscard]] std::size_t region_count() const noexcept { return region_columns_.size(); }
  [[nodiscard]] const std::vector<std::string>& region_names() const noexcept { return region_names_; }

 private:
  void read_header();

  CsvMotionOptions options_;
  std::ifstream input_;
  std::vector<std::size_t> region_columns_;
  std::vector<std::string> region_names_;
  std::optional<std::size_t> timestamp_column_;
  std::uint64_t frame_index_{0};
  bool exhausted_{false};
};

std::vector<std::string> split_csv_line(const std::string& line);

}  // namespace res_agent::motion
