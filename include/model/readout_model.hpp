#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace res_agent::model {

struct ReadoutMetrics {
  double accuracy{0.0};
  double precision{0.0};
  double recall{0.0};
  double f1{0.0};
  std::uint32_t train_size{0};
  std::uint32_t test_size{0};

  friend bool operator==(const ReadoutMetrics&, const ReadoutMetrics&) = default;
};

// Linear map from reservoir state to per-class scores.
// weights is outputs x inputs, row-major; the last column of each row is the bias.
struct ReadoutModel {
  std::uint16_t outputs{0};
  std::uint16_t inputs{0};
  std::vector<double> weights;
  std::uint64_t trained_at_ms{0};
  ReadoutMetrics metrics{};
  std::uint32_t updates_performed{0};

  [[nodiscard]] std::vector<double> predict(const std::vector<double>& state) const;
  [[nodiscard]] std::size_t predict_class(const std::vector<double>& state) const;
  [[nodiscard]] bool valid() const noexcept;

  static ReadoutModel passthrough(std::size_t outputs, std::size_t state_dim);

  friend bool operator==(const ReadoutModel&, const ReadoutModel&) = default;
};

}  // namespace res_agent::model
