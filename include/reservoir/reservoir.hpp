#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace res_agent::reservoir {

struct ReservoirConfig {
  std::size_t state_dim{50};
  std::size_t input_dim{32};
  double leak_rate{0.3};
  double spectral_radius{0.9};
  double input_scaling{1.0};
  double connectivity{0.1};
  std::uint32_t seed{42};
};

// Echo-state recurrence with fixed random weights:
//   state' = (1 - leak) * state + leak * tanh(W_in * input + W * state)
// Every component of the result stays in [-1, 1] when the previous state did.
class Reservoir {
 public:
  // Throws std::invalid_argument for zero dimensions or a leak rate outside (0, 1].
  explicit Reservoir(const ReservoirConfig& config);

  void update(std::vector<double>& state, const std::vector<double>& input) const;

  [[nodiscard]] std::size_t state_dim() const noexcept { return state_dim_; }
  [[nodiscard]] std::size_t input_dim() const noexcept { return input_dim_; }
  [[nodiscard]] double leak_rate() const noexcept { return leak_rate_; }
  [[nodiscard]] const std::vector<double>& input_weights() const noexcept { return w_in_; }
  [[nodiscard]] const std::vector<double>& recurrent_weights() const noexcept { return w_res_; }

 private:
  std::size_t state_dim_;
  std::size_t input_dim_;
  double leak_rate_;
  std::vector<double> w_in_;
  std::vector<double> w_res_;
};

// Largest eigenvalue magnitude of a row-major n x n matrix, by power iteration.
double estimate_spectral_radius(const std::vector<double>& matrix, std::size_t n, std::uint32_t seed);

}  // namespace res_agent::reservoir
