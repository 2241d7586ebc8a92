#include "reservoir/reservoir.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace res_agent::reservoir {
namespace {

constexpr int kPowerIterations = 200;
constexpr int kPowerWarmup = 100;
constexpr double kInputLimit = 1.0e12;

double sanitize_input(const double value) {
  if (std::isnan(value)) {
    return 0.0;
  }
  if (value > kInputLimit) {
    return kInputLimit;
  }
  if (value < -kInputLimit) {
    return -kInputLimit;
  }
  return value;
}

}  // namespace

Reservoir::Reservoir(const ReservoirConfig& config)
    : state_dim_(config.state_dim), input_dim_(config.input_dim), leak_rate_(config.leak_rate) {
  if (state_dim_ == 0 || input_dim_ == 0) {
    throw std::invalid_argument("reservoir dimensions must be greater than 0");
  }
  if (!(leak_rate_ > 0.0 && leak_rate_ <= 1.0)) {
    throw std::invalid_argument("reservoir leak_rate must be in (0, 1]");
  }

  std::mt19937 rng(config.seed);
  std::uniform_real_distribution<double> input_dist(-config.input_scaling, config.input_scaling);
  std::uniform_real_distribution<double> unit(-1.0, 1.0);
  std::bernoulli_distribution keep(config.connectivity);

  w_in_.resize(state_dim_ * input_dim_);
  for (auto& weight : w_in_) {
    weight = input_dist(rng);
  }

  w_res_.assign(state_dim_ * state_dim_, 0.0);
  for (auto& weight : w_res_) {
    if (keep(rng)) {
      weight = unit(rng);
    }
  }

  const double radius = estimate_spectral_radius(w_res_, state_dim_, config.seed);
  if (radius > 0.0) {
    const double scale = config.spectral_radius / radius;
    for (auto& weight : w_res_) {
      weight *= scale;
    }
  }
}

void Reservoir::update(std::vector<double>& state, const std::vector<double>& input) const {
  state.resize(state_dim_, 0.0);

  std::vector<double> drive(input_dim_, 0.0);
  const std::size_t provided = std::min(input.size(), input_dim_);
  for (std::size_t j = 0; j < provided; ++j) {
    drive[j] = sanitize_input(input[j]);
  }

  std::vector<double> next(state_dim_, 0.0);
  for (std::size_t i = 0; i < state_dim_; ++i) {
    double pre = 0.0;
    const double* in_row = w_in_.data() + (i * input_dim_);
    for (std::size_t j = 0; j < input_dim_; ++j) {
      pre += in_row[j] * drive[j];
    }
    const double* res_row = w_res_.data() + (i * state_dim_);
    for (std::size_t j = 0; j < state_dim_; ++j) {
      pre += res_row[j] * state[j];
    }
    if (std::isnan(pre)) {
      pre = 0.0;
    }
    next[i] = ((1.0 - leak_rate_) * state[i]) + (leak_rate_ * std::tanh(pre));
  }
  state.swap(next);
}

double estimate_spectral_radius(const std::vector<double>& matrix, const std::size_t n, const std::uint32_t seed) {
  if (n == 0 || matrix.size() != n * n) {
    return 0.0;
  }

  std::mt19937 rng(seed ^ 0x9E3779B9U);
  std::uniform_real_distribution<double> unit(-1.0, 1.0);
  std::vector<double> v(n);
  double norm = 0.0;
  for (auto& x : v) {
    x = unit(rng);
    norm += x * x;
  }
  norm = std::sqrt(norm);
  if (norm == 0.0) {
    return 0.0;
  }
  for (auto& x : v) {
    x /= norm;
  }

  // Geometric mean of the per-step growth; converges for complex dominant pairs too.
  double log_growth = 0.0;
  int counted = 0;
  std::vector<double> w(n);
  for (int iteration = 0; iteration < kPowerIterations; ++iteration) {
    double step_norm = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      double sum = 0.0;
      const double* row = matrix.data() + (i * n);
      for (std::size_t j = 0; j < n; ++j) {
        sum += row[j] * v[j];
      }
      w[i] = sum;
      step_norm += sum * sum;
    }
    step_norm = std::sqrt(step_norm);
    if (step_norm == 0.0) {
      return 0.0;
    }
    if (iteration >= kPowerWarmup) {
      log_growth += std::log(step_norm);
      ++counted;
    }
    for (std::size_t i = 0; i < n; ++i) {
      v[i] = w[i] / step_norm;
    }
  }
  return std::exp(log_growth / counted);
}

}  // namespace res_agent::reservoir
