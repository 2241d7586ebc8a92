#include "reservoir/input_encoding.hpp"

#include <algorithm>
#include <cmath>

namespace res_agent::reservoir {
namespace {

constexpr double kTwoPi = 6.283185307179586;
constexpr std::uint64_t kSecondsPerDay = 86400;

}  // namespace

std::vector<double> encode_motion_input(const std::vector<model::MovementVector>& batch, const std::size_t input_dim,
                                        const std::uint64_t timestamp_ms) {
  std::vector<const model::MovementVector*> ordered;
  ordered.reserve(batch.size());
  for (const auto& vector : batch) {
    ordered.push_back(&vector);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
    return a->region_id < b->region_id;
  });

  std::vector<double> input;
  input.reserve(ordered.size() + 2U);
  for (const auto* vector : ordered) {
    input.push_back(vector->magnitude);
  }

  const double day_fraction =
      static_cast<double>((timestamp_ms / 1000ULL) % kSecondsPerDay) / static_cast<double>(kSecondsPerDay);
  input.push_back(std::sin(kTwoPi * day_fraction));
  input.push_back(std::cos(kTwoPi * day_fraction));

  input.resize(input_dim, 0.0);
  return input;
}

std::vector<double> encode_state_input(const std::vector<double>& values, const std::size_t input_dim) {
  std::vector<double> input(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(std::min(values.size(), input_dim)));
  input.resize(input_dim, 0.0);
  return input;
}

double mean_magnitude(const std::vector<model::MovementVector>& batch) noexcept {
  if (batch.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const auto& vector : batch) {
    sum += vector.magnitude;
  }
  return sum / static_cast<double>(batch.size());
}

int classify_activity(const double value, const double min, const double max, const std::size_t classes) noexcept {
  if (classes == 0 || !(max > min) || std::isnan(value)) {
    return -1;
  }
  const double position = std::clamp((value - min) / (max - min), 0.0, 1.0);
  const auto bin = static_cast<std::size_t>(std::floor(position * static_cast<double>(classes)));
  return static_cast<int>(std::min(bin, classes - 1U));
}

}  // namespace res_agent::reservoir
