#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "model/movement.hpp"

namespace res_agent::reservoir {

// Magnitudes in region order followed by the time-of-day pair (t_sin, t_cos),
// zero-padded or truncated to input_dim.
std::vector<double> encode_motion_input(const std::vector<model::MovementVector>& batch, std::size_t input_dim,
                                        std::uint64_t timestamp_ms);

std::vector<double> encode_state_input(const std::vector<double>& values, std::size_t input_dim);

double mean_magnitude(const std::vector<model::MovementVector>& batch) noexcept;

// Bins `value` over [min, max] into `classes` equal bins, clamping at both ends.
// Returns -1 when no label can be formed.
int classify_activity(double value, double min, double max, std::size_t classes) noexcept;

}  // namespace res_agent::reservoir
