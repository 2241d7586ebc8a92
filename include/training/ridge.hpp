#pragma once

#include <cstddef>
#include <vector>

#include "training/example_buffer.hpp"

namespace res_agent::training {

// Overwrites the lower triangle of A with L where A = L L^T. Returns false when A is not positive definite.
bool cholesky_factor(std::vector<double>& a, std::size_t n);
void cholesky_substitute(const std::vector<double>& l, std::size_t n, std::vector<double>& b);

// In-place Cholesky solve of A x = b for a symmetric positive definite n x n matrix A (row-major).
// A is overwritten with its factor. Returns false when A is not positive definite.
bool cholesky_solve(std::vector<double>& a, std::size_t n, std::vector<double>& b);

// One-hot ridge regression with a bias column:
//   W = argmin |X W - Y|^2 + lambda |W|^2, bias excluded from the penalty.
// Output is classes x (state_dim + 1) row-major, bias last.
bool fit_ridge(const std::vector<TrainingExample>& train, std::size_t classes, std::size_t state_dim, double lambda,
               std::vector<double>& weights);

}  // namespace res_agent::training
