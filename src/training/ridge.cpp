#include "training/ridge.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

namespace res_agent::training {

bool cholesky_factor(std::vector<double>& a, const std::size_t n) {
  if (a.size() != n * n) {
    return false;
  }

  // A = L L^T, L stored in the lower triangle.
  for (std::size_t j = 0; j < n; ++j) {
    double diagonal = a[(j * n) + j];
    for (std::size_t k = 0; k < j; ++k) {
      diagonal -= a[(j * n) + k] * a[(j * n) + k];
    }
    if (!(diagonal > 0.0) || !std::isfinite(diagonal)) {
      return false;
    }
    const double l_jj = std::sqrt(diagonal);
    a[(j * n) + j] = l_jj;

    for (std::size_t i = j + 1; i < n; ++i) {
      double sum = a[(i * n) + j];
      for (std::size_t k = 0; k < j; ++k) {
        sum -= a[(i * n) + k] * a[(j * n) + k];
      }
      a[(i * n) + j] = sum / l_jj;
    }
  }
  return true;
}

void cholesky_substitute(const std::vector<double>& l, const std::size_t n, std::vector<double>& b) {
  for (std::size_t i = 0; i < n; ++i) {
    double sum = b[i];
    for (std::size_t k = 0; k < i; ++k) {
      sum -= l[(i * n) + k] * b[k];
    }
    b[i] = sum / l[(i * n) + i];
  }

  for (std::size_t i = n; i-- > 0;) {
    double sum = b[i];
    for (std::size_t k = i + 1; k < n; ++k) {
      sum -= l[(k * n) + i] * b[k];
    }
    b[i] = sum / l[(i * n) + i];
  }
}

bool cholesky_solve(std::vector<double>& a, const std::size_t n, std::vector<double>& b) {
  if (b.size() != n || !cholesky_factor(a, n)) {
    return false;
  }
  cholesky_substitute(a, n, b);
  return true;
}

bool fit_ridge(const std::vector<TrainingExample>& train, const std::size_t classes, const std::size_t state_dim,
               const double lambda, std::vector<double>& weights) {
  if (train.empty() || classes == 0 || state_dim == 0) {
    return false;
  }

  const std::size_t n = state_dim + 1U;
  std::vector<double> gram(n * n, 0.0);
  std::vector<double> cross(classes * n, 0.0);
  std::vector<double> row(n, 1.0);

  for (const auto& example : train) {
    for (std::size_t j = 0; j < state_dim; ++j) {
      row[j] = j < example.state.size() ? example.state[j] : 0.0;
    }
    for (std::size_t i = 0; i < n; ++i) {
      for (std::size_t j = 0; j <= i; ++j) {
        gram[(i * n) + j] += row[i] * row[j];
      }
    }
    if (example.label >= 0 && static_cast<std::size_t>(example.label) < classes) {
      double* target = cross.data() + (static_cast<std::size_t>(example.label) * n);
      for (std::size_t i = 0; i < n; ++i) {
        target[i] += row[i];
      }
    }
  }

  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = 0; j < i; ++j) {
      gram[(j * n) + i] = gram[(i * n) + j];
    }
  }
  for (std::size_t i = 0; i < state_dim; ++i) {
    gram[(i * n) + i] += lambda;
  }
  // Tiny jitter on the bias keeps a constant-feature design solvable.
  gram[(state_dim * n) + state_dim] += 1e-9;

  if (!cholesky_factor(gram, n)) {
    return false;
  }

  std::vector<double> solved(classes * n, 0.0);
  for (std::size_t k = 0; k < classes; ++k) {
    std::vector<double> rhs(cross.begin() + static_cast<std::ptrdiff_t>(k * n),
                            cross.begin() + static_cast<std::ptrdiff_t>((k + 1U) * n));
    cholesky_substitute(gram, n, rhs);
    std::copy(rhs.begin(), rhs.end(), solved.begin() + static_cast<std::ptrdiff_t>(k * n));
  }

  weights = std::move(solved);
  return true;
}

}  // namespace res_agent::training
