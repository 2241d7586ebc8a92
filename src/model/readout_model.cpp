#include "model/readout_model.hpp"

#include <algorithm>

namespace res_agent::model {

std::vector<double> ReadoutModel::predict(const std::vector<double>& state) const {
  std::vector<double> scores(outputs, 0.0);
  if (!valid()) {
    return scores;
  }

  const std::size_t features = std::min<std::size_t>(state.size(), static_cast<std::size_t>(inputs) - 1U);
  for (std::size_t k = 0; k < outputs; ++k) {
    const double* row = weights.data() + (k * inputs);
    double sum = row[inputs - 1U];
    for (std::size_t j = 0; j < features; ++j) {
      sum += row[j] * state[j];
    }
    scores[k] = sum;
  }
  return scores;
}

std::size_t ReadoutModel::predict_class(const std::vector<double>& state) const {
  const auto scores = predict(state);
  if (scores.empty()) {
    return 0;
  }
  return static_cast<std::size_t>(std::distance(scores.begin(), std::max_element(scores.begin(), scores.end())));
}

bool ReadoutModel::valid() const noexcept {
  return outputs > 0 && inputs > 0 &&
         weights.size() == static_cast<std::size_t>(outputs) * static_cast<std::size_t>(inputs);
}

ReadoutModel ReadoutModel::passthrough(const std::size_t outputs, const std::size_t state_dim) {
  ReadoutModel model{};
  model.outputs = static_cast<std::uint16_t>(outputs);
  model.inputs = static_cast<std::uint16_t>(state_dim + 1U);
  model.weights.assign(outputs * model.inputs, 0.0);

  // Maps a state component in [-1, 1] to a score in [0, 1].
  for (std::size_t k = 0; k < outputs; ++k) {
    if (k < state_dim) {
      model.weights[(k * model.inputs) + k] = 0.5;
    }
    model.weights[(k * model.inputs) + state_dim] = 0.5;
  }
  return model;
}

}  // namespace res_agent::model
