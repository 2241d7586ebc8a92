#include "training/metrics.hpp"

#include <algorithm>

namespace res_agent::training {
namespace {

double ratio(const double numerator, const double denominator) {
  return denominator > 0.0 ? numerator / denominator : 0.0;
}

double harmonic(const double precision, const double recall) {
  return ratio(2.0 * precision * recall, precision + recall);
}

}  // namespace

model::ReadoutMetrics classification_metrics(const std::vector<int>& truth, const std::vector<int>& predicted,
                                             const std::size_t classes) {
  model::ReadoutMetrics metrics{};
  const std::size_t total = std::min(truth.size(), predicted.size());
  if (total == 0 || classes == 0) {
    return metrics;
  }

  std::vector<double> tp(classes, 0.0);
  std::vector<double> fp(classes, 0.0);
  std::vector<double> fn(classes, 0.0);
  std::vector<bool> seen(classes, false);
  double correct = 0.0;

  const auto in_range = [classes](const int label) {
    return label >= 0 && static_cast<std::size_t>(label) < classes;
  };

  for (std::size_t i = 0; i < total; ++i) {
    const int t = truth[i];
    const int p = predicted[i];
    if (t == p) {
      correct += 1.0;
    }
    if (in_range(t)) {
      seen[static_cast<std::size_t>(t)] = true;
    }
    if (in_range(p)) {
      seen[static_cast<std::size_t>(p)] = true;
    }
    if (t == p && in_range(t)) {
      tp[static_cast<std::size_t>(t)] += 1.0;
      continue;
    }
    if (in_range(p)) {
      fp[static_cast<std::size_t>(p)] += 1.0;
    }
    if (in_range(t)) {
      fn[static_cast<std::size_t>(t)] += 1.0;
    }
  }

  metrics.accuracy = correct / static_cast<double>(total);

  if (classes == 2) {
    metrics.precision = ratio(tp[1], tp[1] + fp[1]);
    metrics.recall = ratio(tp[1], tp[1] + fn[1]);
    metrics.f1 = harmonic(metrics.precision, metrics.recall);
    return metrics;
  }

  double counted = 0.0;
  for (std::size_t c = 0; c < classes; ++c) {
    if (!seen[c]) {
      continue;
    }
    const double precision = ratio(tp[c], tp[c] + fp[c]);
    const double recall = ratio(tp[c], tp[c] + fn[c]);
    metrics.precision += precision;
    metrics.recall += recall;
    metrics.f1 += harmonic(precision, recall);
    counted += 1.0;
  }
  if (counted > 0.0) {
    metrics.precision /= counted;
    metrics.recall /= counted;
    metrics.f1 /= counted;
  }
  return metrics;
}

model::ReadoutMetrics evaluate(const model::ReadoutModel& model, const std::vector<TrainingExample>& test,
                               const std::size_t classes) {
  std::vector<int> truth;
  std::vector<int> predicted;
  truth.reserve(test.size());
  predicted.reserve(test.size());
  for (const auto& example : test) {
    truth.push_back(example.label);
    predicted.push_back(static_cast<int>(model.predict_class(example.state)));
  }
  return classification_metrics(truth, predicted, classes);
}

}  // namespace res_agent::training
