#pragma once

#include <cstddef>
#include <vector>

#include "model/readout_model.hpp"
#include "training/example_buffer.hpp"

namespace res_agent::training {

// Two classes: metrics of the positive class (1). More: macro average over the classes
// that occur in either truth or prediction. Zero denominators count as 0.
model::ReadoutMetrics classification_metrics(const std::vector<int>& truth, const std::vector<int>& predicted,
                                             std::size_t classes);

model::ReadoutMetrics evaluate(const model::ReadoutModel& model, const std::vector<TrainingExample>& test,
                               std::size_t classes);

}  // namespace res_agent::training
