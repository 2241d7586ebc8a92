#include "training/example_buffer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace res_agent::training {

ExampleBuffer::ExampleBuffer(const std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1U)) {}

bool ExampleBuffer::push(TrainingExample example) {
  auto shared = std::make_shared<const TrainingExample>(std::move(example));

  std::lock_guard<std::mutex> lock(mutex_);
  bool kept_all = true;
  if (examples_.size() >= capacity_) {
    examples_.pop_front();
    ++evicted_;
    kept_all = false;
  }
  examples_.push_back(std::move(shared));
  ++total_pushed_;
  return kept_all;
}

std::vector<TrainingExample> ExampleBuffer::snapshot() const {
  std::vector<std::shared_ptr<const TrainingExample>> shared;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shared.assign(examples_.begin(), examples_.end());
  }

  std::vector<TrainingExample> copy;
  copy.reserve(shared.size());
  for (const auto& example : shared) {
    copy.push_back(*example);
  }
  return copy;
}

std::size_t ExampleBuffer::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return examples_.size();
}

std::uint64_t ExampleBuffer::total_pushed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_pushed_;
}

std::uint64_t ExampleBuffer::evicted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return evicted_;
}

void split_examples(std::vector<TrainingExample> examples, const double train_ratio,
                    std::vector<TrainingExample>& train, std::vector<TrainingExample>& test) {
  const double ratio = std::clamp(train_ratio, 0.0, 1.0);
  const auto train_count = static_cast<std::size_t>(std::floor(static_cast<double>(examples.size()) * ratio));

  train.clear();
  test.clear();
  train.reserve(train_count);
  test.reserve(examples.size() - train_count);
  for (std::size_t i = 0; i < examples.size(); ++i) {
    if (i < train_count) {
      examples[i].split = Split::TRAIN;
      train.push_back(std::move(examples[i]));
    } else {
      examples[i].split = Split::TEST;
      test.push_back(std::move(examples[i]));
    }
  }
}

}  // namespace res_agent::training
