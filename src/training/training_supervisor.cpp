#include "training/training_supervisor.hpp"

#include <iostream>
#include <utility>

#include "core/timestamp.hpp"
#include "training/metrics.hpp"
#include "training/model_store.hpp"
#include "training/ridge.hpp"

namespace res_agent::training {

const char* to_string(const TrainOutcome outcome) noexcept {
  switch (outcome) {
    case TrainOutcome::kNotDue:
      return "not_due";
    case TrainOutcome::kPublished:
      return "published";
    case TrainOutcome::kEmptySplit:
      return "empty_split";
    case TrainOutcome::kSolveFailed:
      return "solve_failed";
  }
  return "unknown";
}

TrainingSupervisor::TrainingSupervisor(TrainingConfig config, const std::size_t state_dim,
                                       std::shared_ptr<model::ModelHolder> holder)
    : config_(std::move(config)), state_dim_(state_dim), holder_(std::move(holder)), buffer_(config_.capacity) {}

bool TrainingSupervisor::record(const std::vector<double>& state, const int label) {
  if (state.size() != state_dim_ || label < 0 || static_cast<std::size_t>(label) >= config_.classes) {
    return false;
  }
  buffer_.push(TrainingExample{state, label, Split::TRAIN});
  return true;
}

bool TrainingSupervisor::due(const Clock::time_point now) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!started_) {
    return false;
  }
  const std::uint64_t fresh = buffer_.total_pushed() - pushed_at_last_cycle_;
  if (config_.every_examples > 0 && fresh >= config_.every_examples) {
    return true;
  }
  return config_.every.count() > 0 && (now - last_cycle_) >= config_.every && fresh > 0;
}

TrainOutcome TrainingSupervisor::maybe_train(const Clock::time_point now) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) {
      // The time trigger counts from the first poll.
      started_ = true;
      last_cycle_ = now;
      return TrainOutcome::kNotDue;
    }
  }
  if (!due(now)) {
    return TrainOutcome::kNotDue;
  }
  return train_once(now);
}

TrainOutcome TrainingSupervisor::train_once(const Clock::time_point now) {
  auto examples = buffer_.snapshot();
  Publisher publisher;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    started_ = true;
    last_cycle_ = now;
    pushed_at_last_cycle_ = buffer_.total_pushed();
    publisher = publisher_;
  }

  const auto finish = [this](const TrainOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_outcome_ = outcome;
    return outcome;
  };

  std::vector<TrainingExample> train;
  std::vector<TrainingExample> test;
  split_examples(std::move(examples), config_.train_ratio, train, test);
  if (train.empty() || test.empty()) {
    std::cerr << "[trainer] skipping cycle: empty split (train=" << train.size() << ", test=" << test.size()
              << "); keeping current readout\n";
    return finish(TrainOutcome::kEmptySplit);
  }

  model::ReadoutModel next{};
  next.outputs = static_cast<std::uint16_t>(config_.classes);
  next.inputs = static_cast<std::uint16_t>(state_dim_ + 1U);
  if (!fit_ridge(train, config_.classes, state_dim_, config_.ridge_lambda, next.weights)) {
    std::cerr << "[trainer] ridge solve failed on " << train.size() << " examples; keeping current readout\n";
    return finish(TrainOutcome::kSolveFailed);
  }

  next.metrics = evaluate(next, test, config_.classes);
  next.metrics.train_size = static_cast<std::uint32_t>(train.size());
  next.metrics.test_size = static_cast<std::uint32_t>(test.size());
  next.trained_at_ms = core::unix_timestamp_now_ns() / 1'000'000ULL;

  const auto previous = holder_->current();
  next.updates_performed = (previous != nullptr ? previous->updates_performed : 0U) + 1U;
  holder_->publish(next);

  std::cerr << "[trainer] readout #" << next.updates_performed << " published: accuracy=" << next.metrics.accuracy
            << " precision=" << next.metrics.precision << " recall=" << next.metrics.recall
            << " f1=" << next.metrics.f1 << " train=" << next.metrics.train_size
            << " test=" << next.metrics.test_size << '\n';

  if (!config_.model_path.empty() && !save_model(config_.model_path, next)) {
    std::cerr << "[trainer] readout #" << next.updates_performed << " kept in memory only\n";
  }
  if (publisher) {
    publisher(next);
  }
  return finish(TrainOutcome::kPublished);
}

void TrainingSupervisor::set_publisher(Publisher publisher) {
  std::lock_guard<std::mutex> lock(mutex_);
  publisher_ = std::move(publisher);
}

TrainOutcome TrainingSupervisor::last_outcome() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_outcome_;
}

}  // namespace res_agent::training
