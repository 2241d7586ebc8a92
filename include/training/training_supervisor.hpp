#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "model/model_holder.hpp"
#include "model/readout_model.hpp"
#include "training/example_buffer.hpp"

namespace res_agent::training {

using Clock = std::chrono::steady_clock;

struct TrainingConfig {
  bool enabled{false};
  std::size_t classes{2};
  std::size_t capacity{2000};
  double train_ratio{0.7};
  double ridge_lambda{1e-3};
  std::size_t every_examples{200};
  std::chrono::milliseconds every{std::chrono::seconds(30)};
  double activity_min{20.0};
  double activity_max{127.0};
  std::string model_path{};
};

enum class TrainOutcome : std::uint8_t {
  kNotDue = 0,
  kPublished,
  kEmptySplit,
  kSolveFailed,
};

const char* to_string(TrainOutcome outcome) noexcept;

// Fits the readout from buffered (state, label) pairs and swaps it into the shared holder.
class TrainingSupervisor {
 public:
  using Publisher = std::function<void(const model::ReadoutModel&)>;

  TrainingSupervisor(TrainingConfig config, std::size_t state_dim, std::shared_ptr<model::ModelHolder> holder);

  // Producer side. Examples with a wrong dimension or an out-of-range label are ignored.
  bool record(const std::vector<double>& state, int label);

  // Count or time trigger, whichever comes first.
  [[nodiscard]] bool due(Clock::time_point now) const;

  TrainOutcome maybe_train(Clock::time_point now);
  TrainOutcome train_once(Clock::time_point now);

  // Called with every published model, after the local swap.
  void set_publisher(Publisher publisher);

  [[nodiscard]] const ExampleBuffer& buffer() const noexcept { return buffer_; }
  [[nodiscard]] const TrainingConfig& config() const noexcept { return config_; }
  [[nodiscard]] TrainOutcome last_outcome() const;

 private:
  TrainingConfig config_;
  std::size_t state_dim_;
  std::shared_ptr<model::ModelHolder> holder_;
  ExampleBuffer buffer_;

  mutable std::mutex mutex_;
  Publisher publisher_{};
  std::uint64_t pushed_at_last_cycle_{0};
  Clock::time_point last_cycle_{};
  bool started_{false};
  TrainOutcome last_outcome_{TrainOutcome::kNotDue};
};

}  // namespace res_agent::training
