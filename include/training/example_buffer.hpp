#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace res_agent::training {

enum class Split : std::uint8_t {
  TRAIN = 0,
  TEST = 1,
};

struct TrainingExample {
  std::vector<double> state;
  int label{0};
  Split split{Split::TRAIN};
};

// Bounded, arrival-ordered buffer; the oldest example is evicted on overflow.
// One producer (the node loop) and one consumer (the trainer). Examples are immutable once pushed, so
// the lock covers a pointer push or a pointer copy; snapshots copy state vectors outside it.
class ExampleBuffer {
 public:
  explicit ExampleBuffer(std::size_t capacity);

  // Returns false when an older example had to be evicted.
  bool push(TrainingExample example);

  [[nodiscard]] std::vector<TrainingExample> snapshot() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  [[nodiscard]] std::uint64_t total_pushed() const;
  [[nodiscard]] std::uint64_t evicted() const;

 private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<std::shared_ptr<const TrainingExample>> examples_;
  std::uint64_t total_pushed_{0};
  std::uint64_t evicted_{0};
};

// First floor(size * train_ratio) examples train, the rest test. Order is preserved.
void split_examples(std::vector<TrainingExample> examples, double train_ratio, std::vector<TrainingExample>& train,
                    std::vector<TrainingExample>& test);

}  // namespace res_agent::training
