#include "model/model_holder.hpp"

#include <utility>

namespace res_agent::model {

ModelHolder::ModelHolder(ReadoutModel initial)
    : current_(std::make_shared<const ReadoutModel>(std::move(initial))) {}

std::shared_ptr<const ReadoutModel> ModelHolder::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

void ModelHolder::publish(ReadoutModel next) {
  auto replacement = std::make_shared<const ReadoutModel>(std::move(next));
  std::lock_guard<std::mutex> lock(mutex_);
  current_.swap(replacement);
}

}  // namespace res_agent::model
