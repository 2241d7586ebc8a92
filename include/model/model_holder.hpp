#pragma once

#include <memory>
#include <mutex>

#include "model/readout_model.hpp"

namespace res_agent::model {

// Shared-read, single-writer slot for the active readout.
// Readers keep the snapshot they took alive across a swap.
class ModelHolder {
 public:
  explicit ModelHolder(ReadoutModel initial);

  [[nodiscard]] std::shared_ptr<const ReadoutModel> current() const;
  void publish(ReadoutModel next);

 private:
  mutable std::mutex mutex_;
  std::shared_ptr<const ReadoutModel> current_;
};

}  // namespace res_agent::model
