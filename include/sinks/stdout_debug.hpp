#pragma once

#include "model/telemetry_frame.hpp"

namespace res_agent::sinks {

class StdoutDebugSink {
 public:
  void publish(const model::telemetry_frame& frame) const;
};

}  // namespace res_agent::sinks
