#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace res_agent::sinks {

void StdoutDebugSink::publish(const model::telemetry_frame& frame) const {
  std::printf("[tick] state=%u seq=%u norm=%.4f mean=%.4f link.sent=%llu link.acked=%llu link.gaps=%llu "
              "readout#%u acc=%.3f f1=%.3f servo=[%.1f %.1f %.1f %.1f %.1f] clock=%.1f wave=%d\n",
              static_cast<unsigned>(frame.state), frame.state_sequence, frame.state_norm, frame.state_mean,
              static_cast<unsigned long long>(frame.link.sent), static_cast<unsigned long long>(frame.link.acked),
              static_cast<unsigned long long>(frame.link.gap_skips), frame.updates_performed, frame.accuracy,
              frame.f1, frame.servo_angle[0], frame.servo_angle[1], frame.servo_angle[2], frame.servo_angle[3],
              frame.servo_angle[4], frame.clock_angle, frame.wave_level);
}

}  // namespace res_agent::sinks
