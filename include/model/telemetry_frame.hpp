#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace res_agent::model {

enum class node_state : std::uint8_t {
    IDLE = 0,
    AWAITING_INPUT = 1,
    UPDATING = 2,
    FORWARDING = 3,
    SHUT_DOWN = 4,
};

inline constexpr std::size_t kCubeServoCount = 5;

// ABI frame shared across modules.
// POD layout: one timestamp + tightly packed per-tick signals.
struct telemetry_frame {
    struct AgentHealth {
        std::uint64_t heartbeat_ms;
        float loop_jitter_ms;
        float compute_time_ms;
        float redis_latency_ms;
        std::uint32_t redis_errors;
        std::uint32_t missed_cycles;
    };

    struct LinkCounters {
        std::uint64_t sent;
        std::uint64_t retransmits;
        std::uint64_t acked;
        std::uint64_t exhausted;
        std::uint64_t duplicates;
        std::uint64_t gap_skips;
        std::uint64_t decode_errors;
        std::uint32_t queue_depth;
    };

    std::uint64_t timestamp;

    // Reservoir.
    float state_norm;
    float state_mean;
    std::uint32_t state_sequence;
    std::uint32_t degraded_reemits;
    node_state state;

    LinkCounters link;

    // Readout training.
    float accuracy;
    float precision;
    float recall;
    float f1;
    std::uint32_t train_size;
    std::uint32_t test_size;
    std::uint32_t updates_performed;
    std::uint32_t examples_buffered;

    // Actuation.
    float servo_angle[kCubeServoCount];
    float clock_angle;
    std::int32_t wave_level;
    std::uint32_t actuator_failures;

    AgentHealth agent;
};

static_assert(std::is_standard_layout_v<telemetry_frame>, "telemetry_frame must be standard layout");
static_assert(std::is_trivial_v<telemetry_frame>, "telemetry_frame must be trivial");

} // namespace res_agent::model
