#pragma once

#include <cstdint>
#include <type_traits>

namespace ups_sentinel::model {

// Poll-loop self-observation, exported next to every sample.
struct agent_health {
    std::int64_t heartbeat_ms;
    float loop_jitter_ms;
    float compute_time_ms;
    float redis_latency_ms;
    std::uint32_t redis_errors;
    std::uint32_t poll_failures;
    std::uint32_t store_violations;
    std::uint32_t missed_cycles;
};

static_assert(std::is_trivial_v<agent_health>, "agent_health must be trivial");

} // namespace ups_sentinel::model
