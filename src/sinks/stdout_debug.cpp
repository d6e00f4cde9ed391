#include "sinks/stdout_debug.hpp"

#include <cstdio>
#include <string>

namespace ups_sentinel::sinks {

void StdoutDebugSink::publish(const model::ups_sample& sample, const model::agent_health& health) const {
  const std::string status(model::to_string(sample.status));
  std::printf("[raw] ts=%lld status=%s charge_pct=%.1f load_pct=%.1f runtime_s=%lld compute_ms=%.2f\n",
              static_cast<long long>(sample.timestamp_ms), status.c_str(), sample.charge_pct, sample.load_pct,
              static_cast<long long>(sample.runtime_estimate_s.value_or(-1)), health.compute_time_ms);
}

}  // namespace ups_sentinel::sinks
