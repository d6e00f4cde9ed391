#pragma once

#include "model/agent_health.hpp"
#include "model/ups_sample.hpp"

namespace ups_sentinel::sinks {

class StdoutDebugSink {
 public:
  void publish(const model::ups_sample& sample, const model::agent_health& health) const;
};

}  // namespace ups_sentinel::sinks
