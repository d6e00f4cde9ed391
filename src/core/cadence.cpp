#include "core/cadence.hpp"

namespace ups_sentinel::core {

std::uint64_t TickCadence::tick() const noexcept { return tick_count_; }

bool TickCadence::due_every(const std::uint64_t every_n_ticks) const noexcept {
  if (every_n_ticks == 0) {
    return false;
  }
  return (tick_count_ % every_n_ticks) == 0;
}

void TickCadence::advance() noexcept { ++tick_count_; }

}  // namespace ups_sentinel::core
