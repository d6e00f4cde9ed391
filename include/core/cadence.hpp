#pragma once

#include <cstdint>

namespace ups_sentinel::core {

// Counts poll ticks and answers "is a task with period N due on this tick".
class TickCadence {
 public:
  TickCadence() = default;

  [[nodiscard]] std::uint64_t tick() const noexcept;

  // Period 0 disables the task.
  [[nodiscard]] bool due_every(std::uint64_t every_n_ticks) const noexcept;

  void advance() noexcept;

 private:
  std::uint64_t tick_count_{0};
};

}  // namespace ups_sentinel::core
