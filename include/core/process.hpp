#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace ups_sentinel::core {

struct ProcessResult {
  bool spawned{false};
  bool timed_out{false};
  // Exit status when the child exited normally, -1 otherwise.
  int exit_code{-1};
  // Combined stdout and stderr, truncated to kMaxCapturedOutput bytes.
  std::string output{};

  [[nodiscard]] bool succeeded() const noexcept { return spawned && !timed_out && exit_code == 0; }
};

inline constexpr std::size_t kMaxCapturedOutput = 64U * 1024U;

// Runs argv[0] (searched in PATH) and waits for it at most `timeout`.
// A child still running at the deadline is killed and reaped before returning.
ProcessResult run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

}  // namespace ups_sentinel::core
