#include "control/remote_action.hpp"

#include <algorithm>
#include <iostream>
#include <utility>
#include <vector>

#include "core/process.hpp"

namespace ups_sentinel::control {

const char* to_string(const AttemptResult result) noexcept {
  switch (result) {
    case AttemptResult::kSuccess:
      return "success";
    case AttemptResult::kFailed:
      return "failed";
    case AttemptResult::kTimedOut:
      return "timed out";
  }
  return "unknown";
}

SshShutdownAction::SshShutdownAction(SshActionOptions options) : options_(std::move(options)) {}

AttemptResult SshShutdownAction::execute(const std::string& target, const std::chrono::milliseconds timeout) {
  // Leave ssh room to report a connect failure before the hard kill.
  const auto connect_timeout_s = std::max<long long>(1, (timeout.count() / 1000) / 2);

  const std::vector<std::string> argv = {
      options_.ssh_binary,
      "-o",
      "BatchMode=yes",
      "-o",
      "ConnectTimeout=" + std::to_string(connect_timeout_s),
      target,
      options_.remote_command,
  };

  const core::ProcessResult result = core::run_process(argv, timeout);
  if (result.timed_out) {
    return AttemptResult::kTimedOut;
  }
  if (!result.succeeded()) {
    std::cerr << "[shutdown] " << target << ": ssh exit " << result.exit_code;
    if (!result.output.empty()) {
      const auto newline = result.output.find('\n');
      std::cerr << ": " << result.output.substr(0, newline);
    }
    std::cerr << '\n';
    return AttemptResult::kFailed;
  }
  return AttemptResult::kSuccess;
}

std::shared_ptr<RemoteAction> make_ssh_shutdown_action(SshActionOptions options) {
  return std::make_shared<SshShutdownAction>(std::move(options));
}

}  // namespace ups_sentinel::control
