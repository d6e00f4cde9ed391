#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace ups_sentinel::control {

enum class AttemptResult {
  kSuccess,
  kFailed,
  // No answer within the timeout; the command may still have been delivered.
  kTimedOut,
};

const char* to_string(AttemptResult result) noexcept;

// One attempt at shutting a host down. Implementations block for at most `timeout`
// and must be safe to call concurrently for different targets.
class RemoteAction {
 public:
  virtual AttemptResult execute(const std::string& target, std::chrono::milliseconds timeout) = 0;
  virtual ~RemoteAction() = default;
};

struct SshActionOptions {
  std::string ssh_binary{"ssh"};
  std::string remote_command{"sudo -n systemctl poweroff"};
};

// `ssh -o BatchMode=yes -o ConnectTimeout=<n> <target> <command>`.
class SshShutdownAction : public RemoteAction {
 public:
  explicit SshShutdownAction(SshActionOptions options);

  AttemptResult execute(const std::string& target, std::chrono::milliseconds timeout) override;

 private:
  SshActionOptions options_;
};

std::shared_ptr<RemoteAction> make_ssh_shutdown_action(SshActionOptions options);

}  // namespace ups_sentinel::control
