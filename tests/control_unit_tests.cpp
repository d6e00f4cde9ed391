#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

#include <unistd.h>

#include "control/remote_action.hpp"
#include "control/shutdown_controller.hpp"
#include "core/process.hpp"
#include "model/shutdown_event.hpp"
#include "model/ups_sample.hpp"
#include "storage/event_log.hpp"

using ups_sentinel::control::AttemptResult;
using ups_sentinel::control::ControllerObserver;
using ups_sentinel::control::ControllerOptions;
using ups_sentinel::control::HostState;
using ups_sentinel::control::RemoteAction;
using ups_sentinel::control::ShutdownController;
using ups_sentinel::control::SshActionOptions;
using ups_sentinel::control::SshShutdownAction;
using ups_sentinel::core::run_process;
using ups_sentinel::model::shutdown_event;
using ups_sentinel::model::shutdown_outcome;
using ups_sentinel::model::ups_sample;
using ups_sentinel::model::ups_status;
using ups_sentinel::storage::EventLog;

namespace {

using namespace std::chrono_literals;

constexpr std::int64_t kBase = 1'700'000'000'000LL;

class TempDir {
 public:
  explicit TempDir(const std::string& name) {
    dir_ = std::filesystem::temp_directory_path() /
           ("ups-sentinel-control-" + std::to_string(::getpid()) + "-" + name);
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  [[nodiscard]] std::string file(const std::string& name) const { return (dir_ / name).string(); }

 private:
  std::filesystem::path dir_;
};

// Replays scripted results per target; a held target blocks inside execute() until released.
class ScriptedAction : public RemoteAction {
 public:
  void script(const std::string& target, std::vector<AttemptResult> results, const bool hold = false) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = scripts_[target];
    entry.results = std::move(results);
    entry.hold = hold;
  }

  AttemptResult execute(const std::string& target, std::chrono::milliseconds /*timeout*/) override {
    std::unique_lock<std::mutex> lock(mutex_);
    auto& entry = scripts_[target];
    ++entry.calls;
    cv_.notify_all();
    cv_.wait(lock, [&entry] { return !entry.hold; });

    if (entry.results.empty()) {
      return AttemptResult::kSuccess;
    }
    const std::size_t index = entry.next < entry.results.size() ? entry.next : entry.results.size() - 1;
    ++entry.next;
    return entry.results[index];
  }

  void release(const std::string& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripts_[target].hold = false;
    cv_.notify_all();
  }

  bool wait_for_calls(const std::string& target, const std::size_t count, const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return scripts_[target].calls >= count; });
  }

  std::size_t calls(const std::string& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    return scripts_[target].calls;
  }

 private:
  struct Script {
    std::vector<AttemptResult> results{};
    std::size_t next{0};
    std::size_t calls{0};
    bool hold{false};
  };

  std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<std::string, Script> scripts_{};
};

struct Recorder {
  struct Transition {
    std::string host;
    HostState from;
    HostState to;
  };

  std::mutex mutex;
  std::vector<Transition> transitions{};
  std::vector<shutdown_event> outcomes{};

  ControllerObserver observer() {
    return ControllerObserver{
        [this](const std::string& host, const HostState from, const HostState to) {
          std::lock_guard<std::mutex> lock(mutex);
          transitions.push_back(Transition{host, from, to});
        },
        [this](const shutdown_event& event) {
          std::lock_guard<std::mutex> lock(mutex);
          outcomes.push_back(event);
        }};
  }

  std::size_t count(const HostState from, const HostState to) {
    std::lock_guard<std::mutex> lock(mutex);
    std::size_t n = 0;
    for (const auto& t : transitions) {
      if (t.from == from && t.to == to) {
        ++n;
      }
    }
    return n;
  }

  std::size_t outcome_count() {
    std::lock_guard<std::mutex> lock(mutex);
    return outcomes.size();
  }

  // Outcome notices are published after the worker leaves the in-flight state.
  bool wait_for_outcomes(const std::size_t count) {
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (std::chrono::steady_clock::now() < deadline) {
      if (outcome_count() >= count) {
        return true;
      }
      std::this_thread::sleep_for(2ms);
    }
    return false;
  }
};

ControllerOptions fast_options(std::vector<std::string> targets, const std::uint32_t max_attempts = 3) {
  ControllerOptions options{};
  options.threshold_pct = 20.0F;
  options.hysteresis_pct = 5.0F;
  options.max_attempts = max_attempts;
  options.backoff = 5ms;
  options.backoff_multiplier = 2.0F;
  options.attempt_timeout = 1000ms;
  options.targets = std::move(targets);
  return options;
}

ups_sample on_battery(const std::int64_t ts, const float charge) {
  ups_sample sample{};
  sample.timestamp_ms = ts;
  sample.status = ups_status::ON_BATTERY;
  sample.charge_pct = charge;
  sample.load_pct = 40.0F;
  return sample;
}

ups_sample on_line(const std::int64_t ts, const float charge) {
  ups_sample sample = on_battery(ts, charge);
  sample.status = ups_status::ON_LINE;
  return sample;
}

bool wait_for_state(ShutdownController& controller, const std::string& host, const HostState expected) {
  const auto deadline = std::chrono::steady_clock::now() + 3s;
  while (std::chrono::steady_clock::now() < deadline) {
    if (controller.state(host) == expected) {
      return true;
    }
    std::this_thread::sleep_for(2ms);
  }
  return false;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

int test_low_charge_triggers_exactly_once() {
  TempDir dir("once");
  EventLog events(dir.file("state.db"));
  auto action = std::make_shared<ScriptedAction>();
  Recorder recorder;
  ShutdownController controller(fast_options({"nas"}), action, events, recorder.observer());

  controller.evaluate(on_battery(kBase, 25.0F));
  if (controller.state("nas") != HostState::NORMAL) {
    return fail("test_low_charge_triggers_exactly_once", "25% must not arm");
  }

  controller.evaluate(on_battery(kBase + 1000, 19.0F));
  controller.evaluate(on_battery(kBase + 2000, 15.0F));
  if (!controller.wait_until_idle(3s)) {
    return fail("test_low_charge_triggers_exactly_once", "worker did not finish");
  }
  controller.evaluate(on_battery(kBase + 3000, 12.0F));

  if (recorder.count(HostState::NORMAL, HostState::ARMED) != 1 ||
      recorder.count(HostState::ARMED, HostState::TRIGGERING) != 1) {
    return fail("test_low_charge_triggers_exactly_once", "NORMAL->ARMED->TRIGGERING must happen once");
  }
  if (action->calls("nas") != 1) {
    return fail("test_low_charge_triggers_exactly_once", "exactly one remote action expected");
  }
  if (controller.state("nas") != HostState::COOLDOWN) {
    return fail("test_low_charge_triggers_exactly_once", "completed action must leave the host in COOLDOWN");
  }

  const auto history = events.history();
  if (history.size() != 1 || history.front().outcome != shutdown_outcome::SUCCESS ||
      history.front().attempts != 1 || history.front().charge_at_trigger != 19.0F) {
    return fail("test_low_charge_triggers_exactly_once", "event must record one successful attempt at 19%");
  }

  return 0;
}

int test_retries_with_backoff_until_success() {
  TempDir dir("retry");
  EventLog events(dir.file("state.db"));
  auto action = std::make_shared<ScriptedAction>();
  action->script("nas", {AttemptResult::kFailed, AttemptResult::kFailed, AttemptResult::kSuccess});
  ShutdownController controller(fast_options({"nas"}), action, events);

  const auto start = std::chrono::steady_clock::now();
  controller.evaluate(on_battery(kBase, 10.0F));
  if (!controller.wait_until_idle(3s)) {
    return fail("test_retries_with_backoff_until_success", "worker did not finish");
  }
  const auto elapsed = std::chrono::steady_clock::now() - start;

  if (action->calls("nas") != 3) {
    return fail("test_retries_with_backoff_until_success", "two failures then success expected");
  }
  if (elapsed < 15ms) {
    return fail("test_retries_with_backoff_until_success", "backoff 5ms then 10ms must be honored");
  }
  const auto history = events.history();
  if (history.size() != 1 || history.front().outcome != shutdown_outcome::SUCCESS || history.front().attempts != 3) {
    return fail("test_retries_with_backoff_until_success", "outcome must be SUCCESS after three attempts");
  }

  return 0;
}

int test_exhausted_attempts_report_failure_without_rearming() {
  TempDir dir("exhausted");
  EventLog events(dir.file("state.db"));
  auto action = std::make_shared<ScriptedAction>();
  action->script("nas", {AttemptResult::kFailed});
  Recorder recorder;
  ShutdownController controller(fast_options({"nas"}), action, events, recorder.observer());

  controller.evaluate(on_battery(kBase, 18.0F));
  if (!controller.wait_until_idle(3s)) {
    return fail("test_exhausted_attempts_report_failure_without_rearming", "worker did not finish");
  }

  controller.evaluate(on_battery(kBase + 1000, 17.0F));
  controller.evaluate(on_battery(kBase + 2000, 16.0F));
  if (!controller.wait_until_idle(1s)) {
    return fail("test_exhausted_attempts_report_failure_without_rearming", "unexpected work after exhaustion");
  }

  if (action->calls("nas") != 3) {
    return fail("test_exhausted_attempts_report_failure_without_rearming", "bounded to max_attempts");
  }
  if (!recorder.wait_for_outcomes(1) || recorder.outcome_count() != 1 ||
      recorder.outcomes.front().outcome != shutdown_outcome::FAILURE) {
    return fail("test_exhausted_attempts_report_failure_without_rearming", "FAILURE must be reported once");
  }
  if (controller.state("nas") != HostState::COOLDOWN) {
    return fail("test_exhausted_attempts_report_failure_without_rearming", "must stay in COOLDOWN while low");
  }

  return 0;
}

int test_timed_out_last_attempt_is_unknown() {
  TempDir dir("timeout");
  EventLog events(dir.file("state.db"));
  auto action = std::make_shared<ScriptedAction>();
  action->script("nas", {AttemptResult::kFailed, AttemptResult::kTimedOut});
  ShutdownController controller(fast_options({"nas"}, 2), action, events);

  controller.evaluate(on_battery(kBase, 18.0F));
  if (!controller.wait_until_idle(3s)) {
    return fail("test_timed_out_last_attempt_is_unknown", "worker did not finish");
  }

  const auto history = events.history();
  if (history.size() != 1 || history.front().outcome != shutdown_outcome::UNKNOWN || history.front().attempts != 2) {
    return fail("test_timed_out_last_attempt_is_unknown", "timed out final attempt must be UNKNOWN");
  }

  return 0;
}

int test_recovery_during_attempt_suppresses_retries() {
  TempDir dir("recovery");
  EventLog events(dir.file("state.db"));
  auto action = std::make_shared<ScriptedAction>();
  action->script("nas", {AttemptResult::kFailed}, true);
  Recorder recorder;
  ShutdownController controller(fast_options({"nas"}), action, events, recorder.observer());

  controller.evaluate(on_battery(kBase, 19.0F));
  if (!action->wait_for_calls("nas", 1, 3s)) {
    return fail("test_recovery_during_attempt_suppresses_retries", "attempt never started");
  }

  controller.evaluate(on_line(kBase + 1000, 19.5F));
  if (controller.state("nas") != HostState::COOLDOWN) {
    return fail("test_recovery_during_attempt_suppresses_retries", "recovery must move TRIGGERING to COOLDOWN");
  }

  controller.evaluate(on_line(kBase + 2000, 20.0F));
  if (controller.state("nas") != HostState::COOLDOWN) {
    return fail("test_recovery_during_attempt_suppresses_retries", "NORMAL must wait for the in-flight attempt");
  }

  action->release("nas");
  if (!controller.wait_until_idle(3s)) {
    return fail("test_recovery_during_attempt_suppresses_retries", "attempt did not complete");
  }
  if (action->calls("nas") != 1) {
    return fail("test_recovery_during_attempt_suppresses_retries", "no retries after recovery");
  }

  const auto event = events.history().front();
  if (event.outcome != shutdown_outcome::FAILURE || event.attempts != 1) {
    return fail("test_recovery_during_attempt_suppresses_retries", "outcome finalized from the last attempt");
  }

  controller.evaluate(on_line(kBase + 3000, 21.0F));
  if (controller.state("nas") != HostState::NORMAL) {
    return fail("test_recovery_during_attempt_suppresses_retries", "idle COOLDOWN must return to NORMAL");
  }
  const auto closed = events.find(event.id);
  if (!closed.has_value() || closed->episode_ended_at_ms != std::optional<std::int64_t>(kBase + 1000)) {
    return fail("test_recovery_during_attempt_suppresses_retries", "episode end must be recorded");
  }

  controller.evaluate(on_battery(kBase + 4000, 18.0F));
  if (!action->wait_for_calls("nas", 2, 3s) || !controller.wait_until_idle(3s)) {
    return fail("test_recovery_during_attempt_suppresses_retries", "a new episode must trigger again");
  }
  if (events.history().size() != 2) {
    return fail("test_recovery_during_attempt_suppresses_retries", "second episode needs its own event");
  }

  return 0;
}

int test_hysteresis_band_on_battery() {
  TempDir dir("hysteresis");
  EventLog events(dir.file("state.db"));
  auto action = std::make_shared<ScriptedAction>();
  ShutdownController controller(fast_options({"nas"}), action, events);

  controller.evaluate(on_battery(kBase, 20.0F));
  if (!controller.wait_until_idle(3s)) {
    return fail("test_hysteresis_band_on_battery", "worker did not finish");
  }

  controller.evaluate(on_battery(kBase + 1000, 25.0F));
  if (controller.state("nas") != HostState::COOLDOWN) {
    return fail("test_hysteresis_band_on_battery", "charge at threshold+hysteresis is not recovered");
  }

  controller.evaluate(on_battery(kBase + 2000, 25.5F));
  if (controller.state("nas") != HostState::NORMAL) {
    return fail("test_hysteresis_band_on_battery", "charge above threshold+hysteresis recovers");
  }

  return 0;
}

int test_hosts_are_independent() {
  TempDir dir("independent");
  EventLog events(dir.file("state.db"));
  auto action = std::make_shared<ScriptedAction>();
  action->script("slow", {AttemptResult::kSuccess}, true);
  action->script("fast", {AttemptResult::kFailed});
  ShutdownController controller(fast_options({"slow", "fast"}), action, events);

  controller.evaluate(on_battery(kBase, 15.0F));

  if (!wait_for_state(controller, "fast", HostState::COOLDOWN)) {
    return fail("test_hosts_are_independent", "fast host must finish while slow host is blocked");
  }
  if (action->calls("fast") != 3) {
    return fail("test_hosts_are_independent", "fast host must run its own retries");
  }
  if (controller.state("slow") != HostState::TRIGGERING) {
    return fail("test_hosts_are_independent", "slow host must still be triggering");
  }

  action->release("slow");
  if (!controller.wait_until_idle(3s)) {
    return fail("test_hosts_are_independent", "slow host did not finish");
  }

  const auto history = events.history();
  if (history.size() != 2) {
    return fail("test_hosts_are_independent", "one event per host expected");
  }
  for (const auto& event : history) {
    const auto expected = event.target_host == "slow" ? shutdown_outcome::SUCCESS : shutdown_outcome::FAILURE;
    if (event.outcome != expected) {
      return fail("test_hosts_are_independent", "per-host outcome mismatch");
    }
  }

  return 0;
}

int test_restart_resumes_open_episode_in_cooldown() {
  TempDir dir("restart");
  const std::string path = dir.file("state.db");
  std::int64_t interrupted_id = 0;
  {
    EventLog events(path);
    interrupted_id = events.create("nas", kBase, 19.0F).id;
  }

  EventLog events(path);
  auto action = std::make_shared<ScriptedAction>();
  ShutdownController controller(fast_options({"nas", "other"}), action, events);

  const auto recovered = events.find(interrupted_id);
  if (!recovered.has_value() || recovered->outcome != shutdown_outcome::UNKNOWN) {
    return fail("test_restart_resumes_open_episode_in_cooldown", "interrupted event must become UNKNOWN");
  }
  if (controller.state("nas") != HostState::COOLDOWN || controller.state("other") != HostState::NORMAL) {
    return fail("test_restart_resumes_open_episode_in_cooldown", "only the host with an open episode resumes");
  }

  controller.evaluate(on_battery(kBase + 60000, 17.0F));
  if (!action->wait_for_calls("other", 1, 3s) || !controller.wait_until_idle(3s)) {
    return fail("test_restart_resumes_open_episode_in_cooldown", "other host must still trigger");
  }
  if (action->calls("nas") != 0) {
    return fail("test_restart_resumes_open_episode_in_cooldown", "restart must not shut a host down twice");
  }

  controller.evaluate(on_line(kBase + 120000, 30.0F));
  if (controller.state("nas") != HostState::NORMAL || events.open_episodes().size() != 0) {
    return fail("test_restart_resumes_open_episode_in_cooldown", "recovery must close the resumed episode");
  }

  return 0;
}

int test_new_outage_after_recovery_during_attempt() {
  TempDir dir("flicker");
  EventLog events(dir.file("state.db"));
  auto action = std::make_shared<ScriptedAction>();
  action->script("nas", {AttemptResult::kFailed}, true);
  ShutdownController controller(fast_options({"nas"}), action, events);

  controller.evaluate(on_battery(kBase, 19.0F));
  if (!action->wait_for_calls("nas", 1, 3s)) {
    return fail("test_new_outage_after_recovery_during_attempt", "attempt never started");
  }

  // Power returns briefly, then drops again while the first attempt is still running.
  controller.evaluate(on_line(kBase + 1000, 19.5F));
  controller.evaluate(on_battery(kBase + 2000, 15.0F));
  if (controller.state("nas") != HostState::COOLDOWN) {
    return fail("test_new_outage_after_recovery_during_attempt", "in-flight attempt must hold COOLDOWN");
  }

  action->release("nas");
  if (!controller.wait_until_idle(3s)) {
    return fail("test_new_outage_after_recovery_during_attempt", "attempt did not complete");
  }
  if (controller.state("nas") != HostState::NORMAL) {
    return fail("test_new_outage_after_recovery_during_attempt", "finished attempt must end the recovered episode");
  }
  const auto first = events.history();
  if (first.size() != 1 || first.front().episode_ended_at_ms != std::optional<std::int64_t>(kBase + 1000)) {
    return fail("test_new_outage_after_recovery_during_attempt", "episode must end at the recovery sample");
  }

  controller.evaluate(on_battery(kBase + 3000, 14.0F));
  if (!action->wait_for_calls("nas", 2, 3s) || !controller.wait_until_idle(3s)) {
    return fail("test_new_outage_after_recovery_during_attempt", "new low outage must trigger a second action");
  }
  if (events.history().size() != 2 || events.open_episodes().size() != 1) {
    return fail("test_new_outage_after_recovery_during_attempt", "second outage needs its own open episode");
  }

  return 0;
}

int test_removed_target_episode_is_closed() {
  TempDir dir("retired");
  const std::string path = dir.file("state.db");
  {
    EventLog events(path);
    const auto event = events.create("retired", kBase, 12.0F);
    events.finalize(event.id, shutdown_outcome::SUCCESS, 1, kBase + 5000);
  }

  EventLog events(path);
  auto action = std::make_shared<ScriptedAction>();
  ShutdownController controller(fast_options({"nas"}), action, events);

  if (!events.open_episodes().empty() || events.summary().episode_active) {
    return fail("test_removed_target_episode_is_closed", "episode of an unconfigured host must be closed");
  }
  if (controller.state("nas") != HostState::NORMAL) {
    return fail("test_removed_target_episode_is_closed", "configured host must start NORMAL");
  }
  if (events.history().size() != 1 || events.history().front().outcome != shutdown_outcome::SUCCESS) {
    return fail("test_removed_target_episode_is_closed", "closing the episode must keep the outcome");
  }

  return 0;
}

int test_stop_interrupts_backoff() {
  TempDir dir("stop");
  EventLog events(dir.file("state.db"));
  auto action = std::make_shared<ScriptedAction>();
  action->script("nas", {AttemptResult::kFailed});
  auto options = fast_options({"nas"});
  options.backoff = 10s;
  ShutdownController controller(options, action, events);

  controller.evaluate(on_battery(kBase, 5.0F));
  if (!action->wait_for_calls("nas", 1, 3s)) {
    return fail("test_stop_interrupts_backoff", "attempt never started");
  }

  const auto start = std::chrono::steady_clock::now();
  controller.stop();
  if (std::chrono::steady_clock::now() - start > 3s) {
    return fail("test_stop_interrupts_backoff", "stop must not wait out the backoff");
  }

  const auto history = events.history();
  if (history.size() != 1 || history.front().outcome != shutdown_outcome::FAILURE || history.front().attempts != 1) {
    return fail("test_stop_interrupts_backoff", "stopped worker must still finalize its event");
  }

  return 0;
}

int test_ssh_action_maps_exit_status() {
  TempDir dir("ssh");

  SshActionOptions ok_options{};
  ok_options.ssh_binary = "/bin/true";
  SshShutdownAction ok(ok_options);
  if (ok.execute("nas", 2000ms) != AttemptResult::kSuccess) {
    return fail("test_ssh_action_maps_exit_status", "exit 0 must be success");
  }

  SshActionOptions failing_options{};
  failing_options.ssh_binary = "/bin/false";
  SshShutdownAction failing(failing_options);
  if (failing.execute("nas", 2000ms) != AttemptResult::kFailed) {
    return fail("test_ssh_action_maps_exit_status", "non-zero exit must be failure");
  }

  SshActionOptions missing_options{};
  missing_options.ssh_binary = dir.file("no-such-ssh");
  SshShutdownAction missing(missing_options);
  if (missing.execute("nas", 2000ms) != AttemptResult::kFailed) {
    return fail("test_ssh_action_maps_exit_status", "missing binary must be failure");
  }

  const std::string hang = dir.file("hang.sh");
  {
    std::ofstream script(hang);
    script << "#!/bin/sh\nexec sleep 5\n";
  }
  std::filesystem::permissions(hang, std::filesystem::perms::owner_all);

  SshActionOptions hang_options{};
  hang_options.ssh_binary = hang;
  SshShutdownAction hanging(hang_options);
  const auto start = std::chrono::steady_clock::now();
  if (hanging.execute("nas", 200ms) != AttemptResult::kTimedOut) {
    return fail("test_ssh_action_maps_exit_status", "hung ssh must time out");
  }
  if (std::chrono::steady_clock::now() - start > 3s) {
    return fail("test_ssh_action_maps_exit_status", "timeout must kill the child promptly");
  }

  return 0;
}

int test_run_process_captures_output_and_exit_code() {
  const auto result = run_process({"/bin/sh", "-c", "echo battery.charge: 42; echo oops >&2; exit 3"}, 2000ms);
  if (!result.spawned || result.timed_out || result.exit_code != 3) {
    return fail("test_run_process_captures_output_and_exit_code", "exit code must be reported");
  }
  if (result.output.find("battery.charge: 42") == std::string::npos || result.output.find("oops") == std::string::npos) {
    return fail("test_run_process_captures_output_and_exit_code", "stdout and stderr must be captured");
  }
  if (result.succeeded()) {
    return fail("test_run_process_captures_output_and_exit_code", "non-zero exit is not success");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_low_charge_triggers_exactly_once(); rc != 0) return rc;
  if (int rc = test_retries_with_backoff_until_success(); rc != 0) return rc;
  if (int rc = test_exhausted_attempts_report_failure_without_rearming(); rc != 0) return rc;
  if (int rc = test_timed_out_last_attempt_is_unknown(); rc != 0) return rc;
  if (int rc = test_recovery_during_attempt_suppresses_retries(); rc != 0) return rc;
  if (int rc = test_new_outage_after_recovery_during_attempt(); rc != 0) return rc;
  if (int rc = test_hysteresis_band_on_battery(); rc != 0) return rc;
  if (int rc = test_hosts_are_independent(); rc != 0) return rc;
  if (int rc = test_restart_resumes_open_episode_in_cooldown(); rc != 0) return rc;
  if (int rc = test_removed_target_episode_is_closed(); rc != 0) return rc;
  if (int rc = test_stop_interrupts_backoff(); rc != 0) return rc;
  if (int rc = test_ssh_action_maps_exit_status(); rc != 0) return rc;
  if (int rc = test_run_process_captures_output_and_exit_code(); rc != 0) return rc;

  std::cout << "[PASS] control unit tests\n";
  return 0;
}
