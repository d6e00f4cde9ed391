#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "control/remote_action.hpp"
#include "model/shutdown_event.hpp"
#include "model/ups_sample.hpp"
#include "storage/event_log.hpp"

namespace ups_sentinel::control {

enum class HostState : std::uint8_t {
  NORMAL = 0,
  ARMED = 1,
  TRIGGERING = 2,
  COOLDOWN = 3,
};

const char* to_string(HostState state) noexcept;

struct ControllerOptions {
  float threshold_pct{20.0F};
  float hysteresis_pct{5.0F};
  std::uint32_t max_attempts{3};
  std::chrono::milliseconds backoff{2000};
  float backoff_multiplier{2.0F};
  std::chrono::milliseconds attempt_timeout{30000};
  std::vector<std::string> targets{};
};

// Called without the controller lock held, possibly from a worker thread.
struct ControllerObserver {
  std::function<void(const std::string& host, HostState from, HostState to)> on_transition{};
  std::function<void(const model::shutdown_event& event)> on_outcome{};
};

struct HostSnapshot {
  std::string target;
  HostState state{HostState::NORMAL};
  bool attempt_in_flight{false};
  std::optional<std::int64_t> event_id{};
};

// Per-host low-battery state machine. evaluate() never blocks on the network:
// shutdown attempts run on one worker thread per host.
class ShutdownController {
 public:
  ShutdownController(ControllerOptions options, std::shared_ptr<RemoteAction> action, storage::EventLog& events,
                     ControllerObserver observer = {});
  ~ShutdownController();

  ShutdownController(const ShutdownController&) = delete;
  ShutdownController& operator=(const ShutdownController&) = delete;

  void evaluate(const model::ups_sample& sample);

  // Throws std::out_of_range for an unconfigured host.
  [[nodiscard]] HostState state(const std::string& host) const;
  [[nodiscard]] std::vector<HostSnapshot> snapshot() const;

  // True once no attempt is in flight on any host.
  bool wait_until_idle(std::chrono::milliseconds timeout);

  // Suppresses further retries and joins every worker; in-flight attempts run to completion.
  void stop();

 private:
  struct HostControl {
    std::string target;
    HostState state{HostState::NORMAL};
    std::optional<model::shutdown_event> event{};
    std::thread worker{};
    std::atomic<bool> cancel{false};
    bool in_flight{false};
    // Set when the episode recovered while an attempt was in flight.
    std::optional<std::int64_t> recovered_at_ms{};
  };

  struct Notice {
    std::string host;
    HostState from{HostState::NORMAL};
    HostState to{HostState::NORMAL};
    std::optional<model::shutdown_event> outcome{};
  };

  void restore_open_episodes();
  void transition(HostControl& host, HostState to, std::vector<Notice>& notices);
  void trigger(HostControl& host, const model::ups_sample& sample, std::vector<Notice>& notices);
  void run_attempts(HostControl* host, model::shutdown_event event);
  void end_episode(HostControl& host, std::int64_t ended_at_ms, std::vector<Notice>& notices);
  void publish(const std::vector<Notice>& notices) const;

  ControllerOptions options_;
  std::shared_ptr<RemoteAction> action_;
  storage::EventLog& events_;
  ControllerObserver observer_;

  mutable std::mutex mutex_;
  std::condition_variable changed_;
  std::vector<std::unique_ptr<HostControl>> hosts_{};
  bool stopping_{false};
};

}  // namespace ups_sentinel::control
