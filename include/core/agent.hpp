#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "alerts/alert_notifier.hpp"
#include "control/remote_action.hpp"
#include "control/shutdown_controller.hpp"
#include "core/cadence.hpp"
#include "core/config.hpp"
#include "derived/aggregation.hpp"
#include "model/agent_health.hpp"
#include "model/ups_sample.hpp"
#include "query/status_facade.hpp"
#include "sensors/ups.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"
#include "storage/event_log.hpp"
#include "storage/sample_store.hpp"

namespace ups_sentinel::core {

struct AgentStats {
  std::size_t ticks_executed{0};
  std::size_t samples_appended{0};
  std::size_t poll_failures{0};
  std::size_t store_violations{0};
  std::size_t prune_cycles{0};
  std::size_t status_publications{0};
};

// Owns the poll loop: the only writer to the sample store.
class Agent {
 public:
  explicit Agent(AgentConfig config);
  Agent(AgentConfig config, std::unique_ptr<sensors::UpsSource> source, std::shared_ptr<control::RemoteAction> action);
  ~Agent();

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  // Runs ticks on the calling thread. Throws std::logic_error while start()ed or after stop().
  AgentStats run_for_ticks(std::size_t total_ticks);

  // Throws std::logic_error after stop(); an agent is not restartable.
  void start();
  // Joins the poll thread, waits for in-flight shutdown attempts and drains alerts.
  void stop();
  [[nodiscard]] bool running() const;

  [[nodiscard]] AgentStats stats() const;

  query::StatusReport status(std::int64_t now_ms);

  [[nodiscard]] const storage::SampleStore& store() const noexcept;
  [[nodiscard]] const storage::EventLog& events() const noexcept;
  [[nodiscard]] control::ShutdownController& controller() noexcept;

 private:
  void tick(AgentStats& stats);
  void handle_sample(const model::ups_sample& sample, AgentStats& stats);
  void handle_failure(const model::poll_failure& failure, AgentStats& stats);
  void prune(AgentStats& stats);
  void publish_status(AgentStats& stats);
  void publish_sinks(const model::ups_sample& sample);
  void update_agent_health(float actual_period_ms, float compute_time_ms);
  void run_loop();

  void on_transition(const std::string& host, control::HostState from, control::HostState to);
  void on_outcome(const model::shutdown_event& event);

  AgentConfig config_;
  std::unique_ptr<sensors::UpsSource> source_;
  storage::SampleStore store_;
  storage::EventLog events_;
  derived::AggregationEngine aggregation_;
  query::StatusFacade facade_;
  alerts::AlertNotifier alerts_;
  alerts::PowerTransitionTracker power_tracker_{};
  control::ShutdownController controller_;

  TickCadence cadence_{};
  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_tick_{true};
  std::optional<std::chrono::steady_clock::time_point> previous_cycle_start_{};
  model::agent_health health_{};
  float last_charge_pct_{0.0F};

  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  bool redis_was_ok_{true};
  bool poll_was_ok_{true};
  std::uint32_t consecutive_poll_failures_{0};

  mutable std::mutex stats_mutex_;
  AgentStats totals_{};

  mutable std::mutex loop_mutex_;
  std::condition_variable loop_cv_;
  std::thread loop_thread_{};
  bool started_{false};
  bool stopped_{false};
  bool stop_requested_{false};
};

}  // namespace ups_sentinel::core
