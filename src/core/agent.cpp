#include "core/agent.hpp"

#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "core/timestamp.hpp"

namespace ups_sentinel::core {

namespace {

sensors::UpscOptions upsc_options(const AgentConfig& config) {
  sensors::UpscOptions options{};
  options.binary = config.ups.upsc_binary;
  options.ups_name = config.ups.name;
  options.timeout = config.ups.timeout;
  return options;
}

control::SshActionOptions ssh_options(const AgentConfig& config) {
  control::SshActionOptions options{};
  options.ssh_binary = config.shutdown.ssh_binary;
  options.remote_command = config.shutdown.remote_command;
  return options;
}

storage::StoreOptions store_options(const AgentConfig& config) {
  storage::StoreOptions options{};
  options.retention_days = config.storage.retention_days;
  return options;
}

derived::AggregationOptions aggregation_options(const AgentConfig& config) {
  derived::AggregationOptions options{};
  options.down_gap = config.down_gap();
  options.cache_ttl = config.cache_ttl();
  return options;
}

alerts::AlertOptions alert_options(const AgentConfig& config) {
  alerts::AlertOptions options{};
  options.command = config.alerts.command;
  options.timeout = config.alerts.timeout;
  return options;
}

control::ControllerOptions controller_options(const AgentConfig& config) {
  control::ControllerOptions options{};
  options.threshold_pct = config.shutdown.threshold_pct;
  options.hysteresis_pct = config.shutdown.hysteresis_pct;
  options.max_attempts = config.shutdown.max_attempts;
  options.backoff = config.shutdown.backoff;
  options.backoff_multiplier = config.shutdown.backoff_multiplier;
  options.attempt_timeout = config.shutdown.attempt_timeout;
  options.targets = config.shutdown.targets;
  return options;
}

std::string redis_address(const RedisConfig& redis) {
  if (!redis.unix_socket.empty()) {
    return "unix://" + redis.unix_socket;
  }
  return redis.host + ':' + std::to_string(redis.port);
}

void accumulate(AgentStats& total, const AgentStats& delta) {
  total.ticks_executed += delta.ticks_executed;
  total.samples_appended += delta.samples_appended;
  total.poll_failures += delta.poll_failures;
  total.store_violations += delta.store_violations;
  total.prune_cycles += delta.prune_cycles;
  total.status_publications += delta.status_publications;
}

}  // namespace

Agent::Agent(AgentConfig config)
    : Agent(config, sensors::make_upsc_source(upsc_options(config)),
            control::make_ssh_shutdown_action(ssh_options(config))) {}

Agent::Agent(AgentConfig config, std::unique_ptr<sensors::UpsSource> source,
             std::shared_ptr<control::RemoteAction> action)
    : config_(std::move(config)),
      source_(std::move(source)),
      store_(config_.storage.path, store_options(config_)),
      events_(config_.storage.path),
      aggregation_(store_, aggregation_options(config_)),
      facade_(store_, aggregation_, events_, config_.shutdown.threshold_pct),
      alerts_(alert_options(config_)),
      controller_(controller_options(config_), std::move(action), events_,
                  control::ControllerObserver{
                      [this](const std::string& host, const control::HostState from, const control::HostState to) {
                        on_transition(host, from, to);
                      },
                      [this](const model::shutdown_event& event) { on_outcome(event); }}) {
  if (source_ == nullptr) {
    throw std::invalid_argument("agent requires a UPS source");
  }

  if (const auto latest = store_.latest()) {
    last_charge_pct_ = latest->charge_pct;
    std::cerr << "[agent] store " << store_.path() << " resumes after " << model::to_string(latest->status)
              << " sample at " << latest->timestamp_ms << '\n';
  }

  if (config_.redis.enabled) {
    sinks::RedisTsOptions options{};
    options.host = config_.redis.host;
    options.port = config_.redis.port;
    options.unix_socket = config_.redis.unix_socket;
    options.key_prefix = config_.redis.key_prefix;
    options.retention_ms = static_cast<std::int64_t>(config_.storage.retention_days) * model::kDayMs;
    options.publish_health = config_.publish_health;
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(options);
    if (redis_sink_->check_connectivity()) {
      std::cerr << "[agent] redis connectivity confirmed at " << redis_address(config_.redis) << '\n';
    } else {
      std::cerr << "[agent] redis connectivity check failed at " << redis_address(config_.redis) << '\n';
    }
  }

  std::cerr << "[agent] monitoring " << config_.ups.name << " for " << config_.shutdown.targets.size()
            << " shutdown target(s)\n";
}

Agent::~Agent() { stop(); }

AgentStats Agent::run_for_ticks(const std::size_t total_ticks) {
  {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (started_ || stopped_) {
      throw std::logic_error("run_for_ticks called while the poll loop is running or stopped");
    }
  }

  AgentStats stats{};
  if (first_tick_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
  }

  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    tick(stats);
    std::this_thread::sleep_until(next_wakeup_);
  }

  std::lock_guard<std::mutex> lock(stats_mutex_);
  accumulate(totals_, stats);
  return stats;
}

void Agent::start() {
  std::lock_guard<std::mutex> lock(loop_mutex_);
  if (stopped_) {
    throw std::logic_error("agent cannot be restarted after stop");
  }
  if (started_) {
    return;
  }
  started_ = true;
  stop_requested_ = false;
  if (first_tick_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
  }
  loop_thread_ = std::thread([this] { run_loop(); });
}

void Agent::stop() {
  {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    stop_requested_ = true;
  }
  loop_cv_.notify_all();

  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
  {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    started_ = false;
    stopped_ = true;
  }

  controller_.stop();
  alerts_.stop();
}

bool Agent::running() const {
  std::lock_guard<std::mutex> lock(loop_mutex_);
  return started_;
}

AgentStats Agent::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return totals_;
}

query::StatusReport Agent::status(const std::int64_t now_ms) { return facade_.report(now_ms); }

const storage::SampleStore& Agent::store() const noexcept { return store_; }

const storage::EventLog& Agent::events() const noexcept { return events_; }

control::ShutdownController& Agent::controller() noexcept { return controller_; }

void Agent::run_loop() {
  while (true) {
    AgentStats stats{};
    tick(stats);
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      accumulate(totals_, stats);
    }

    std::unique_lock<std::mutex> lock(loop_mutex_);
    if (loop_cv_.wait_until(lock, next_wakeup_, [this] { return stop_requested_; })) {
      return;
    }
  }
}

void Agent::tick(AgentStats& stats) {
  const auto cycle_start = std::chrono::steady_clock::now();

  const model::poll_result result = source_->poll();
  if (const auto* sample = std::get_if<model::ups_sample>(&result)) {
    handle_sample(*sample, stats);
  } else {
    handle_failure(std::get<model::poll_failure>(result), stats);
  }

  if (cadence_.due_every(config_.storage.prune_every_ticks)) {
    prune(stats);
  }
  if (redis_sink_ != nullptr && cadence_.due_every(config_.redis.status_every_ticks)) {
    publish_status(stats);
  }

  const auto cycle_end = std::chrono::steady_clock::now();
  const auto actual_period_ms =
      previous_cycle_start_.has_value()
          ? std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(cycle_start - *previous_cycle_start_)
                .count()
          : 0.0F;
  const auto compute_ms =
      std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(cycle_end - cycle_start).count();
  update_agent_health(actual_period_ms, compute_ms);
  previous_cycle_start_ = cycle_start;

  ++stats.ticks_executed;
  cadence_.advance();
  next_wakeup_ += config_.poll_interval;
  if (next_wakeup_ < cycle_end) {
    // Behind schedule: resume the cadence from now rather than bursting to catch up.
    next_wakeup_ = cycle_end;
  }
}

void Agent::handle_sample(const model::ups_sample& sample, AgentStats& stats) {
  if (!poll_was_ok_) {
    std::cerr << "[ups] poll recovered after " << consecutive_poll_failures_ << " failed poll(s)\n";
    poll_was_ok_ = true;
  }
  consecutive_poll_failures_ = 0;
  health_.poll_failures = 0;

  try {
    store_.append(sample);
    ++stats.samples_appended;
  } catch (const storage::StoreViolation& ex) {
    ++stats.store_violations;
    ++health_.store_violations;
    std::cerr << "[store] VIOLATION: sample rejected: " << ex.what() << '\n';
  }

  // The controller sees every reading, stored or not: a broken store must not disable shutdown.
  last_charge_pct_ = sample.charge_pct;
  controller_.evaluate(sample);

  if (const auto edge = power_tracker_.observe(sample)) {
    std::ostringstream body;
    body << "status=" << model::to_string(sample.status) << " charge=" << sample.charge_pct
         << "% load=" << sample.load_pct << '%';
    const char* subject = *edge == alerts::AlertKind::POWER_LOST ? "UPS switched to battery power"
                                                                  : "UPS wall power restored";
    alerts_.notify(alerts::Alert{*edge, sample.timestamp_ms, subject, body.str()});
  }

  publish_sinks(sample);
}

void Agent::handle_failure(const model::poll_failure& failure, AgentStats& stats) {
  ++stats.poll_failures;
  ++consecutive_poll_failures_;
  health_.poll_failures = consecutive_poll_failures_;

  if (poll_was_ok_) {
    std::cerr << "[ups] poll failed (" << model::to_string(failure.reason) << "): " << failure.detail << '\n';
    poll_was_ok_ = false;
  }
}

void Agent::prune(AgentStats& stats) {
  try {
    const std::size_t removed = store_.prune(unix_timestamp_now_ms());
    ++stats.prune_cycles;
    if (removed > 0) {
      std::cerr << "[store] pruned " << removed << " sample(s) past retention\n";
    }
  } catch (const std::exception& ex) {
    std::cerr << "[store] prune failed: " << ex.what() << '\n';
  }
}

void Agent::publish_status(AgentStats& stats) {
  try {
    const std::string payload = query::to_json(facade_.report(unix_timestamp_now_ms())).dump();
    if (redis_sink_->publish_status(payload)) {
      ++stats.status_publications;
    } else {
      ++health_.redis_errors;
    }
  } catch (const std::exception& ex) {
    std::cerr << "[query] status publication failed: " << ex.what() << '\n';
  }
}

void Agent::publish_sinks(const model::ups_sample& sample) {
  if (config_.stdout_debug) {
    stdout_sink_.publish(sample, health_);
  }

  if (redis_sink_ == nullptr) {
    return;
  }

  const bool ok = redis_sink_->publish(sample, health_);
  if (!ok) {
    ++health_.redis_errors;
    if (redis_was_ok_) {
      std::cerr << "[redis] publish failed\n";
      redis_was_ok_ = false;
    }
  } else if (!redis_was_ok_) {
    std::cerr << "[redis] publish recovered\n";
    redis_was_ok_ = true;
  }
}

void Agent::update_agent_health(const float actual_period_ms, const float compute_time_ms) {
  if (!config_.publish_health) {
    return;
  }

  const auto tick_ms = std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(config_.poll_interval).count();
  health_.loop_jitter_ms = actual_period_ms > 0.0F ? std::fabs(actual_period_ms - tick_ms) : 0.0F;
  health_.compute_time_ms = compute_time_ms;
  health_.heartbeat_ms = unix_timestamp_now_ms();
  if (compute_time_ms > tick_ms) {
    ++health_.missed_cycles;
  }
}

void Agent::on_transition(const std::string& host, const control::HostState from, const control::HostState to) {
  std::cerr << "[shutdown] " << host << ": " << control::to_string(from) << " -> " << control::to_string(to) << '\n';

  if (to == control::HostState::TRIGGERING) {
    std::ostringstream body;
    body << "battery charge " << last_charge_pct_ << "% at or below " << config_.shutdown.threshold_pct
         << "%, shutting down " << host;
    alerts_.notify(alerts::Alert{alerts::AlertKind::LOW_BATTERY_SHUTDOWN, unix_timestamp_now_ms(),
                                 "Low battery: shutting down " + host, body.str()});
  }
}

void Agent::on_outcome(const model::shutdown_event& event) {
  std::cerr << "[shutdown] " << event.target_host << ": event " << event.id << " finalized "
            << model::to_string(event.outcome) << " after " << event.attempts << " attempt(s)\n";

  if (event.outcome == model::shutdown_outcome::FAILURE || event.outcome == model::shutdown_outcome::UNKNOWN) {
    std::ostringstream body;
    body << "shutdown of " << event.target_host << " triggered at charge " << event.charge_at_trigger << "% ended "
         << model::to_string(event.outcome) << " after " << event.attempts
         << " attempt(s); manual intervention may be required";
    alerts_.notify(alerts::Alert{alerts::AlertKind::SHUTDOWN_FAILED, event.finalized_at_ms.value_or(0),
                                 "Shutdown failed for " + event.target_host, body.str()});
  }
}

}  // namespace ups_sentinel::core
