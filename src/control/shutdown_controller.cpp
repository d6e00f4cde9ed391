#include "control/shutdown_controller.hpp"

#include <iostream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "core/timestamp.hpp"

namespace ups_sentinel::control {

namespace {

model::shutdown_outcome outcome_for(const bool succeeded, const AttemptResult last) {
  if (succeeded) {
    return model::shutdown_outcome::SUCCESS;
  }
  return last == AttemptResult::kTimedOut ? model::shutdown_outcome::UNKNOWN : model::shutdown_outcome::FAILURE;
}

}  // namespace

const char* to_string(const HostState state) noexcept {
  switch (state) {
    case HostState::NORMAL:
      return "NORMAL";
    case HostState::ARMED:
      return "ARMED";
    case HostState::TRIGGERING:
      return "TRIGGERING";
    case HostState::COOLDOWN:
      return "COOLDOWN";
  }
  return "UNKNOWN";
}

ShutdownController::ShutdownController(ControllerOptions options, std::shared_ptr<RemoteAction> action,
                                       storage::EventLog& events, ControllerObserver observer)
    : options_(std::move(options)), action_(std::move(action)), events_(events), observer_(std::move(observer)) {
  if (action_ == nullptr && !options_.targets.empty()) {
    throw std::invalid_argument("shutdown controller requires a remote action");
  }
  if (options_.max_attempts == 0) {
    throw std::invalid_argument("shutdown.max_attempts must be at least 1");
  }

  std::unordered_set<std::string> seen;
  for (const auto& target : options_.targets) {
    if (!seen.insert(target).second) {
      throw std::invalid_argument("duplicate shutdown target: " + target);
    }
    auto host = std::make_unique<HostControl>();
    host->target = target;
    hosts_.push_back(std::move(host));
  }

  restore_open_episodes();
}

ShutdownController::~ShutdownController() { stop(); }

void ShutdownController::restore_open_episodes() {
  const std::int64_t now_ms = core::unix_timestamp_now_ms();
  events_.recover_interrupted(now_ms);

  for (const auto& event : events_.open_episodes()) {
    bool matched = false;
    for (auto& host : hosts_) {
      if (host->target == event.target_host) {
        // A restart inside a low-battery episode must not shut the host down twice.
        host->state = HostState::COOLDOWN;
        host->event = event;
        matched = true;
      }
    }
    if (matched) {
      std::cerr << "[shutdown] " << event.target_host << ": resuming open episode from event " << event.id
                << " in COOLDOWN\n";
    } else {
      // No longer a configured target: nothing will ever end this episode.
      events_.close_episode(event.id, now_ms);
      std::cerr << "[shutdown] " << event.target_host << ": closed open episode from event " << event.id
                << " for a host no longer in shutdown.targets\n";
    }
  }
}

void ShutdownController::transition(HostControl& host, const HostState to, std::vector<Notice>& notices) {
  if (host.state == to) {
    return;
  }
  notices.push_back(Notice{host.target, host.state, to, std::nullopt});
  host.state = to;
}

void ShutdownController::trigger(HostControl& host, const model::ups_sample& sample, std::vector<Notice>& notices) {
  transition(host, HostState::ARMED, notices);

  model::shutdown_event event{};
  try {
    event = events_.create(host.target, sample.timestamp_ms, sample.charge_pct);
  } catch (const std::exception& ex) {
    // Still shut the host down; the record is lost but the action is not.
    std::cerr << "[shutdown] " << host.target << ": failed to persist shutdown event: " << ex.what() << '\n';
    event.target_host = host.target;
    event.triggered_at_ms = sample.timestamp_ms;
    event.charge_at_trigger = sample.charge_pct;
  }

  if (host.worker.joinable()) {
    host.worker.join();
  }

  host.event = event;
  host.cancel.store(false);
  host.recovered_at_ms.reset();
  host.in_flight = true;
  transition(host, HostState::TRIGGERING, notices);
  host.worker = std::thread(&ShutdownController::run_attempts, this, &host, event);
}

void ShutdownController::evaluate(const model::ups_sample& sample) {
  const bool low = sample.status == model::ups_status::ON_BATTERY && sample.charge_pct <= options_.threshold_pct;
  const bool recovered = model::is_on_wall_power(sample.status) ||
                         sample.charge_pct > options_.threshold_pct + options_.hysteresis_pct;

  std::vector<Notice> notices;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return;
    }

    for (auto& host : hosts_) {
      switch (host->state) {
        case HostState::NORMAL:
        case HostState::ARMED:
          if (low) {
            trigger(*host, sample, notices);
          }
          break;
        case HostState::TRIGGERING:
          if (recovered) {
            host->cancel.store(true);
            host->recovered_at_ms = sample.timestamp_ms;
            transition(*host, HostState::COOLDOWN, notices);
            changed_.notify_all();
          }
          break;
        case HostState::COOLDOWN:
          if (recovered && !host->in_flight) {
            end_episode(*host, sample.timestamp_ms, notices);
          }
          break;
      }
    }
  }

  publish(notices);
}

void ShutdownController::run_attempts(HostControl* host, model::shutdown_event event) {
  bool succeeded = false;
  AttemptResult last = AttemptResult::kFailed;
  std::uint32_t attempts = 0;
  auto delay = std::chrono::duration<double, std::milli>(options_.backoff);

  for (std::uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
    if (attempt > 1) {
      std::unique_lock<std::mutex> lock(mutex_);
      const bool interrupted = changed_.wait_for(lock, delay, [this, host]() { return stopping_ || host->cancel.load(); });
      if (interrupted) {
        std::cerr << "[shutdown] " << host->target << ": retries cancelled after " << attempts << " attempt(s)\n";
        break;
      }
      delay *= static_cast<double>(options_.backoff_multiplier);
    }

    try {
      last = action_->execute(host->target, options_.attempt_timeout);
    } catch (const std::exception& ex) {
      std::cerr << "[shutdown] " << host->target << ": attempt raised: " << ex.what() << '\n';
      last = AttemptResult::kFailed;
    }
    ++attempts;

    std::cerr << "[shutdown] " << host->target << ": attempt " << attempts << "/" << options_.max_attempts << " "
              << to_string(last) << '\n';
    if (last == AttemptResult::kSuccess) {
      succeeded = true;
      break;
    }
  }

  event.outcome = outcome_for(succeeded, last);
  event.attempts = attempts;
  event.finalized_at_ms = core::unix_timestamp_now_ms();
  if (event.id > 0) {
    try {
      events_.finalize(event.id, event.outcome, event.attempts, *event.finalized_at_ms);
    } catch (const std::exception& ex) {
      std::cerr << "[shutdown] " << host->target << ": failed to finalize event " << event.id << ": " << ex.what()
                << '\n';
    }
  }

  std::vector<Notice> notices;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    host->in_flight = false;
    host->event = event;
    transition(*host, HostState::COOLDOWN, notices);
    notices.push_back(Notice{host->target, HostState::COOLDOWN, HostState::COOLDOWN, event});
    // The episode already ended during the attempt; a later outage must be able to trigger again.
    if (host->recovered_at_ms.has_value()) {
      end_episode(*host, *host->recovered_at_ms, notices);
    }
    changed_.notify_all();
  }

  publish(notices);
}

void ShutdownController::end_episode(HostControl& host, const std::int64_t ended_at_ms, std::vector<Notice>& notices) {
  if (host.event.has_value() && host.event->id > 0) {
    try {
      events_.close_episode(host.event->id, ended_at_ms);
    } catch (const std::exception& ex) {
      std::cerr << "[shutdown] " << host.target << ": failed to close episode: " << ex.what() << '\n';
    }
  }
  host.event.reset();
  host.recovered_at_ms.reset();
  transition(host, HostState::NORMAL, notices);
}

void ShutdownController::publish(const std::vector<Notice>& notices) const {
  for (const auto& notice : notices) {
    if (notice.outcome.has_value()) {
      if (observer_.on_outcome) {
        observer_.on_outcome(*notice.outcome);
      }
      continue;
    }
    if (observer_.on_transition) {
      observer_.on_transition(notice.host, notice.from, notice.to);
    }
  }
}

HostState ShutdownController::state(const std::string& host) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& control : hosts_) {
    if (control->target == host) {
      return control->state;
    }
  }
  throw std::out_of_range("unknown shutdown target: " + host);
}

std::vector<HostSnapshot> ShutdownController::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<HostSnapshot> result;
  result.reserve(hosts_.size());
  for (const auto& control : hosts_) {
    HostSnapshot entry{};
    entry.target = control->target;
    entry.state = control->state;
    entry.attempt_in_flight = control->in_flight;
    if (control->event.has_value()) {
      entry.event_id = control->event->id;
    }
    result.push_back(std::move(entry));
  }
  return result;
}

bool ShutdownController::wait_until_idle(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return changed_.wait_for(lock, timeout, [this]() {
    for (const auto& control : hosts_) {
      if (control->in_flight) {
        return false;
      }
    }
    return true;
  });
}

void ShutdownController::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    for (auto& control : hosts_) {
      control->cancel.store(true);
    }
    changed_.notify_all();
  }

  for (auto& control : hosts_) {
    if (control->worker.joinable()) {
      control->worker.join();
    }
  }
}

}  // namespace ups_sentinel::control
