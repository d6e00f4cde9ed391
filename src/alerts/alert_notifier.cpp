#include "alerts/alert_notifier.hpp"

#include <iostream>
#include <utility>
#include <vector>

#include "core/process.hpp"

namespace ups_sentinel::alerts {

const char* to_string(const AlertKind kind) noexcept {
  switch (kind) {
    case AlertKind::POWER_LOST:
      return "POWER_LOST";
    case AlertKind::POWER_RESTORED:
      return "POWER_RESTORED";
    case AlertKind::LOW_BATTERY_SHUTDOWN:
      return "LOW_BATTERY_SHUTDOWN";
    case AlertKind::SHUTDOWN_FAILED:
      return "SHUTDOWN_FAILED";
  }
  return "UNKNOWN";
}

AlertNotifier::AlertNotifier(AlertOptions options) : options_(std::move(options)) {
  if (options_.command.empty()) {
    return;
  }
  running_ = true;
  worker_ = std::thread([this] { worker_main(); });
}

AlertNotifier::~AlertNotifier() { stop(); }

void AlertNotifier::notify(Alert alert) {
  std::cerr << "[alert] " << to_string(alert.kind) << ": " << alert.subject << '\n';

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || stop_requested_) {
      return;
    }
    queue_.push_back(std::move(alert));
  }
  cv_.notify_one();
}

void AlertNotifier::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    stop_requested_ = true;
  }
  cv_.notify_all();

  if (worker_.joinable()) {
    worker_.join();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
}

void AlertNotifier::worker_main() {
  while (true) {
    Alert alert{};
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stop_requested_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      alert = std::move(queue_.front());
      queue_.pop_front();
    }
    deliver(alert);
  }
}

void AlertNotifier::deliver(const Alert& alert) {
  const std::vector<std::string> argv = {options_.command, to_string(alert.kind), alert.subject, alert.body};
  const core::ProcessResult result = core::run_process(argv, options_.timeout);
  if (result.succeeded()) {
    delivered_.fetch_add(1);
    return;
  }

  failed_.fetch_add(1);
  std::cerr << "[alert] delivery of " << to_string(alert.kind) << " failed: ";
  if (!result.spawned) {
    std::cerr << "could not start " << options_.command;
  } else if (result.timed_out) {
    std::cerr << "timed out after " << options_.timeout.count() << "ms";
  } else {
    std::cerr << "exit " << result.exit_code;
  }
  std::cerr << '\n';
}

std::size_t AlertNotifier::delivered() const noexcept { return delivered_.load(); }

std::size_t AlertNotifier::failed() const noexcept { return failed_.load(); }

std::optional<AlertKind> PowerTransitionTracker::observe(const model::ups_sample& sample) {
  bool on_wall = false;
  if (model::is_on_wall_power(sample.status)) {
    on_wall = true;
  } else if (sample.status != model::ups_status::ON_BATTERY) {
    return std::nullopt;
  }

  const std::optional<bool> previous = on_wall_power_;
  on_wall_power_ = on_wall;
  if (!previous.has_value() || *previous == on_wall) {
    return std::nullopt;
  }
  return on_wall ? AlertKind::POWER_RESTORED : AlertKind::POWER_LOST;
}

}  // namespace ups_sentinel::alerts
