#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "model/ups_sample.hpp"

namespace ups_sentinel::alerts {

enum class AlertKind : std::uint8_t {
  POWER_LOST = 0,
  POWER_RESTORED = 1,
  LOW_BATTERY_SHUTDOWN = 2,
  SHUTDOWN_FAILED = 3,
};

const char* to_string(AlertKind kind) noexcept;

struct Alert {
  AlertKind kind{AlertKind::POWER_LOST};
  std::int64_t timestamp_ms{0};
  std::string subject{};
  std::string body{};
};

struct AlertOptions {
  // Run as `<command> <event> <subject> <body>`; empty means log only.
  std::string command{};
  std::chrono::milliseconds timeout{10000};
};

// Logs every alert and hands it to the alert command on a single worker thread.
// Delivery failures are logged and counted, never thrown.
class AlertNotifier {
 public:
  explicit AlertNotifier(AlertOptions options);
  ~AlertNotifier();

  AlertNotifier(const AlertNotifier&) = delete;
  AlertNotifier& operator=(const AlertNotifier&) = delete;

  void notify(Alert alert);

  // Delivers whatever is queued, then joins the worker. Later alerts are only logged.
  void stop();

  [[nodiscard]] std::size_t delivered() const noexcept;
  [[nodiscard]] std::size_t failed() const noexcept;

 private:
  void worker_main();
  void deliver(const Alert& alert);

  AlertOptions options_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Alert> queue_{};
  bool stop_requested_{false};
  bool running_{false};
  std::thread worker_{};
  std::atomic<std::size_t> delivered_{0};
  std::atomic<std::size_t> failed_{0};
};

// Turns consecutive samples into POWER_LOST / POWER_RESTORED edges.
class PowerTransitionTracker {
 public:
  std::optional<AlertKind> observe(const model::ups_sample& sample);

 private:
  std::optional<bool> on_wall_power_{};
};

}  // namespace ups_sentinel::alerts
