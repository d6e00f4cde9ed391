#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ups_sentinel::core {

struct UpsConfig {
  std::string name{"ups@localhost"};
  std::string upsc_binary{"upsc"};
  std::chrono::milliseconds timeout{2000};
};

struct StorageConfig {
  std::string path{"/var/lib/ups-sentinel/samples.db"};
  std::uint32_t retention_days{30};
  std::uint64_t prune_every_ticks{3600};
};

struct AggregationConfig {
  // Unset means twice the poll interval.
  std::optional<std::chrono::milliseconds> down_gap{};
  // Unset means the poll interval.
  std::optional<std::chrono::milliseconds> cache_ttl{};
};

struct ShutdownConfig {
  float threshold_pct{20.0F};
  float hysteresis_pct{5.0F};
  std::uint32_t max_attempts{3};
  std::chrono::milliseconds backoff{2000};
  float backoff_multiplier{2.0F};
  std::chrono::milliseconds attempt_timeout{30000};
  std::string ssh_binary{"ssh"};
  std::string remote_command{"sudo -n systemctl poweroff"};
  std::vector<std::string> targets{};
};

struct AlertConfig {
  std::string command{};
  std::chrono::milliseconds timeout{10000};
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"ups"};
  std::uint64_t status_every_ticks{10};
  bool enabled{false};
};

struct AgentConfig {
  std::chrono::milliseconds poll_interval{1000};
  bool publish_health{true};
  bool stdout_debug{false};
  UpsConfig ups{};
  StorageConfig storage{};
  AggregationConfig aggregation{};
  ShutdownConfig shutdown{};
  AlertConfig alerts{};
  RedisConfig redis{};

  [[nodiscard]] std::chrono::milliseconds down_gap() const;
  [[nodiscard]] std::chrono::milliseconds cache_ttl() const;
};

AgentConfig load_agent_config(const std::string& path);

// Cross-field checks; throws std::runtime_error.
void validate_agent_config(const AgentConfig& config);

}  // namespace ups_sentinel::core
