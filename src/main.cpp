#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "core/agent.hpp"
#include "core/config.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const ups_sentinel::core::AgentConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | poll_interval_ms=" << config.poll_interval.count()
         << " | ups=" << config.ups.name
         << " | storage=" << config.storage.path
         << " | retention_days=" << config.storage.retention_days
         << " | down_gap_ms=" << config.down_gap().count()
         << " | threshold_pct=" << config.shutdown.threshold_pct
         << " | hysteresis_pct=" << config.shutdown.hysteresis_pct
         << " | max_attempts=" << config.shutdown.max_attempts
         << " | targets=" << config.shutdown.targets.size()
         << " | alerts=" << (config.alerts.command.empty() ? "log-only" : config.alerts.command)
         << " | publish_health=" << (config.publish_health ? "true" : "false")
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");

  if (config.redis.enabled) {
    output << " | redis_address=";
    if (!config.redis.unix_socket.empty()) {
      output << "unix://" << config.redis.unix_socket;
    } else {
      output << config.redis.host << ':' << config.redis.port;
    }
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/ups-sentinel.yaml";

  ups_sentinel::core::AgentConfig config{};
  try {
    config = ups_sentinel::core::load_agent_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  try {
    ups_sentinel::core::Agent agent{config};
    agent.start();
    while (g_shutdown_requested == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cerr << "[agent] shutdown signal received; waiting for in-flight work\n";
    agent.stop();
  } catch (const std::exception& ex) {
    std::cerr << "[agent] fatal: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << "[agent] exited cleanly\n";
  return 0;
}
