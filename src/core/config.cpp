#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "model/aggregate.hpp"

namespace ups_sentinel::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::chrono::milliseconds parse_positive_ms(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed <= 0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return std::chrono::milliseconds(parsed);
}

float parse_percent(const std::string& key, const std::string& value) {
  const float parsed = std::stof(value);
  if (!std::isfinite(parsed) || parsed < 0.0F || parsed > 100.0F) {
    throw std::runtime_error(key + " must be in range 0..100");
  }
  return parsed;
}

std::vector<std::string> parse_list(const std::string& value) {
  std::string body = value;
  if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
    body = body.substr(1, body.size() - 2);
  }

  std::vector<std::string> items;
  std::stringstream stream(body);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = unquote(trim(item));
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(AgentConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "poll_interval_ms") {
    config.poll_interval = parse_positive_ms(key, value);
    if (config.poll_interval > std::chrono::minutes(1)) {
      throw std::runtime_error("poll_interval_ms must be less than or equal to 60000");
    }
    return;
  }

  if (key == "agent.publish_health") {
    config.publish_health = parse_bool(value);
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "ups.name") {
    if (value.empty()) {
      throw std::runtime_error("ups.name must not be empty");
    }
    config.ups.name = value;
    return;
  }

  if (key == "ups.upsc_binary") {
    config.ups.upsc_binary = value;
    return;
  }

  if (key == "ups.timeout_ms") {
    config.ups.timeout = parse_positive_ms(key, value);
    return;
  }

  if (key == "storage.path") {
    if (value.empty()) {
      throw std::runtime_error("storage.path must not be empty");
    }
    config.storage.path = value;
    return;
  }

  if (key == "storage.retention_days") {
    const auto days = std::stoll(value);
    if (days < 30) {
      throw std::runtime_error("storage.retention_days must be at least 30 to cover the 30d window");
    }
    if (days > 3650) {
      throw std::runtime_error("storage.retention_days must be less than or equal to 3650");
    }
    config.storage.retention_days = static_cast<std::uint32_t>(days);
    return;
  }

  if (key == "storage.prune_every_ticks") {
    const auto ticks = std::stoll(value);
    if (ticks < 0) {
      throw std::runtime_error("storage.prune_every_ticks must be greater than or equal to 0");
    }
    config.storage.prune_every_ticks = static_cast<std::uint64_t>(ticks);
    return;
  }

  if (key == "aggregation.down_gap_ms") {
    config.aggregation.down_gap = parse_positive_ms(key, value);
    return;
  }

  if (key == "aggregation.cache_ttl_ms") {
    const auto ttl = std::stoll(value);
    if (ttl < 0) {
      throw std::runtime_error("aggregation.cache_ttl_ms must be greater than or equal to 0");
    }
    config.aggregation.cache_ttl = std::chrono::milliseconds(ttl);
    return;
  }

  if (key == "shutdown.threshold_pct") {
    config.shutdown.threshold_pct = parse_percent(key, value);
    return;
  }

  if (key == "shutdown.hysteresis_pct") {
    config.shutdown.hysteresis_pct = parse_percent(key, value);
    return;
  }

  if (key == "shutdown.max_attempts") {
    const auto attempts = std::stoll(value);
    if (attempts < 1 || attempts > 10) {
      throw std::runtime_error("shutdown.max_attempts must be in range 1..10");
    }
    config.shutdown.max_attempts = static_cast<std::uint32_t>(attempts);
    return;
  }

  if (key == "shutdown.backoff_ms") {
    config.shutdown.backoff = parse_positive_ms(key, value);
    return;
  }

  if (key == "shutdown.backoff_multiplier") {
    config.shutdown.backoff_multiplier = std::stof(value);
    if (!std::isfinite(config.shutdown.backoff_multiplier) || config.shutdown.backoff_multiplier < 1.0F) {
      throw std::runtime_error("shutdown.backoff_multiplier must be at least 1.0");
    }
    return;
  }

  if (key == "shutdown.attempt_timeout_ms") {
    config.shutdown.attempt_timeout = parse_positive_ms(key, value);
    return;
  }

  if (key == "shutdown.ssh_binary") {
    config.shutdown.ssh_binary = value;
    return;
  }

  if (key == "shutdown.command") {
    if (value.empty()) {
      throw std::runtime_error("shutdown.command must not be empty");
    }
    config.shutdown.remote_command = value;
    return;
  }

  if (key == "shutdown.targets") {
    config.shutdown.targets = parse_list(raw_value);
    return;
  }

  if (key == "alerts.command") {
    config.alerts.command = value;
    return;
  }

  if (key == "alerts.timeout_ms") {
    config.alerts.timeout = parse_positive_ms(key, value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.key_prefix") {
    if (value.empty()) {
      throw std::runtime_error("redis.key_prefix must not be empty");
    }
    config.redis.key_prefix = value;
    return;
  }

  if (key == "redis.status_every_ticks") {
    const auto ticks = std::stoll(value);
    if (ticks < 0) {
      throw std::runtime_error("redis.status_every_ticks must be greater than or equal to 0");
    }
    config.redis.status_every_ticks = static_cast<std::uint64_t>(ticks);
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

}  // namespace

std::chrono::milliseconds AgentConfig::down_gap() const {
  return aggregation.down_gap.value_or(poll_interval * 2);
}

std::chrono::milliseconds AgentConfig::cache_ttl() const {
  return aggregation.cache_ttl.value_or(poll_interval);
}

void validate_agent_config(const AgentConfig& config) {
  if (config.shutdown.threshold_pct <= 0.0F || config.shutdown.threshold_pct >= 100.0F) {
    throw std::runtime_error("shutdown.threshold_pct must be strictly between 0 and 100");
  }

  if (config.shutdown.threshold_pct + config.shutdown.hysteresis_pct > 100.0F) {
    throw std::runtime_error("shutdown.threshold_pct + shutdown.hysteresis_pct must not exceed 100");
  }

  if (config.cache_ttl() > config.poll_interval) {
    throw std::runtime_error("aggregation.cache_ttl_ms must not exceed poll_interval_ms");
  }

  if (config.down_gap() < config.poll_interval) {
    throw std::runtime_error("aggregation.down_gap_ms must be at least poll_interval_ms");
  }

  if (config.storage.retention_days * model::kDayMs < model::kLongestWindowMs) {
    throw std::runtime_error("storage.retention_days must cover the longest aggregation window");
  }

  if (!config.shutdown.targets.empty() && config.shutdown.ssh_binary.empty()) {
    throw std::runtime_error("shutdown.ssh_binary must be set when shutdown.targets is not empty");
  }
}

AgentConfig load_agent_config(const std::string& path) {
  AgentConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate_agent_config(config);
  return config;
}

}  // namespace ups_sentinel::core
