#include "sinks/redis_ts.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace ups_sentinel::sinks {
namespace {

constexpr std::size_t kMaxCommandArgCount = 1 + (16 * 3);

double sanitize_value(const float value) {
  return std::isfinite(value) ? static_cast<double>(value) : 0.0;
}

const std::vector<std::string>& metric_suffixes() {
  static const std::vector<std::string> kMetricSuffixes = {
      "raw:status",
      "raw:charge",
      "raw:load",
      "raw:runtime",
      "agent:heartbeat",
      "agent:loop_jitter",
      "agent:compute_time",
      "agent:redis_latency",
      "agent:redis_errors",
      "agent:poll_failures",
      "agent:store_violations",
      "agent:missed_cycles",
  };
  return kMetricSuffixes;
}

}  // namespace

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  command_args_.reserve(kMaxCommandArgCount);
  command_argv_.reserve(kMaxCommandArgCount);
  command_argv_len_.reserve(kMaxCommandArgCount);
}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

bool RedisTsSink::check_connectivity() {
  return ensure_connected() && ensure_schema();
}

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();
  schema_ready_ = false;

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  return true;
}

bool RedisTsSink::ensure_schema() {
  if (!timeseries_available_) {
    return false;
  }
  if (schema_ready_) {
    return true;
  }

  const std::string retention = std::to_string(options_.retention_ms);
  for (const auto& suffix : metric_suffixes()) {
    const std::string key = options_.key_prefix + ":" + suffix;
    redisReply* reply = static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s RETENTION %s DUPLICATE_POLICY LAST", key.c_str(), retention.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const bool already_exists =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "already exists") != nullptr;
    const bool unknown_command =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "unknown command") != nullptr;
    const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
    const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
    freeReplyObject(reply);

    if (unknown_command) {
      std::cerr << "[redis] RedisTimeSeries module not available (TS.CREATE unknown command)\n";
      timeseries_available_ = false;
      return false;
    }
    if (!ok) {
      std::cerr << "[redis] schema error on TS.CREATE " << key << ": " << reply_message << '\n';
      return false;
    }
  }

  schema_ready_ = true;
  return true;
}

bool RedisTsSink::publish(const model::ups_sample& sample, model::agent_health& health) {
  if (!ensure_connected() || !ensure_schema()) {
    return false;
  }

  if (publish_impl(sample, health)) {
    return true;
  }

  if (!reconnect() || !ensure_schema()) {
    return false;
  }
  return publish_impl(sample, health);
}

bool RedisTsSink::publish_impl(const model::ups_sample& sample, model::agent_health& health) {
  const std::string timestamp = std::to_string(sample.timestamp_ms);

  command_args_.clear();
  command_args_.emplace_back("TS.MADD");

  const auto append_metric = [&](const char* suffix, const double value) {
    command_args_.emplace_back(options_.key_prefix + ":" + suffix);
    command_args_.emplace_back(timestamp);
    command_args_.emplace_back(std::to_string(value));
  };

  append_metric("raw:status", static_cast<double>(static_cast<std::uint8_t>(sample.status)));
  append_metric("raw:charge", sanitize_value(sample.charge_pct));
  append_metric("raw:load", sanitize_value(sample.load_pct));
  if (sample.runtime_estimate_s.has_value()) {
    append_metric("raw:runtime", static_cast<double>(*sample.runtime_estimate_s));
  }

  if (options_.publish_health) {
    append_metric("agent:heartbeat", static_cast<double>(health.heartbeat_ms));
    append_metric("agent:loop_jitter", sanitize_value(health.loop_jitter_ms));
    append_metric("agent:compute_time", sanitize_value(health.compute_time_ms));
    append_metric("agent:redis_latency", sanitize_value(health.redis_latency_ms));
    append_metric("agent:redis_errors", static_cast<double>(health.redis_errors));
    append_metric("agent:poll_failures", static_cast<double>(health.poll_failures));
    append_metric("agent:store_violations", static_cast<double>(health.store_violations));
    append_metric("agent:missed_cycles", static_cast<double>(health.missed_cycles));
  }

  const auto publish_start = std::chrono::steady_clock::now();
  const bool ok = send_command();
  const auto publish_end = std::chrono::steady_clock::now();
  health.redis_latency_ms =
      std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(publish_end - publish_start).count();
  return ok;
}

bool RedisTsSink::publish_status(const std::string& status_json) {
  if (!ensure_connected()) {
    return false;
  }

  command_args_.clear();
  command_args_.emplace_back("SET");
  command_args_.emplace_back(options_.key_prefix + ":status");
  command_args_.emplace_back(status_json);
  if (send_command()) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return send_command();
}

bool RedisTsSink::send_command() {
  command_argv_.clear();
  command_argv_len_.clear();
  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(redisCommandArgv(
      context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(), command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok && reply->str != nullptr) {
    std::cerr << "[redis] " << command_args_.front() << " rejected: " << reply->str << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

}  // namespace ups_sentinel::sinks
