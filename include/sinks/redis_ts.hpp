#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "model/agent_health.hpp"
#include "model/ups_sample.hpp"

struct redisContext;

namespace ups_sentinel::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"ups"};
  std::uint32_t connect_timeout_ms{1000};
  std::int64_t retention_ms{30LL * 24 * 60 * 60 * 1000};
  bool publish_health{true};
};

// Exports samples to RedisTimeSeries and the latest status report to a plain key.
// Every call reconnects on demand and reports failure through its return value.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();

  // One TS.MADD stamped with the sample time; records the round trip in health.redis_latency_ms.
  bool publish(const model::ups_sample& sample, model::agent_health& health);

  // SET <prefix>:status <json>.
  bool publish_status(const std::string& status_json);

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool ensure_schema();
  bool publish_impl(const model::ups_sample& sample, model::agent_health& health);
  bool send_command();

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  bool timeseries_available_{true};
  bool schema_ready_{false};
};

}  // namespace ups_sentinel::sinks
