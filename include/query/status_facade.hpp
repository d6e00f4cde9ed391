#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "derived/aggregation.hpp"
#include "model/shutdown_event.hpp"
#include "model/ups_sample.hpp"
#include "storage/event_log.hpp"
#include "storage/sample_store.hpp"

namespace ups_sentinel::query {

struct StatusReport {
  std::int64_t generated_at_ms{0};
  std::optional<model::ups_sample> latest{};
  derived::AggregateSet aggregates{};
  // Headline figures, taken from the 30d window.
  std::optional<double> system_uptime_pct{};
  std::optional<double> wall_power_uptime_pct{};
  std::optional<std::int64_t> predicted_runtime_s{};
  model::shutdown_summary shutdown{};
  // Sections that could not be computed for this report.
  std::vector<std::string> degraded{};
};

// Read-only view for presentation. Every section is computed independently, so a
// failing section leaves the others intact.
class StatusFacade {
 public:
  StatusFacade(const storage::SampleStore& store, derived::AggregationEngine& aggregation,
               const storage::EventLog& events, float threshold_pct);

  StatusReport report(std::int64_t now_ms);

 private:
  const storage::SampleStore& store_;
  derived::AggregationEngine& aggregation_;
  const storage::EventLog& events_;
  float threshold_pct_;
};

nlohmann::json to_json(const model::ups_sample& sample);
nlohmann::json to_json(const model::aggregate& aggregate);
nlohmann::json to_json(const StatusReport& report);

}  // namespace ups_sentinel::query
