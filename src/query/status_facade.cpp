#include "query/status_facade.hpp"

#include <exception>
#include <iostream>
#include <string>

#include "derived/runtime_prediction.hpp"

namespace ups_sentinel::query {

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
  if (!value.has_value()) {
    return nullptr;
  }
  return *value;
}

void note_degraded(StatusReport& report, const char* section, const std::exception& ex) {
  std::cerr << "[query] " << section << " unavailable: " << ex.what() << '\n';
  report.degraded.emplace_back(section);
}

}  // namespace

StatusFacade::StatusFacade(const storage::SampleStore& store, derived::AggregationEngine& aggregation,
                           const storage::EventLog& events, const float threshold_pct)
    : store_(store), aggregation_(aggregation), events_(events), threshold_pct_(threshold_pct) {}

StatusReport StatusFacade::report(const std::int64_t now_ms) {
  StatusReport report{};
  report.generated_at_ms = now_ms;

  try {
    report.latest = store_.latest();
  } catch (const std::exception& ex) {
    note_degraded(report, "latest", ex);
  }

  try {
    report.aggregates = aggregation_.compute_all(now_ms);
    const auto& longest = report.aggregates.back();
    report.system_uptime_pct = longest.system_uptime_pct;
    report.wall_power_uptime_pct = longest.wall_power_uptime_pct;
  } catch (const std::exception& ex) {
    for (std::size_t i = 0; i < report.aggregates.size(); ++i) {
      report.aggregates[i] = model::aggregate{};
      report.aggregates[i].span = model::kAllWindows[i];
    }
    note_degraded(report, "aggregates", ex);
  }

  try {
    report.predicted_runtime_s = derived::predict_runtime_s(store_, now_ms, threshold_pct_);
  } catch (const std::exception& ex) {
    note_degraded(report, "predicted_runtime", ex);
  }

  try {
    report.shutdown = events_.summary();
  } catch (const std::exception& ex) {
    note_degraded(report, "shutdown", ex);
  }

  return report;
}

nlohmann::json to_json(const model::ups_sample& sample) {
  return nlohmann::json{{"timestamp_ms", sample.timestamp_ms},
                        {"status", std::string(model::to_string(sample.status))},
                        {"charge_pct", sample.charge_pct},
                        {"load_pct", sample.load_pct},
                        {"runtime_estimate_s", optional_json(sample.runtime_estimate_s)}};
}

nlohmann::json to_json(const model::aggregate& aggregate) {
  return nlohmann::json{{"window", std::string(model::to_string(aggregate.span))},
                        {"avg_load_pct", optional_json(aggregate.avg_load_pct)},
                        {"system_uptime_pct", optional_json(aggregate.system_uptime_pct)},
                        {"wall_power_uptime_pct", optional_json(aggregate.wall_power_uptime_pct)},
                        {"sample_count", aggregate.sample_count},
                        {"observed_ms", aggregate.observed_ms}};
}

nlohmann::json to_json(const StatusReport& report) {
  nlohmann::json aggregates = nlohmann::json::array();
  for (const auto& aggregate : report.aggregates) {
    aggregates.push_back(to_json(aggregate));
  }

  nlohmann::json shutdown{{"last_triggered_at_ms", optional_json(report.shutdown.last_triggered_at_ms)},
                          {"last_outcome", nullptr},
                          {"episode_active", report.shutdown.episode_active}};
  if (report.shutdown.last_outcome.has_value()) {
    shutdown["last_outcome"] = std::string(model::to_string(*report.shutdown.last_outcome));
  }

  return nlohmann::json{{"generated_at_ms", report.generated_at_ms},
                        {"latest", report.latest.has_value() ? to_json(*report.latest) : nlohmann::json(nullptr)},
                        {"aggregates", aggregates},
                        {"system_uptime_pct", optional_json(report.system_uptime_pct)},
                        {"wall_power_uptime_pct", optional_json(report.wall_power_uptime_pct)},
                        {"predicted_runtime_s", optional_json(report.predicted_runtime_s)},
                        {"shutdown", shutdown},
                        {"degraded", report.degraded}};
}

}  // namespace ups_sentinel::query
