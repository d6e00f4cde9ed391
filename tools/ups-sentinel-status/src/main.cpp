#include <chrono>
#include <exception>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/timestamp.hpp"
#include "derived/aggregation.hpp"
#include "query/status_facade.hpp"
#include "storage/event_log.hpp"
#include "storage/sample_store.hpp"

// Prints the current status report as JSON. Opens the agent's database read-only,
// so it is safe to run next to a live agent.
int main(int argc, char** argv) {
  std::string config_path = "configs/ups-sentinel.yaml";
  bool compact = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--compact") {
      compact = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "usage: ups-sentinel-status [--compact] [config.yaml]\n";
      return 0;
    } else {
      config_path = arg;
    }
  }

  try {
    const auto config = ups_sentinel::core::load_agent_config(config_path);

    ups_sentinel::storage::StoreOptions store_options{};
    store_options.mode = ups_sentinel::storage::sqlite::OpenMode::kReadOnly;
    store_options.retention_days = config.storage.retention_days;
    const ups_sentinel::storage::SampleStore store(config.storage.path, store_options);
    const ups_sentinel::storage::EventLog events(config.storage.path, ups_sentinel::storage::sqlite::OpenMode::kReadOnly);

    ups_sentinel::derived::AggregationOptions aggregation_options{};
    aggregation_options.down_gap = config.down_gap();
    aggregation_options.cache_ttl = std::chrono::milliseconds(0);
    ups_sentinel::derived::AggregationEngine aggregation(store, aggregation_options);

    ups_sentinel::query::StatusFacade facade(store, aggregation, events, config.shutdown.threshold_pct);
    const nlohmann::json report = ups_sentinel::query::to_json(facade.report(ups_sentinel::core::unix_timestamp_now_ms()));
    std::cout << (compact ? report.dump() : report.dump(2)) << '\n';
  } catch (const std::exception& ex) {
    std::cerr << "status error: " << ex.what() << '\n';
    return 1;
  }

  return 0;
}
