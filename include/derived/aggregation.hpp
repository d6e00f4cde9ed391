#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "model/aggregate.hpp"
#include "storage/sample_store.hpp"

namespace ups_sentinel::derived {

struct AggregationOptions {
  // A sample interval longer than this counts as service-down time.
  std::chrono::milliseconds down_gap{2000};
  // 0 disables caching.
  std::chrono::milliseconds cache_ttl{1000};
};

using AggregateSet = std::array<model::aggregate, model::kAllWindows.size()>;

// Computes windowed statistics from the sample store on demand.
// Safe to call from several threads; the store is only read through cursors.
class AggregationEngine {
 public:
  AggregationEngine(const storage::SampleStore& store, AggregationOptions options);

  model::aggregate compute(model::window span, std::int64_t now_ms);

  // All windows from one pass over the longest window.
  AggregateSet compute_all(std::int64_t now_ms);

 private:
  struct CacheEntry {
    model::aggregate value{};
    std::int64_t computed_for_ms{0};
    std::uint64_t generation{0};
  };

  [[nodiscard]] bool lookup(model::window span, std::int64_t now_ms, std::uint64_t generation,
                            model::aggregate& out) const;
  void remember(const model::aggregate& value, std::int64_t now_ms, std::uint64_t generation);

  const storage::SampleStore& store_;
  AggregationOptions options_;

  mutable std::mutex cache_mutex_;
  std::unordered_map<model::window, CacheEntry> cache_{};
};

}  // namespace ups_sentinel::derived
