#include "derived/aggregation.hpp"

#include <algorithm>
#include <optional>
#include <vector>

namespace ups_sentinel::derived {

namespace {

// Time-weighted accounting for one window. Each sample owns the interval up to
// the next sample (or now); the sample before the window covers its start.
class WindowAccumulator {
 public:
  WindowAccumulator(const model::window span, const std::int64_t now_ms, const std::int64_t down_gap_ms)
      : span_(span), from_ms_(now_ms - model::window_length_ms(span)), now_ms_(now_ms), down_gap_ms_(down_gap_ms) {}

  [[nodiscard]] std::int64_t from_ms() const noexcept { return from_ms_; }

  void feed(const model::ups_sample& sample) {
    if (sample.timestamp_ms > now_ms_) {
      return;
    }

    if (previous_.has_value()) {
      account(*previous_, sample.timestamp_ms);
    }

    if (sample.timestamp_ms >= from_ms_) {
      load_sum_ += static_cast<double>(sample.load_pct);
      ++sample_count_;
    }

    previous_ = sample;
  }

  [[nodiscard]] model::aggregate finish() {
    if (previous_.has_value()) {
      account(*previous_, now_ms_);
      previous_.reset();
    }

    model::aggregate result{};
    result.span = span_;
    result.sample_count = sample_count_;
    result.observed_ms = observed_ms_;
    if (sample_count_ > 0) {
      result.avg_load_pct = load_sum_ / static_cast<double>(sample_count_);
    }
    if (observed_ms_ > 0) {
      const auto observed = static_cast<double>(observed_ms_);
      result.system_uptime_pct = (static_cast<double>(alive_ms_) * 100.0) / observed;
      result.wall_power_uptime_pct = (static_cast<double>(wall_ms_) * 100.0) / observed;
    }
    return result;
  }

 private:
  void account(const model::ups_sample& start, const std::int64_t end_ms) {
    const std::int64_t begin = std::max(start.timestamp_ms, from_ms_);
    const std::int64_t end = std::min(end_ms, now_ms_);
    if (end <= begin) {
      return;
    }

    const std::int64_t duration = end - begin;
    observed_ms_ += duration;

    // A silent stretch means the collector or the UPS link was down, whatever the last status said.
    const bool gap = (end_ms - start.timestamp_ms) > down_gap_ms_;
    if (model::is_alive(start.status) && !gap) {
      alive_ms_ += duration;
    }
    if (model::is_on_wall_power(start.status)) {
      wall_ms_ += duration;
    }
  }

  model::window span_;
  std::int64_t from_ms_;
  std::int64_t now_ms_;
  std::int64_t down_gap_ms_;

  std::optional<model::ups_sample> previous_{};
  double load_sum_{0.0};
  std::size_t sample_count_{0};
  std::int64_t observed_ms_{0};
  std::int64_t alive_ms_{0};
  std::int64_t wall_ms_{0};
};

std::size_t window_index(const model::window span) { return static_cast<std::size_t>(span); }

}  // namespace

AggregationEngine::AggregationEngine(const storage::SampleStore& store, const AggregationOptions options)
    : store_(store), options_(options) {}

bool AggregationEngine::lookup(const model::window span, const std::int64_t now_ms, const std::uint64_t generation,
                               model::aggregate& out) const {
  if (options_.cache_ttl.count() <= 0) {
    return false;
  }

  std::lock_guard<std::mutex> lock(cache_mutex_);
  const auto it = cache_.find(span);
  if (it == cache_.end()) {
    return false;
  }

  const CacheEntry& entry = it->second;
  const std::int64_t age_ms = now_ms - entry.computed_for_ms;
  if (entry.generation != generation || age_ms < 0 || age_ms >= options_.cache_ttl.count()) {
    return false;
  }

  out = entry.value;
  return true;
}

void AggregationEngine::remember(const model::aggregate& value, const std::int64_t now_ms,
                                 const std::uint64_t generation) {
  if (options_.cache_ttl.count() <= 0) {
    return;
  }

  std::lock_guard<std::mutex> lock(cache_mutex_);
  cache_[value.span] = CacheEntry{value, now_ms, generation};
}

model::aggregate AggregationEngine::compute(const model::window span, const std::int64_t now_ms) {
  const std::uint64_t generation = store_.generation();

  model::aggregate cached{};
  if (lookup(span, now_ms, generation, cached)) {
    return cached;
  }

  WindowAccumulator accumulator(span, now_ms, options_.down_gap.count());
  if (const auto prior = store_.latest_before(accumulator.from_ms())) {
    accumulator.feed(*prior);
  }

  auto cursor = store_.range(accumulator.from_ms(), now_ms);
  model::ups_sample sample{};
  while (cursor.next(sample)) {
    accumulator.feed(sample);
  }

  const model::aggregate result = accumulator.finish();
  remember(result, now_ms, generation);
  return result;
}

AggregateSet AggregationEngine::compute_all(const std::int64_t now_ms) {
  const std::uint64_t generation = store_.generation();

  AggregateSet results{};
  std::vector<WindowAccumulator> pending;
  pending.reserve(model::kAllWindows.size());

  for (const auto span : model::kAllWindows) {
    model::aggregate cached{};
    if (lookup(span, now_ms, generation, cached)) {
      results[window_index(span)] = cached;
      continue;
    }
    pending.emplace_back(span, now_ms, options_.down_gap.count());
  }

  if (pending.empty()) {
    return results;
  }

  // The longest pending window decides how far back the scan reaches; the
  // shorter windows pick up their own prior sample as the scan passes their start.
  const auto longest = std::min_element(pending.begin(), pending.end(), [](const auto& a, const auto& b) {
    return a.from_ms() < b.from_ms();
  });
  const std::int64_t scan_from_ms = longest->from_ms();

  if (const auto prior = store_.latest_before(scan_from_ms)) {
    for (auto& accumulator : pending) {
      accumulator.feed(*prior);
    }
  }

  auto cursor = store_.range(scan_from_ms, now_ms);
  model::ups_sample sample{};
  while (cursor.next(sample)) {
    for (auto& accumulator : pending) {
      accumulator.feed(sample);
    }
  }

  for (auto& accumulator : pending) {
    const model::aggregate result = accumulator.finish();
    results[window_index(result.span)] = result;
    remember(result, now_ms, generation);
  }
  return results;
}

}  // namespace ups_sentinel::derived
