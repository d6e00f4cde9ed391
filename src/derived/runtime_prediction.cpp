#include "derived/runtime_prediction.hpp"

#include <algorithm>
#include <vector>

#include "model/aggregate.hpp"

namespace ups_sentinel::derived {

namespace {

struct ChargeLevel {
  std::int64_t timestamp_ms;
  float charge_pct;
};

constexpr std::int64_t kLookbackMs = model::kDayMs;

}  // namespace

std::optional<std::int64_t> predict_runtime_s(const storage::SampleStore& store, const std::int64_t now_ms,
                                              const float threshold_pct) {
  const auto latest = store.latest();
  if (!latest.has_value() || latest->status != model::ups_status::ON_BATTERY || latest->timestamp_ms > now_ms) {
    return std::nullopt;
  }

  // First sample of each strictly lower charge level within the current on-battery run.
  std::vector<ChargeLevel> levels;
  auto cursor = store.range(latest->timestamp_ms - kLookbackMs, latest->timestamp_ms);
  model::ups_sample sample{};
  while (cursor.next(sample)) {
    if (sample.status != model::ups_status::ON_BATTERY) {
      levels.clear();
      continue;
    }
    if (levels.empty() || sample.charge_pct < levels.back().charge_pct) {
      levels.push_back(ChargeLevel{sample.timestamp_ms, sample.charge_pct});
    }
  }

  if (levels.size() < 2) {
    return std::nullopt;
  }

  const ChargeLevel& first = levels.front();
  const ChargeLevel& last = levels.back();
  const double dropped_pct = static_cast<double>(first.charge_pct) - static_cast<double>(last.charge_pct);
  const double elapsed_s = static_cast<double>(last.timestamp_ms - first.timestamp_ms) / 1000.0;
  const double remaining_pct = static_cast<double>(last.charge_pct) - static_cast<double>(threshold_pct);
  if (remaining_pct <= 0.0) {
    return 0;
  }

  const double seconds = remaining_pct * (elapsed_s / dropped_pct);
  return static_cast<std::int64_t>(std::clamp(seconds, 0.0, static_cast<double>(kMaxPredictedRuntimeS)));
}

}  // namespace ups_sentinel::derived
