#pragma once

#include <cstdint>
#include <optional>

#include "storage/sample_store.hpp"

namespace ups_sentinel::derived {

inline constexpr std::int64_t kMaxPredictedRuntimeS = 86400;

// Seconds until charge reaches threshold_pct, extrapolated from the drain rate of
// the current outage. Absent unless the latest sample is ON_BATTERY and charge has
// dropped at least one level since the outage began.
std::optional<std::int64_t> predict_runtime_s(const storage::SampleStore& store, std::int64_t now_ms,
                                              float threshold_pct);

}  // namespace ups_sentinel::derived
