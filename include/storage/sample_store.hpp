#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "model/ups_sample.hpp"
#include "storage/sqlite.hpp"

namespace ups_sentinel::storage {

// Rejected write: non-monotonic timestamp, invalid values, or a storage failure.
class StoreViolation : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct StoreOptions {
  sqlite::OpenMode mode{sqlite::OpenMode::kReadWrite};
  std::uint32_t retention_days{30};
};

// Hourly downsample of pruned samples.
struct SampleRollup {
  std::int64_t hour_start_ms{0};
  std::int64_t sample_count{0};
  double avg_load_pct{0.0};
  double min_charge_pct{0.0};
  std::int64_t on_battery_samples{0};
};

// Forward-only view over a timestamp range. Owns a dedicated read connection,
// so iterating never holds the store's writer lock.
class SampleCursor {
 public:
  SampleCursor(sqlite::DatabasePtr db, sqlite::StatementPtr statement);

  SampleCursor(SampleCursor&&) noexcept = default;
  SampleCursor& operator=(SampleCursor&&) noexcept = default;
  SampleCursor(const SampleCursor&) = delete;
  SampleCursor& operator=(const SampleCursor&) = delete;

  // Returns false once the range is exhausted; throws std::runtime_error on read errors.
  bool next(model::ups_sample& out);

 private:
  sqlite::DatabasePtr db_;
  sqlite::StatementPtr statement_;
  bool done_{false};
};

class SampleStore {
 public:
  explicit SampleStore(std::string path, StoreOptions options = {});

  SampleStore(const SampleStore&) = delete;
  SampleStore& operator=(const SampleStore&) = delete;

  // Durable once it returns. Throws StoreViolation and leaves the store untouched
  // when sample.timestamp_ms is not strictly after the last stored timestamp.
  void append(const model::ups_sample& sample);

  // Samples with from_ms <= timestamp_ms <= to_ms, ascending.
  [[nodiscard]] SampleCursor range(std::int64_t from_ms, std::int64_t to_ms) const;

  [[nodiscard]] std::optional<model::ups_sample> latest() const;

  // Last sample strictly before timestamp_ms.
  [[nodiscard]] std::optional<model::ups_sample> latest_before(std::int64_t timestamp_ms) const;

  // Downsamples then deletes samples older than the retention horizon, keeping the
  // last sample before the horizon. Returns the number of deleted samples.
  std::size_t prune(std::int64_t now_ms);

  [[nodiscard]] std::vector<SampleRollup> rollups() const;

  // Bumped on every successful append or non-empty prune.
  [[nodiscard]] std::uint64_t generation() const noexcept;

  [[nodiscard]] const std::string& path() const noexcept;

 private:
  void init_schema();
  void require_writable(const char* operation) const;
  [[nodiscard]] sqlite::DatabasePtr open_reader() const;
  [[nodiscard]] std::optional<model::ups_sample> query_single(const char* sql, std::optional<std::int64_t> bound) const;

  std::string path_;
  StoreOptions options_;
  std::int64_t retention_ms_;

  mutable std::mutex write_mutex_;
  sqlite::DatabasePtr writer_{};
  sqlite::StatementPtr insert_statement_{};
  std::optional<model::ups_sample> latest_{};
  std::atomic<std::uint64_t> generation_{0};
};

}  // namespace ups_sentinel::storage
