#include "storage/sample_store.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <utility>

#include <sqlite3.h>

#include "core/timestamp.hpp"
#include "model/aggregate.hpp"

namespace ups_sentinel::storage {

namespace {

constexpr int kSchemaVersion = 1;

constexpr const char* kCreateSamplesSql = R"(
    CREATE TABLE IF NOT EXISTS samples (
        timestamp_ms INTEGER PRIMARY KEY,
        status       INTEGER NOT NULL,
        charge_pct   REAL    NOT NULL,
        load_pct     REAL    NOT NULL,
        runtime_s    INTEGER
    )
)";

constexpr const char* kCreateRollupsSql = R"(
    CREATE TABLE IF NOT EXISTS sample_rollups (
        hour_start_ms      INTEGER PRIMARY KEY,
        sample_count       INTEGER NOT NULL,
        avg_load_pct       REAL    NOT NULL,
        min_charge_pct     REAL    NOT NULL,
        on_battery_samples INTEGER NOT NULL
    )
)";

constexpr const char* kCreateMetaSql = R"(
    CREATE TABLE IF NOT EXISTS meta (
        key   TEXT PRIMARY KEY,
        value TEXT NOT NULL
    )
)";

constexpr const char* kInsertSql =
    "INSERT INTO samples (timestamp_ms, status, charge_pct, load_pct, runtime_s) VALUES (?, ?, ?, ?, ?)";

constexpr const char* kSelectColumns = "SELECT timestamp_ms, status, charge_pct, load_pct, runtime_s FROM samples ";

constexpr const char* kRollupSql = R"(
    INSERT INTO sample_rollups (hour_start_ms, sample_count, avg_load_pct, min_charge_pct, on_battery_samples)
    SELECT (timestamp_ms / 3600000) * 3600000, COUNT(*), AVG(load_pct), MIN(charge_pct), SUM(status = 1)
    FROM samples WHERE timestamp_ms < ?
    GROUP BY 1
    ON CONFLICT(hour_start_ms) DO UPDATE SET
        avg_load_pct = (sample_rollups.avg_load_pct * sample_rollups.sample_count +
                        excluded.avg_load_pct * excluded.sample_count) /
                       (sample_rollups.sample_count + excluded.sample_count),
        sample_count = sample_rollups.sample_count + excluded.sample_count,
        min_charge_pct = MIN(sample_rollups.min_charge_pct, excluded.min_charge_pct),
        on_battery_samples = sample_rollups.on_battery_samples + excluded.on_battery_samples
)";

model::ups_sample read_row(sqlite3_stmt* statement) {
  model::ups_sample sample{};
  sample.timestamp_ms = sqlite3_column_int64(statement, 0);
  const int status = sqlite3_column_int(statement, 1);
  sample.status = status >= 0 && status <= static_cast<int>(model::ups_status::UNKNOWN)
                      ? static_cast<model::ups_status>(status)
                      : model::ups_status::UNKNOWN;
  sample.charge_pct = static_cast<float>(sqlite3_column_double(statement, 2));
  sample.load_pct = static_cast<float>(sqlite3_column_double(statement, 3));
  if (sqlite3_column_type(statement, 4) != SQLITE_NULL) {
    sample.runtime_estimate_s = sqlite3_column_int64(statement, 4);
  }
  return sample;
}

std::string describe(const model::ups_sample& sample) {
  return "ts=" + std::to_string(sample.timestamp_ms);
}

}  // namespace

SampleCursor::SampleCursor(sqlite::DatabasePtr db, sqlite::StatementPtr statement)
    : db_(std::move(db)), statement_(std::move(statement)) {}

bool SampleCursor::next(model::ups_sample& out) {
  if (done_ || statement_ == nullptr) {
    return false;
  }

  const int rc = sqlite3_step(statement_.get());
  if (rc == SQLITE_ROW) {
    out = read_row(statement_.get());
    return true;
  }

  done_ = true;
  sqlite::check(rc, db_.get(), "sample range step");
  return false;
}

SampleStore::SampleStore(std::string path, const StoreOptions options)
    : path_(std::move(path)),
      options_(options),
      retention_ms_(static_cast<std::int64_t>(options.retention_days) * model::kDayMs) {
  if (options_.mode == sqlite::OpenMode::kReadOnly) {
    // Fail fast on a missing database instead of on the first query.
    (void)open_reader();
    return;
  }

  writer_ = sqlite::open(path_, sqlite::OpenMode::kReadWrite);
  init_schema();
  insert_statement_ = sqlite::prepare(writer_.get(), kInsertSql);
  latest_ = query_single("ORDER BY timestamp_ms DESC LIMIT 1", std::nullopt);
  if (latest_.has_value()) {
    std::cerr << "[store] resuming " << path_ << " after " << describe(*latest_) << '\n';
  }
}

void SampleStore::init_schema() {
  sqlite::exec(writer_.get(), "PRAGMA journal_mode = WAL");
  sqlite::exec(writer_.get(), "PRAGMA synchronous = FULL");
  sqlite::exec(writer_.get(), kCreateSamplesSql);
  sqlite::exec(writer_.get(), kCreateRollupsSql);
  sqlite::exec(writer_.get(), kCreateMetaSql);

  auto version = sqlite::prepare(writer_.get(), "INSERT OR REPLACE INTO meta (key, value) VALUES ('schema_version', ?)");
  const std::string version_text = std::to_string(kSchemaVersion);
  sqlite3_bind_text(version.get(), 1, version_text.c_str(), -1, SQLITE_TRANSIENT);
  sqlite::check(sqlite3_step(version.get()), writer_.get(), "write schema version");

  auto tracking = sqlite::prepare(writer_.get(), "INSERT OR IGNORE INTO meta (key, value) VALUES ('tracking_start_ms', ?)");
  const std::string now_text = std::to_string(core::unix_timestamp_now_ms());
  sqlite3_bind_text(tracking.get(), 1, now_text.c_str(), -1, SQLITE_TRANSIENT);
  sqlite::check(sqlite3_step(tracking.get()), writer_.get(), "write tracking start");
}

void SampleStore::require_writable(const char* operation) const {
  if (writer_ == nullptr) {
    throw StoreViolation(std::string(operation) + " on read-only store " + path_);
  }
}

sqlite::DatabasePtr SampleStore::open_reader() const { return sqlite::open(path_, sqlite::OpenMode::kReadOnly); }

void SampleStore::append(const model::ups_sample& sample) {
  require_writable("append");

  if (!std::isfinite(sample.charge_pct) || !std::isfinite(sample.load_pct)) {
    throw StoreViolation("non-finite reading at " + describe(sample));
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  if (latest_.has_value() && sample.timestamp_ms <= latest_->timestamp_ms) {
    throw StoreViolation("non-monotonic timestamp " + describe(sample) + " after " + describe(*latest_));
  }

  sqlite3_stmt* statement = insert_statement_.get();
  sqlite3_reset(statement);
  sqlite3_clear_bindings(statement);
  sqlite3_bind_int64(statement, 1, sample.timestamp_ms);
  sqlite3_bind_int(statement, 2, static_cast<int>(sample.status));
  sqlite3_bind_double(statement, 3, static_cast<double>(sample.charge_pct));
  sqlite3_bind_double(statement, 4, static_cast<double>(sample.load_pct));
  if (sample.runtime_estimate_s.has_value()) {
    sqlite3_bind_int64(statement, 5, *sample.runtime_estimate_s);
  } else {
    sqlite3_bind_null(statement, 5);
  }

  const int rc = sqlite3_step(statement);
  sqlite3_reset(statement);
  if (rc != SQLITE_DONE) {
    throw StoreViolation("append failed at " + describe(sample) + ": " + sqlite3_errmsg(writer_.get()));
  }

  latest_ = sample;
  generation_.fetch_add(1, std::memory_order_release);
}

SampleCursor SampleStore::range(const std::int64_t from_ms, const std::int64_t to_ms) const {
  auto db = open_reader();
  const std::string sql = std::string(kSelectColumns) +
                          "WHERE timestamp_ms >= ? AND timestamp_ms <= ? ORDER BY timestamp_ms ASC";
  auto statement = sqlite::prepare(db.get(), sql.c_str());
  sqlite3_bind_int64(statement.get(), 1, from_ms);
  sqlite3_bind_int64(statement.get(), 2, to_ms);
  return SampleCursor(std::move(db), std::move(statement));
}

std::optional<model::ups_sample> SampleStore::query_single(const char* clause,
                                                           const std::optional<std::int64_t> bound) const {
  auto db = open_reader();
  const std::string sql = std::string(kSelectColumns) + clause;
  auto statement = sqlite::prepare(db.get(), sql.c_str());
  if (bound.has_value()) {
    sqlite3_bind_int64(statement.get(), 1, *bound);
  }

  const int rc = sqlite3_step(statement.get());
  if (rc == SQLITE_ROW) {
    return read_row(statement.get());
  }
  sqlite::check(rc, db.get(), "sample lookup");
  return std::nullopt;
}

std::optional<model::ups_sample> SampleStore::latest() const {
  if (writer_ != nullptr) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return latest_;
  }
  return query_single("ORDER BY timestamp_ms DESC LIMIT 1", std::nullopt);
}

std::optional<model::ups_sample> SampleStore::latest_before(const std::int64_t timestamp_ms) const {
  return query_single("WHERE timestamp_ms < ? ORDER BY timestamp_ms DESC LIMIT 1", timestamp_ms);
}

std::size_t SampleStore::prune(const std::int64_t now_ms) {
  require_writable("prune");

  const std::int64_t cutoff_ms = now_ms - retention_ms_;

  std::lock_guard<std::mutex> lock(write_mutex_);
  sqlite3* db = writer_.get();
  sqlite::Transaction transaction(db);

  auto keep = sqlite::prepare(db, "SELECT MAX(timestamp_ms) FROM samples WHERE timestamp_ms < ?");
  sqlite3_bind_int64(keep.get(), 1, cutoff_ms);
  sqlite::check(sqlite3_step(keep.get()), db, "prune boundary");
  if (sqlite3_column_type(keep.get(), 0) == SQLITE_NULL) {
    transaction.commit();
    return 0;
  }
  // The newest sample before the horizon still describes the start of the longest window.
  const std::int64_t keep_from_ms = sqlite3_column_int64(keep.get(), 0);

  auto rollup = sqlite::prepare(db, kRollupSql);
  sqlite3_bind_int64(rollup.get(), 1, keep_from_ms);
  sqlite::check(sqlite3_step(rollup.get()), db, "prune rollup");

  auto remove = sqlite::prepare(db, "DELETE FROM samples WHERE timestamp_ms < ?");
  sqlite3_bind_int64(remove.get(), 1, keep_from_ms);
  sqlite::check(sqlite3_step(remove.get()), db, "prune delete");
  const auto removed = static_cast<std::size_t>(sqlite3_changes(db));

  transaction.commit();
  if (removed > 0) {
    generation_.fetch_add(1, std::memory_order_release);
  }
  return removed;
}

std::vector<SampleRollup> SampleStore::rollups() const {
  std::vector<SampleRollup> results;

  auto db = open_reader();
  auto statement = sqlite::prepare(db.get(),
                                   "SELECT hour_start_ms, sample_count, avg_load_pct, min_charge_pct, on_battery_samples "
                                   "FROM sample_rollups ORDER BY hour_start_ms ASC");
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(statement.get())) == SQLITE_ROW) {
    SampleRollup row{};
    row.hour_start_ms = sqlite3_column_int64(statement.get(), 0);
    row.sample_count = sqlite3_column_int64(statement.get(), 1);
    row.avg_load_pct = sqlite3_column_double(statement.get(), 2);
    row.min_charge_pct = sqlite3_column_double(statement.get(), 3);
    row.on_battery_samples = sqlite3_column_int64(statement.get(), 4);
    results.push_back(row);
  }
  sqlite::check(rc, db.get(), "read rollups");
  return results;
}

std::uint64_t SampleStore::generation() const noexcept { return generation_.load(std::memory_order_acquire); }

const std::string& SampleStore::path() const noexcept { return path_; }

}  // namespace ups_sentinel::storage
