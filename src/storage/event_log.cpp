#include "storage/event_log.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <sqlite3.h>

namespace ups_sentinel::storage {

namespace {

constexpr const char* kCreateEventsSql = R"(
    CREATE TABLE IF NOT EXISTS shutdown_events (
        id                  INTEGER PRIMARY KEY AUTOINCREMENT,
        target_host         TEXT    NOT NULL,
        triggered_at_ms     INTEGER NOT NULL,
        charge_at_trigger   REAL    NOT NULL,
        outcome             INTEGER NOT NULL,
        attempts            INTEGER NOT NULL DEFAULT 0,
        finalized_at_ms     INTEGER,
        episode_ended_at_ms INTEGER
    )
)";

constexpr const char* kSelectColumns =
    "SELECT id, target_host, triggered_at_ms, charge_at_trigger, outcome, attempts, finalized_at_ms, "
    "episode_ended_at_ms FROM shutdown_events ";

model::shutdown_outcome outcome_from_column(const int value) {
  if (value < 0 || value > static_cast<int>(model::shutdown_outcome::UNKNOWN)) {
    return model::shutdown_outcome::UNKNOWN;
  }
  return static_cast<model::shutdown_outcome>(value);
}

std::optional<std::int64_t> optional_int64(sqlite3_stmt* statement, const int column) {
  if (sqlite3_column_type(statement, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return sqlite3_column_int64(statement, column);
}

model::shutdown_event read_row(sqlite3_stmt* statement) {
  model::shutdown_event event{};
  event.id = sqlite3_column_int64(statement, 0);
  const auto* host = reinterpret_cast<const char*>(sqlite3_column_text(statement, 1));
  event.target_host = host != nullptr ? host : "";
  event.triggered_at_ms = sqlite3_column_int64(statement, 2);
  event.charge_at_trigger = static_cast<float>(sqlite3_column_double(statement, 3));
  event.outcome = outcome_from_column(sqlite3_column_int(statement, 4));
  event.attempts = static_cast<std::uint32_t>(sqlite3_column_int64(statement, 5));
  event.finalized_at_ms = optional_int64(statement, 6);
  event.episode_ended_at_ms = optional_int64(statement, 7);
  return event;
}

}  // namespace

EventLog::EventLog(std::string path, const sqlite::OpenMode mode) : path_(std::move(path)) {
  db_ = sqlite::open(path_, mode);
  if (mode == sqlite::OpenMode::kReadWrite) {
    sqlite::exec(db_.get(), "PRAGMA journal_mode = WAL");
    sqlite::exec(db_.get(), "PRAGMA synchronous = FULL");
    sqlite::exec(db_.get(), kCreateEventsSql);
  }
}

model::shutdown_event EventLog::create(const std::string& target_host, const std::int64_t triggered_at_ms,
                                       const float charge_at_trigger) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto statement = sqlite::prepare(
      db_.get(),
      "INSERT INTO shutdown_events (target_host, triggered_at_ms, charge_at_trigger, outcome, attempts) "
      "VALUES (?, ?, ?, ?, 0)");
  sqlite3_bind_text(statement.get(), 1, target_host.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(statement.get(), 2, triggered_at_ms);
  sqlite3_bind_double(statement.get(), 3, static_cast<double>(charge_at_trigger));
  sqlite3_bind_int(statement.get(), 4, static_cast<int>(model::shutdown_outcome::PENDING));
  sqlite::check(sqlite3_step(statement.get()), db_.get(), "create shutdown event");

  model::shutdown_event event{};
  event.id = sqlite3_last_insert_rowid(db_.get());
  event.target_host = target_host;
  event.triggered_at_ms = triggered_at_ms;
  event.charge_at_trigger = charge_at_trigger;
  return event;
}

void EventLog::finalize(const std::int64_t id, const model::shutdown_outcome outcome, const std::uint32_t attempts,
                        const std::int64_t finalized_at_ms) {
  if (outcome == model::shutdown_outcome::PENDING) {
    throw std::invalid_argument("cannot finalize shutdown event with a pending outcome");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto statement = sqlite::prepare(
      db_.get(), "UPDATE shutdown_events SET outcome = ?, attempts = ?, finalized_at_ms = ? WHERE id = ? AND outcome = 0");
  sqlite3_bind_int(statement.get(), 1, static_cast<int>(outcome));
  sqlite3_bind_int64(statement.get(), 2, attempts);
  sqlite3_bind_int64(statement.get(), 3, finalized_at_ms);
  sqlite3_bind_int64(statement.get(), 4, id);
  sqlite::check(sqlite3_step(statement.get()), db_.get(), "finalize shutdown event");
  if (sqlite3_changes(db_.get()) == 0) {
    throw std::runtime_error("shutdown event " + std::to_string(id) + " is missing or already finalized");
  }
}

void EventLog::close_episode(const std::int64_t id, const std::int64_t ended_at_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto statement = sqlite::prepare(
      db_.get(), "UPDATE shutdown_events SET episode_ended_at_ms = ? WHERE id = ? AND episode_ended_at_ms IS NULL");
  sqlite3_bind_int64(statement.get(), 1, ended_at_ms);
  sqlite3_bind_int64(statement.get(), 2, id);
  sqlite::check(sqlite3_step(statement.get()), db_.get(), "close shutdown episode");
}

std::size_t EventLog::recover_interrupted(const std::int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto statement = sqlite::prepare(
      db_.get(), "UPDATE shutdown_events SET outcome = ?, finalized_at_ms = ? WHERE outcome = 0");
  sqlite3_bind_int(statement.get(), 1, static_cast<int>(model::shutdown_outcome::UNKNOWN));
  sqlite3_bind_int64(statement.get(), 2, now_ms);
  sqlite::check(sqlite3_step(statement.get()), db_.get(), "recover interrupted shutdown events");

  const auto recovered = static_cast<std::size_t>(sqlite3_changes(db_.get()));
  if (recovered > 0) {
    std::cerr << "[events] " << recovered << " shutdown event(s) interrupted by restart, outcome unknown\n";
  }
  return recovered;
}

std::vector<model::shutdown_event> EventLog::query(const char* clause) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string sql = std::string(kSelectColumns) + clause;
  auto statement = sqlite::prepare(db_.get(), sql.c_str());

  std::vector<model::shutdown_event> events;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(statement.get())) == SQLITE_ROW) {
    events.push_back(read_row(statement.get()));
  }
  sqlite::check(rc, db_.get(), "read shutdown events");
  return events;
}

std::optional<model::shutdown_event> EventLog::find(const std::int64_t id) const {
  const std::string clause = "WHERE id = " + std::to_string(id);
  auto events = query(clause.c_str());
  if (events.empty()) {
    return std::nullopt;
  }
  return events.front();
}

std::vector<model::shutdown_event> EventLog::open_episodes() const {
  return query("WHERE episode_ended_at_ms IS NULL ORDER BY id ASC");
}

std::vector<model::shutdown_event> EventLog::history() const { return query("ORDER BY id ASC"); }

model::shutdown_summary EventLog::summary() const {
  model::shutdown_summary summary{};

  const auto latest = query("ORDER BY triggered_at_ms DESC, id DESC LIMIT 1");
  if (!latest.empty()) {
    summary.last_triggered_at_ms = latest.front().triggered_at_ms;
    summary.last_outcome = latest.front().outcome;
  }
  summary.episode_active = !query("WHERE episode_ended_at_ms IS NULL LIMIT 1").empty();
  return summary;
}

}  // namespace ups_sentinel::storage
