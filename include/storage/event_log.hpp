#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "model/shutdown_event.hpp"
#include "storage/sqlite.hpp"

namespace ups_sentinel::storage {

// Durable record of shutdown events, kept in the same database file as the samples.
// Write failures surface as std::runtime_error.
class EventLog {
 public:
  explicit EventLog(std::string path, sqlite::OpenMode mode = sqlite::OpenMode::kReadWrite);

  EventLog(const EventLog&) = delete;
  EventLog& operator=(const EventLog&) = delete;

  // Persists a PENDING event and returns it with its assigned id.
  model::shutdown_event create(const std::string& target_host, std::int64_t triggered_at_ms, float charge_at_trigger);

  void finalize(std::int64_t id, model::shutdown_outcome outcome, std::uint32_t attempts, std::int64_t finalized_at_ms);
  void close_episode(std::int64_t id, std::int64_t ended_at_ms);

  // Events still PENDING were interrupted by a restart; they become UNKNOWN.
  std::size_t recover_interrupted(std::int64_t now_ms);

  [[nodiscard]] std::optional<model::shutdown_event> find(std::int64_t id) const;

  // Events whose episode has not ended, oldest first.
  [[nodiscard]] std::vector<model::shutdown_event> open_episodes() const;

  [[nodiscard]] std::vector<model::shutdown_event> history() const;
  [[nodiscard]] model::shutdown_summary summary() const;

 private:
  [[nodiscard]] std::vector<model::shutdown_event> query(const char* clause) const;

  std::string path_;
  mutable std::mutex mutex_;
  sqlite::DatabasePtr db_{};
};

}  // namespace ups_sentinel::storage
