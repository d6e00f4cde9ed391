#pragma once

#include <chrono>
#include <memory>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace ups_sentinel::storage::sqlite {

struct DatabaseCloser {
  void operator()(sqlite3* db) const;
};

struct StatementFinalizer {
  void operator()(sqlite3_stmt* statement) const;
};

using DatabasePtr = std::unique_ptr<sqlite3, DatabaseCloser>;
using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

enum class OpenMode {
  kReadWrite,
  kReadOnly,
};

inline constexpr std::chrono::milliseconds kBusyTimeout{2000};

// Throws std::runtime_error when the database cannot be opened.
DatabasePtr open(const std::string& path, OpenMode mode);

void exec(sqlite3* db, const char* sql);
StatementPtr prepare(sqlite3* db, const char* sql);

// Throws std::runtime_error carrying sqlite3_errmsg unless rc is OK/ROW/DONE.
void check(int rc, sqlite3* db, const char* what);

// RAII BEGIN IMMEDIATE ... COMMIT; rolls back if commit() was not reached.
class Transaction {
 public:
  explicit Transaction(sqlite3* db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit();

 private:
  sqlite3* db_;
  bool done_{false};
};

}  // namespace ups_sentinel::storage::sqlite
