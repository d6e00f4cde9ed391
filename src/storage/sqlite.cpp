#include "storage/sqlite.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

#include <sqlite3.h>

namespace ups_sentinel::storage::sqlite {

void DatabaseCloser::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close_v2(db);
  }
}

void StatementFinalizer::operator()(sqlite3_stmt* statement) const {
  if (statement != nullptr) {
    sqlite3_finalize(statement);
  }
}

void check(const int rc, sqlite3* db, const char* what) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) {
    return;
  }
  std::string message = what;
  message += ": ";
  message += db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  throw std::runtime_error(message);
}

DatabasePtr open(const std::string& path, const OpenMode mode) {
  const int flags = mode == OpenMode::kReadOnly ? SQLITE_OPEN_READONLY
                                                : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(path.c_str(), &raw, flags | SQLITE_OPEN_NOMUTEX, nullptr);
  DatabasePtr db(raw);
  if (rc != SQLITE_OK) {
    std::string message = "sqlite3_open_v2 failed for " + path + ": ";
    message += raw != nullptr ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
    throw std::runtime_error(message);
  }

  sqlite3_busy_timeout(db.get(), static_cast<int>(kBusyTimeout.count()));
  return db;
}

void exec(sqlite3* db, const char* sql) {
  char* error = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &error);
  if (rc != SQLITE_OK) {
    std::string message = "sqlite exec failed: ";
    message += error != nullptr ? error : sqlite3_errstr(rc);
    sqlite3_free(error);
    throw std::runtime_error(message);
  }
}

StatementPtr prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* raw = nullptr;
  const int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr);
  StatementPtr statement(raw);
  check(rc, db, "sqlite3_prepare_v2");
  return statement;
}

Transaction::Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN IMMEDIATE"); }

Transaction::~Transaction() {
  if (done_) {
    return;
  }
  char* error = nullptr;
  if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &error) != SQLITE_OK) {
    std::cerr << "[store] rollback failed: " << (error != nullptr ? error : "unknown") << '\n';
  }
  sqlite3_free(error);
}

void Transaction::commit() {
  exec(db_, "COMMIT");
  done_ = true;
}

}  // namespace ups_sentinel::storage::sqlite
