// Repository: ClipForge-render
// Component: SQLite Connection
// Purpose: RAII wrapper over a sqlite3 handle shared by the job store and active set.
// Copyright (c) 2025 ClipForge

#include "clipforge/jobs/SqliteDatabase.hpp"

#include <sqlite3.h>

namespace clipforge::jobs {

namespace {

constexpr int kBusyTimeoutMs = 10000;

std::string LastError(sqlite3* db) {
  return db ? sqlite3_errmsg(db) : "unknown error";
}

}  // namespace

SqliteDatabase::SqliteDatabase(const std::string& path) : path_(path) {
  if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
    const std::string message = LastError(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw StoreError("Failed to open SQLite database at " + path + ": " + message);
  }
  sqlite3_busy_timeout(db_, kBusyTimeoutMs);
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
}

SqliteDatabase::~SqliteDatabase() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void SqliteDatabase::Exec(const std::string& sql) {
  char* errmsg = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
    std::string message = errmsg ? errmsg : "unknown error";
    sqlite3_free(errmsg);
    throw StoreError("SQLite exec failed: " + message);
  }
}

SqliteStatement SqliteDatabase::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    throw StoreError("SQLite prepare failed: " + LastError(db_) + " [" + sql + "]");
  }
  return SqliteStatement(db_, stmt);
}

int SqliteDatabase::Changes() const {
  return sqlite3_changes(db_);
}

SqliteStatement::~SqliteStatement() {
  if (stmt_) {
    sqlite3_finalize(stmt_);
  }
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_) {
  other.stmt_ = nullptr;
}

SqliteStatement& SqliteStatement::Bind(int index, const std::string& value) {
  if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK) {
    throw StoreError("SQLite bind failed: " + LastError(db_));
  }
  return *this;
}

SqliteStatement& SqliteStatement::Bind(int index, int64_t value) {
  if (sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
    throw StoreError("SQLite bind failed: " + LastError(db_));
  }
  return *this;
}

SqliteStatement& SqliteStatement::BindNull(int index) {
  if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
    throw StoreError("SQLite bind failed: " + LastError(db_));
  }
  return *this;
}

bool SqliteStatement::Step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw StoreError("SQLite step failed: " + LastError(db_));
}

std::string SqliteStatement::ColumnText(int col) const {
  const unsigned char* text = sqlite3_column_text(stmt_, col);
  return text ? reinterpret_cast<const char*>(text) : "";
}

std::optional<std::string> SqliteStatement::ColumnOptionalText(int col) const {
  if (ColumnIsNull(col)) return std::nullopt;
  return ColumnText(col);
}

int64_t SqliteStatement::ColumnInt(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

double SqliteStatement::ColumnDouble(int col) const {
  return sqlite3_column_double(stmt_, col);
}

bool SqliteStatement::ColumnIsNull(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

}  // namespace clipforge::jobs
