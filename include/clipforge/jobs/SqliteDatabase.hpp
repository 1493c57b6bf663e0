// Repository: ClipForge-render
// Component: SQLite Connection
// Purpose: RAII wrapper over a sqlite3 handle shared by the job store and active set.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_JOBS_SQLITE_DATABASE_HPP_
#define CLIPFORGE_JOBS_SQLITE_DATABASE_HPP_

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace clipforge::jobs {

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

class SqliteStatement;

// One connection per process. Never share a SqliteDatabase across fork():
// each render worker opens its own.
class SqliteDatabase {
 public:
  // Opens (creating if needed) the database at |path|, enables WAL and a
  // busy timeout so the orchestrator and a worker can write concurrently.
  // Throws StoreError on failure.
  explicit SqliteDatabase(const std::string& path);
  ~SqliteDatabase();

  SqliteDatabase(const SqliteDatabase&) = delete;
  SqliteDatabase& operator=(const SqliteDatabase&) = delete;

  void Exec(const std::string& sql);
  SqliteStatement Prepare(const std::string& sql);

  // Rows touched by the last INSERT/UPDATE/DELETE on this connection.
  int Changes() const;

  const std::string& path() const { return path_; }
  sqlite3* handle() const { return db_; }

 private:
  std::string path_;
  sqlite3* db_ = nullptr;
};

class SqliteStatement {
 public:
  SqliteStatement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}
  ~SqliteStatement();

  SqliteStatement(SqliteStatement&& other) noexcept;
  SqliteStatement& operator=(SqliteStatement&&) = delete;
  SqliteStatement(const SqliteStatement&) = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;

  // 1-based parameter index, as in sqlite3_bind_*.
  SqliteStatement& Bind(int index, const std::string& value);
  SqliteStatement& Bind(int index, int64_t value);
  SqliteStatement& BindNull(int index);

  // Returns true while a row is available; false when done. Throws on error.
  bool Step();

  std::string ColumnText(int col) const;
  std::optional<std::string> ColumnOptionalText(int col) const;
  int64_t ColumnInt(int col) const;
  double ColumnDouble(int col) const;
  bool ColumnIsNull(int col) const;

 private:
  sqlite3* db_;
  sqlite3_stmt* stmt_;
};

}  // namespace clipforge::jobs

#endif  // CLIPFORGE_JOBS_SQLITE_DATABASE_HPP_
