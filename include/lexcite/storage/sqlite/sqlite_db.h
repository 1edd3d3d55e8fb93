#pragma once

#include "lexcite/core/result.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace lexcite::storage::sqlite {

enum class OpenMode {
  kReadOnly,
  kReadWrite,
};

// SqliteDb owns one connection to a registry database.
// The database is built by the upstream ingestion; this layer only reads
// it. kReadWrite is for fixtures that build their own schema.
class SqliteDb {
 public:
  // Open database at path. ":memory:" creates an empty in-memory database.
  // kReadWrite creates the file when it does not exist.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path, OpenMode mode = OpenMode::kReadOnly);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Execute one or more SQL statements that return no rows.
  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  [[nodiscard]] bool has_table(const std::string& name) const;

  // Raw connection, for PreparedStatement only.
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

enum class StepResult {
  kRow,
  kDone,
  kError,
};

// RAII wrapper for prepared statements. Parameter indices are 1-based and
// column indices 0-based, as in the SQLite C API.
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }

  // Preparation error, or the error of the last failed step.
  [[nodiscard]] const std::string& error() const { return error_; }

  void bind_text(int index, std::string_view value);
  void bind_int(int index, int value);

  [[nodiscard]] StepResult step();

  [[nodiscard]] std::string column_text(int column) const;  // "" for NULL
  [[nodiscard]] std::optional<std::string> column_optional_text(int column) const;
  [[nodiscard]] int column_int(int column) const;
  [[nodiscard]] std::optional<int> column_optional_int(int column) const;
  [[nodiscard]] std::int64_t column_int64(int column) const;
  [[nodiscard]] double column_double(int column) const;

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  sqlite3* db_;
  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace lexcite::storage::sqlite
