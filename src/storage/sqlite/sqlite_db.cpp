#include "lexcite/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace lexcite::storage::sqlite {

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path,
                                                                    const OpenMode mode) {
  const int flags = mode == OpenMode::kReadOnly ? SQLITE_OPEN_READONLY
                                                : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

  sqlite3* db = nullptr;
  const int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    sqlite3_close(db);
    return core::Result<std::shared_ptr<SqliteDb>, std::string>::err(
        "Failed to open database " + path + ": " + error);
  }

  return core::Result<std::shared_ptr<SqliteDb>, std::string>::ok(
      std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("SQL execution failed: " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

bool SqliteDb::has_table(const std::string& name) const {
  PreparedStatement stmt(db_.get(), "SELECT 1 FROM sqlite_master WHERE name = ? LIMIT 1");
  if (!stmt.is_valid()) {
    return false;
  }
  stmt.bind_text(1, name);
  return stmt.step() == StepResult::kRow;
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) : db_(db) {
  sqlite3_stmt* raw_stmt = nullptr;
  const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw_stmt);
  } else {
    stmt_.reset(raw_stmt);
  }
}

void PreparedStatement::bind_text(const int index, const std::string_view value) {
  sqlite3_bind_text(stmt_.get(), index, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

void PreparedStatement::bind_int(const int index, const int value) {
  sqlite3_bind_int(stmt_.get(), index, value);
}

StepResult PreparedStatement::step() {
  const int rc = sqlite3_step(stmt_.get());
  if (rc == SQLITE_ROW) {
    return StepResult::kRow;
  }
  if (rc == SQLITE_DONE) {
    return StepResult::kDone;
  }
  error_ = sqlite3_errmsg(db_);
  return StepResult::kError;
}

std::string PreparedStatement::column_text(const int column) const {
  const auto* text = sqlite3_column_text(stmt_.get(), column);
  if (text == nullptr) {
    return {};
  }
  return {reinterpret_cast<const char*>(text),
          static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), column))};
}

std::optional<std::string> PreparedStatement::column_optional_text(const int column) const {
  if (sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(column);
}

int PreparedStatement::column_int(const int column) const {
  return sqlite3_column_int(stmt_.get(), column);
}

std::optional<int> PreparedStatement::column_optional_int(const int column) const {
  if (sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_int(column);
}

std::int64_t PreparedStatement::column_int64(const int column) const {
  return sqlite3_column_int64(stmt_.get(), column);
}

double PreparedStatement::column_double(const int column) const {
  return sqlite3_column_double(stmt_.get(), column);
}

}  // namespace lexcite::storage::sqlite
