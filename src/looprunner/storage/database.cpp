#include "looprunner/storage/database.hpp"

#include "looprunner/util/log.hpp"

#include <sqlite3.h>

namespace looprunner {

auto Database::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

Database::Statement::~Statement() {
  reset();
}

auto Database::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

auto Database::Statement::bind_text(int idx, std::string_view value) -> void {
  sqlite3_bind_text(stmt_, idx, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

auto Database::Statement::bind_int64(int idx, std::int64_t value) -> void {
  sqlite3_bind_int64(stmt_, idx, value);
}

auto Database::Statement::bind_optional(
    int idx, const std::optional<std::string>& value) -> void {
  if (value) {
    bind_text(idx, *value);
  } else {
    sqlite3_bind_null(stmt_, idx);
  }
}

auto Database::Statement::bind_optional(int idx,
                                         std::optional<std::int64_t> value)
    -> void {
  if (value) {
    bind_int64(idx, *value);
  } else {
    sqlite3_bind_null(stmt_, idx);
  }
}

auto Database::Statement::step() -> int {
  return sqlite3_step(stmt_);
}

auto Database::Statement::rewind() -> void {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

auto Database::Statement::col_text(int col) const -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
  if (!p) {
    return {};
  }
  return std::string(p, static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
}

auto Database::Statement::col_int64(int col) const -> std::int64_t {
  return sqlite3_column_int64(stmt_, col);
}

auto Database::Statement::col_is_null(int col) const -> bool {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

auto Database::Statement::col_optional_text(int col) const
    -> std::optional<std::string> {
  if (col_is_null(col)) {
    return std::nullopt;
  }
  return col_text(col);
}

Database::Database(std::string path) : path_(std::move(path)) {
}

Database::~Database() {
  close();
}

auto Database::open(OpenMode mode) -> Result<void> {
  if (db_) {
    return ok();
  }

  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
  if (mode == OpenMode::Create) {
    flags |= SQLITE_OPEN_CREATE;
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open_v2(path_.c_str(), &raw_db, flags, nullptr);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database {}: {}", path_,
               raw_db ? sqlite3_errmsg(raw_db) : sqlite3_errstr(rc));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), 5000);

  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  // FULL: a committed transaction is on disk before COMMIT returns.
  if (auto r = execute("PRAGMA synchronous=FULL;"); !r) {
    close();
    return r;
  }

  log::debug("Database opened: {}", path_);
  return ok();
}

auto Database::close() -> void {
  db_.reset();
}

auto Database::execute(std::string_view sql) -> Result<void> {
  if (!db_) {
    return fail(Error::DatabaseQueryFailed);
  }
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error on {}: {}", path_, err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto Database::prepare(const char* sql) -> Result<Statement> {
  if (!db_) {
    return fail(Error::DatabaseQueryFailed);
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return Statement{stmt};
}

auto Database::changes() const -> int {
  return db_ ? sqlite3_changes(db_.get()) : 0;
}

auto Database::last_error() const -> std::string {
  return db_ ? sqlite3_errmsg(db_.get()) : "database not open";
}

auto Database::quick_check() -> Result<void> {
  auto stmt = prepare("PRAGMA quick_check;");
  if (!stmt) {
    return fail(Error::ResumeInconsistency);
  }
  if (stmt->step() != SQLITE_ROW) {
    return fail(Error::ResumeInconsistency);
  }
  auto verdict = stmt->col_text(0);
  if (verdict != "ok") {
    log::error("Integrity check failed for {}: {}", path_, verdict);
    return fail(Error::ResumeInconsistency);
  }
  return ok();
}

auto Database::begin_transaction() -> Result<void> {
  return execute("BEGIN IMMEDIATE;");
}

auto Database::commit_transaction() -> Result<void> {
  return execute("COMMIT;");
}

auto Database::rollback_transaction() -> Result<void> {
  return execute("ROLLBACK;");
}

}  // namespace looprunner
