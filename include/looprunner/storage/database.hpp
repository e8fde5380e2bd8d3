#pragma once

#include "looprunner/core/error.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

struct sqlite3;
struct sqlite3_stmt;

namespace looprunner {

// Thin RAII wrapper over one SQLite connection.
class Database {
public:
  enum class OpenMode : std::uint8_t {
    Create,
    // Fails when the file does not exist.
    Existing,
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    [[nodiscard]] explicit operator bool() const noexcept {
      return stmt_ != nullptr;
    }
    auto reset() -> void;

    auto bind_text(int idx, std::string_view value) -> void;
    auto bind_int64(int idx, std::int64_t value) -> void;
    // NULL when empty.
    auto bind_optional(int idx, const std::optional<std::string>& value)
        -> void;
    auto bind_optional(int idx, std::optional<std::int64_t> value) -> void;

    // SQLITE_ROW, SQLITE_DONE or an error code.
    [[nodiscard]] auto step() -> int;
    // Rebinds for batch reuse.
    auto rewind() -> void;

    [[nodiscard]] auto col_text(int col) const -> std::string;
    [[nodiscard]] auto col_int64(int col) const -> std::int64_t;
    [[nodiscard]] auto col_is_null(int col) const -> bool;
    [[nodiscard]] auto col_optional_text(int col) const
        -> std::optional<std::string>;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  explicit Database(std::string path);
  ~Database();

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  [[nodiscard]] auto open(OpenMode mode) -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }
  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return path_;
  }

  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<Statement>;
  [[nodiscard]] auto changes() const -> int;
  [[nodiscard]] auto last_error() const -> std::string;

  // PRAGMA quick_check; fails with ResumeInconsistency on a damaged file.
  [[nodiscard]] auto quick_check() -> Result<void>;

  [[nodiscard]] auto begin_transaction() -> Result<void>;
  [[nodiscard]] auto commit_transaction() -> Result<void>;
  [[nodiscard]] auto rollback_transaction() -> Result<void>;

private:
  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  std::string path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

// Runs `body` inside BEGIN IMMEDIATE / COMMIT, rolling back on failure.
template <typename Fn>
[[nodiscard]] auto in_transaction(Database& db, Fn&& body) -> Result<void> {
  if (auto r = db.begin_transaction(); !r) {
    return r;
  }
  if (auto r = std::forward<Fn>(body)(); !r) {
    (void)db.rollback_transaction();
    return r;
  }
  if (auto r = db.commit_transaction(); !r) {
    (void)db.rollback_transaction();
    return r;
  }
  return ok();
}

}  // namespace looprunner
