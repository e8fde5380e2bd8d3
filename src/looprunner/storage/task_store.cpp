#include "looprunner/storage/task_store.hpp"

#include "looprunner/task/state_strings.hpp"
#include "looprunner/util/log.hpp"

#include <sqlite3.h>

#include <system_error>

namespace looprunner {

namespace {

auto optional_int(const std::optional<int>& v) -> std::optional<std::int64_t> {
  if (v) {
    return static_cast<std::int64_t>(*v);
  }
  return std::nullopt;
}

}  // namespace

TaskStore::TaskStore(std::filesystem::path path)
    : path_(std::move(path)), db_(path_.string()) {
}

auto TaskStore::create_tables() -> Result<void> {
  return db_.execute(R"(
    CREATE TABLE IF NOT EXISTS task (
      singleton INTEGER PRIMARY KEY CHECK (singleton = 1),
      id TEXT NOT NULL,
      prompt TEXT NOT NULL,
      fixup_prompt TEXT,
      verify_command TEXT,
      allowlist_pattern TEXT NOT NULL,
      max_retries INTEGER NOT NULL,
      concurrency INTEGER NOT NULL,
      max_files INTEGER,
      input_file TEXT NOT NULL DEFAULT '',
      working_dir TEXT NOT NULL DEFAULT '',
      description TEXT NOT NULL DEFAULT '',
      branch TEXT,
      created_at INTEGER NOT NULL,
      updated_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS file_states (
      ordinal INTEGER NOT NULL,
      path TEXT PRIMARY KEY,
      status TEXT NOT NULL,
      retry_count INTEGER NOT NULL DEFAULT 0,
      last_error TEXT,
      metadata TEXT NOT NULL DEFAULT 'null',
      result TEXT
    );

    CREATE INDEX IF NOT EXISTS idx_file_states_ordinal
      ON file_states(ordinal);
  )");
}

auto TaskStore::create(const Task& task) -> Result<void> {
  std::lock_guard lock(mu_);

  std::error_code ec;
  if (std::filesystem::exists(path_, ec)) {
    log::error("State file already exists: {}", path_.string());
    return fail(Error::AlreadyExists);
  }
  if (auto r = db_.open(Database::OpenMode::Create); !r) {
    return r;
  }
  if (auto r = create_tables(); !r) {
    return r;
  }

  return in_transaction(db_, [&]() -> Result<void> {
    if (auto r = write_task_row(task); !r) {
      return r;
    }
    std::int64_t ordinal = 0;
    for (const auto& f : task.files()) {
      if (auto r = upsert_file(f, ordinal++); !r) {
        return r;
      }
    }
    return ok();
  });
}

auto TaskStore::open_existing() -> Result<void> {
  std::lock_guard lock(mu_);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path_, ec)) {
    log::error("State file missing: {}", path_.string());
    return fail(Error::ResumeInconsistency);
  }
  if (auto r = db_.open(Database::OpenMode::Existing); !r) {
    return fail(Error::ResumeInconsistency);
  }
  return db_.quick_check();
}

auto TaskStore::load() -> Result<Task> {
  std::lock_guard lock(mu_);

  auto task_stmt = db_.prepare(R"(
    SELECT id, prompt, fixup_prompt, verify_command, allowlist_pattern,
           max_retries, concurrency, max_files, input_file, working_dir,
           description, branch, created_at, updated_at
    FROM task WHERE singleton = 1;
  )");
  if (!task_stmt) {
    return fail(Error::ResumeInconsistency);
  }
  if (task_stmt->step() != SQLITE_ROW) {
    log::error("State file {} has no task record", path_.string());
    return fail(Error::ResumeInconsistency);
  }

  TaskConfig config;
  config.prompt = task_stmt->col_text(1);
  config.fixup_prompt = task_stmt->col_optional_text(2);
  config.verify_command = task_stmt->col_optional_text(3);
  config.allowlist_pattern = task_stmt->col_text(4);
  config.max_retries = static_cast<int>(task_stmt->col_int64(5));
  config.concurrency = static_cast<int>(task_stmt->col_int64(6));
  if (!task_stmt->col_is_null(7)) {
    config.max_files = static_cast<int>(task_stmt->col_int64(7));
  }
  config.input_file = task_stmt->col_text(8);
  config.working_dir = task_stmt->col_text(9);
  config.description = task_stmt->col_text(10);
  config.branch = task_stmt->col_optional_text(11);

  Task task(TaskId{task_stmt->col_text(0)}, std::move(config));
  task.set_created_at(task_stmt->col_int64(12));
  task.set_updated_at(task_stmt->col_int64(13));
  if (task.id().empty() || !task.config().validate()) {
    log::error("State file {} holds an invalid task record", path_.string());
    return fail(Error::ResumeInconsistency);
  }

  auto files_stmt = db_.prepare(R"(
    SELECT path, status, retry_count, last_error, metadata, result
    FROM file_states ORDER BY ordinal;
  )");
  if (!files_stmt) {
    return fail(Error::ResumeInconsistency);
  }

  int rc = SQLITE_OK;
  while ((rc = files_stmt->step()) == SQLITE_ROW) {
    FileState f;
    f.path = files_stmt->col_text(0);
    auto status_name = files_stmt->col_text(1);
    auto status = parse_file_status(status_name);
    if (!status) {
      log::error("File {} has unknown status '{}'", f.path, status_name);
      return fail(Error::ResumeInconsistency);
    }
    f.status = *status;
    f.retry_count = static_cast<int>(files_stmt->col_int64(2));
    f.last_error = files_stmt->col_optional_text(3);
    f.metadata = files_stmt->col_text(4);
    f.result = files_stmt->col_optional_text(5);

    if (f.retry_count < 0 || f.retry_count > task.config().max_retries) {
      log::error("File {} has retry_count {} outside [0, {}]", f.path,
                 f.retry_count, task.config().max_retries);
      return fail(Error::ResumeInconsistency);
    }
    if (auto r = task.restore_file(std::move(f)); !r) {
      return fail(Error::ResumeInconsistency);
    }
  }
  if (rc != SQLITE_DONE) {
    return fail(Error::ResumeInconsistency);
  }
  return task;
}

auto TaskStore::save_file(const FileState& state, std::int64_t updated_at)
    -> Result<void> {
  std::lock_guard lock(mu_);
  return in_transaction(db_, [&]() -> Result<void> {
    if (auto r = update_file(state); !r) {
      return r;
    }
    return write_updated_at(updated_at);
  });
}

auto TaskStore::save_config(const TaskConfig& config, std::int64_t updated_at)
    -> Result<void> {
  std::lock_guard lock(mu_);
  return in_transaction(db_,
                        [&]() -> Result<void> {
                          return write_config(config, updated_at);
                        });
}

auto TaskStore::save_all(const Task& task) -> Result<void> {
  std::lock_guard lock(mu_);
  return in_transaction(db_, [&]() -> Result<void> {
    if (auto r = write_task_row(task); !r) {
      return r;
    }
    std::int64_t ordinal = 0;
    for (const auto& f : task.files()) {
      if (auto r = upsert_file(f, ordinal++); !r) {
        return r;
      }
    }
    return ok();
  });
}

auto TaskStore::write_task_row(const Task& task) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO task
      (singleton, id, prompt, fixup_prompt, verify_command, allowlist_pattern,
       max_retries, concurrency, max_files, input_file, working_dir,
       description, branch, created_at, updated_at)
    VALUES (1, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(singleton) DO UPDATE SET
      id = excluded.id,
      prompt = excluded.prompt,
      fixup_prompt = excluded.fixup_prompt,
      verify_command = excluded.verify_command,
      allowlist_pattern = excluded.allowlist_pattern,
      max_retries = excluded.max_retries,
      concurrency = excluded.concurrency,
      max_files = excluded.max_files,
      input_file = excluded.input_file,
      working_dir = excluded.working_dir,
      description = excluded.description,
      branch = excluded.branch,
      updated_at = excluded.updated_at;
  )";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());

  const auto& c = task.config();
  stmt->bind_text(1, task.id().value());
  stmt->bind_text(2, c.prompt);
  stmt->bind_optional(3, c.fixup_prompt);
  stmt->bind_optional(4, c.verify_command);
  stmt->bind_text(5, c.allowlist_pattern);
  stmt->bind_int64(6, c.max_retries);
  stmt->bind_int64(7, c.concurrency);
  stmt->bind_optional(8, optional_int(c.max_files));
  stmt->bind_text(9, c.input_file);
  stmt->bind_text(10, c.working_dir);
  stmt->bind_text(11, c.description);
  stmt->bind_optional(12, c.branch);
  stmt->bind_int64(13, task.created_at());
  stmt->bind_int64(14, task.updated_at());

  if (stmt->step() != SQLITE_DONE) {
    log::error("Failed to write task record: {}", db_.last_error());
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto TaskStore::write_config(const TaskConfig& c, std::int64_t updated_at)
    -> Result<void> {
  constexpr auto sql = R"(
    UPDATE task SET
      prompt = ?, fixup_prompt = ?, verify_command = ?, allowlist_pattern = ?,
      max_retries = ?, concurrency = ?, max_files = ?, input_file = ?,
      working_dir = ?, description = ?, branch = ?, updated_at = ?
    WHERE singleton = 1;
  )";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());

  stmt->bind_text(1, c.prompt);
  stmt->bind_optional(2, c.fixup_prompt);
  stmt->bind_optional(3, c.verify_command);
  stmt->bind_text(4, c.allowlist_pattern);
  stmt->bind_int64(5, c.max_retries);
  stmt->bind_int64(6, c.concurrency);
  stmt->bind_optional(7, optional_int(c.max_files));
  stmt->bind_text(8, c.input_file);
  stmt->bind_text(9, c.working_dir);
  stmt->bind_text(10, c.description);
  stmt->bind_optional(11, c.branch);
  stmt->bind_int64(12, updated_at);

  if (stmt->step() != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  if (db_.changes() == 0) {
    return fail(Error::NotFound);
  }
  return ok();
}

auto TaskStore::upsert_file(const FileState& f, std::int64_t ordinal)
    -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO file_states
      (ordinal, path, status, retry_count, last_error, metadata, result)
    VALUES (?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(path) DO UPDATE SET
      ordinal = excluded.ordinal,
      status = excluded.status,
      retry_count = excluded.retry_count,
      last_error = excluded.last_error,
      metadata = excluded.metadata,
      result = excluded.result;
  )";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());

  stmt->bind_int64(1, ordinal);
  stmt->bind_text(2, f.path);
  stmt->bind_text(3, file_status_name(f.status));
  stmt->bind_int64(4, f.retry_count);
  stmt->bind_optional(5, f.last_error);
  stmt->bind_text(6, f.metadata);
  stmt->bind_optional(7, f.result);

  if (stmt->step() != SQLITE_DONE) {
    log::error("Failed to write state of {}: {}", f.path, db_.last_error());
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto TaskStore::update_file(const FileState& f) -> Result<void> {
  constexpr auto sql = R"(
    UPDATE file_states SET
      status = ?, retry_count = ?, last_error = ?, metadata = ?, result = ?
    WHERE path = ?;
  )";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());

  stmt->bind_text(1, file_status_name(f.status));
  stmt->bind_int64(2, f.retry_count);
  stmt->bind_optional(3, f.last_error);
  stmt->bind_text(4, f.metadata);
  stmt->bind_optional(5, f.result);
  stmt->bind_text(6, f.path);

  if (stmt->step() != SQLITE_DONE) {
    log::error("Failed to write state of {}: {}", f.path, db_.last_error());
    return fail(Error::DatabaseQueryFailed);
  }
  if (db_.changes() == 0) {
    return fail(Error::NotFound);
  }
  return ok();
}

auto TaskStore::write_updated_at(std::int64_t updated_at) -> Result<void> {
  auto stmt = db_.prepare("UPDATE task SET updated_at = ? WHERE singleton = 1;");
  if (!stmt)
    return std::unexpected(stmt.error());
  stmt->bind_int64(1, updated_at);
  return stmt->step() == SQLITE_DONE ? ok() : fail(Error::DatabaseQueryFailed);
}

}  // namespace looprunner
