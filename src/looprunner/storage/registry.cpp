#include "looprunner/storage/registry.hpp"

#include "looprunner/util/log.hpp"

#include <sqlite3.h>

#include <format>
#include <system_error>

namespace looprunner {

TaskRegistry::TaskRegistry(std::filesystem::path tasks_dir)
    : tasks_dir_(std::move(tasks_dir)),
      db_((tasks_dir_ / kFileName).string()) {
}

auto TaskRegistry::open() -> Result<void> {
  std::error_code ec;
  std::filesystem::create_directories(tasks_dir_, ec);
  if (ec) {
    log::error("Failed to create tasks directory {}: {}", tasks_dir_.string(),
               ec.message());
    return fail(Error::FileOpenFailed);
  }
  if (auto r = db_.open(Database::OpenMode::Create); !r) {
    return r;
  }
  return create_tables();
}

auto TaskRegistry::create_tables() -> Result<void> {
  return db_.execute(R"(
    CREATE TABLE IF NOT EXISTS tasks (
      seq INTEGER PRIMARY KEY,
      task_id TEXT NOT NULL UNIQUE,
      state_file TEXT NOT NULL,
      status TEXT NOT NULL DEFAULT 'incomplete',
      description TEXT NOT NULL DEFAULT '',
      working_dir TEXT NOT NULL DEFAULT '',
      created_at INTEGER NOT NULL,
      updated_at INTEGER NOT NULL
    );
  )");
}

auto TaskRegistry::state_file_name(std::int64_t seq) -> std::string {
  return std::format("state_{}.db", seq);
}

auto TaskRegistry::state_path(const RegistryEntry& entry) const
    -> std::filesystem::path {
  return tasks_dir_ / entry.state_file;
}

auto TaskRegistry::next_sequence() -> Result<std::int64_t> {
  auto stmt = db_.prepare("SELECT COALESCE(MAX(seq), 0) FROM tasks;");
  if (!stmt)
    return std::unexpected(stmt.error());
  if (stmt->step() != SQLITE_ROW) {
    return fail(Error::DatabaseQueryFailed);
  }
  std::int64_t seq = stmt->col_int64(0) + 1;

  std::error_code ec;
  while (std::filesystem::exists(tasks_dir_ / state_file_name(seq), ec)) {
    log::warn("Skipping orphaned state file {}", state_file_name(seq));
    ++seq;
  }
  return seq;
}

auto TaskRegistry::append(const RegistryEntry& entry) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO tasks
      (seq, task_id, state_file, status, description, working_dir,
       created_at, updated_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?);
  )";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());

  stmt->bind_int64(1, entry.seq);
  stmt->bind_text(2, entry.task_id.value());
  stmt->bind_text(3, entry.state_file);
  stmt->bind_text(4, registry_status_name(entry.status));
  stmt->bind_text(5, entry.description);
  stmt->bind_text(6, entry.working_dir);
  stmt->bind_int64(7, entry.created_at);
  stmt->bind_int64(8, entry.updated_at);

  if (stmt->step() != SQLITE_DONE) {
    log::error("Failed to append registry entry {}: {}", entry.task_id,
               db_.last_error());
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto TaskRegistry::set_status(const TaskId& id, RegistryStatus status,
                              std::int64_t updated_at) -> Result<void> {
  constexpr auto sql =
      "UPDATE tasks SET status = ?, updated_at = ? WHERE task_id = ?;";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());

  stmt->bind_text(1, registry_status_name(status));
  stmt->bind_int64(2, updated_at);
  stmt->bind_text(3, id.value());

  if (stmt->step() != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  if (db_.changes() == 0) {
    return fail(Error::NotFound);
  }
  return ok();
}

auto TaskRegistry::touch(const TaskId& id, std::int64_t updated_at)
    -> Result<void> {
  auto stmt = db_.prepare("UPDATE tasks SET updated_at = ? WHERE task_id = ?;");
  if (!stmt)
    return std::unexpected(stmt.error());
  stmt->bind_int64(1, updated_at);
  stmt->bind_text(2, id.value());
  if (stmt->step() != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto TaskRegistry::read_entries(const char* sql, const std::string* key)
    -> Result<std::vector<RegistryEntry>> {
  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  if (key != nullptr) {
    stmt->bind_text(1, *key);
  }

  std::vector<RegistryEntry> entries;
  int rc = SQLITE_OK;
  while ((rc = stmt->step()) == SQLITE_ROW) {
    RegistryEntry e;
    e.seq = stmt->col_int64(0);
    e.task_id = TaskId{stmt->col_text(1)};
    e.state_file = stmt->col_text(2);
    auto status = parse_registry_status(stmt->col_text(3));
    if (!status) {
      log::error("Registry entry {} has unknown status '{}'", e.task_id,
                 stmt->col_text(3));
      return fail(Error::ResumeInconsistency);
    }
    e.status = *status;
    e.description = stmt->col_text(4);
    e.working_dir = stmt->col_text(5);
    e.created_at = stmt->col_int64(6);
    e.updated_at = stmt->col_int64(7);
    entries.push_back(std::move(e));
  }
  if (rc != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  return entries;
}

auto TaskRegistry::find(const TaskId& id) -> Result<RegistryEntry> {
  std::string key(id.value());
  auto entries = read_entries(R"(
    SELECT seq, task_id, state_file, status, description, working_dir,
           created_at, updated_at
    FROM tasks WHERE task_id = ?;
  )", &key);
  if (!entries)
    return std::unexpected(entries.error());
  if (entries->empty()) {
    return fail(Error::NotFound);
  }
  return std::move(entries->front());
}

auto TaskRegistry::list() -> Result<std::vector<RegistryEntry>> {
  return read_entries(R"(
    SELECT seq, task_id, state_file, status, description, working_dir,
           created_at, updated_at
    FROM tasks ORDER BY seq;
  )", nullptr);
}

auto TaskRegistry::first_incomplete() -> Result<RegistryEntry> {
  auto entries = read_entries(R"(
    SELECT seq, task_id, state_file, status, description, working_dir,
           created_at, updated_at
    FROM tasks WHERE status = 'incomplete' ORDER BY seq LIMIT 1;
  )", nullptr);
  if (!entries)
    return std::unexpected(entries.error());
  if (entries->empty()) {
    return fail(Error::NoIncompleteTasks);
  }
  return std::move(entries->front());
}

}  // namespace looprunner
