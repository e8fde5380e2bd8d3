#include "looprunner/storage/failure_log.hpp"
#include "looprunner/storage/registry.hpp"
#include "looprunner/storage/resume_loader.hpp"
#include "looprunner/storage/task_store.hpp"
#include "looprunner/task/state_strings.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"
#include <sqlite3.h>

#include <format>

using namespace looprunner;
using looprunner::test::TempDir;

namespace {

auto sample_config() -> TaskConfig {
  TaskConfig config;
  config.prompt = "Add tests";
  config.fixup_prompt = "Fix tests";
  config.verify_command = "npm test {file}";
  config.allowlist_pattern = "{file_stem}*";
  config.max_retries = 2;
  config.concurrency = 3;
  config.max_files = 10;
  config.input_file = "input.json";
  config.working_dir = "/work";
  config.description = "Add tests";
  return config;
}

// Runs one statement on a separate connection.
void raw_exec(const std::filesystem::path& db, const char* sql) {
  sqlite3* conn = nullptr;
  ASSERT_EQ(sqlite3_open(db.string().c_str(), &conn), SQLITE_OK);
  char* err = nullptr;
  int rc = sqlite3_exec(conn, sql, nullptr, nullptr, &err);
  std::string message = err ? err : "";
  sqlite3_free(err);
  sqlite3_close(conn);
  ASSERT_EQ(rc, SQLITE_OK) << message;
}

}  // namespace

class TaskStoreTest : public ::testing::Test {
protected:
  auto path() const -> std::filesystem::path { return dir_ / "state_1.db"; }

  TempDir dir_;
};

TEST_F(TaskStoreTest, Create_ThenLoad_RestoresTaskVerbatim) {
  Task task(TaskId{"task_1"}, sample_config());
  ASSERT_TRUE(task.add_file("src/a.ts", R"({"owner":"x"})").has_value());
  ASSERT_TRUE(task.add_file("src/b.ts", "null").has_value());
  {
    TaskStore store(path());
    ASSERT_TRUE(store.create(task).has_value());
  }

  TaskStore reopened(path());
  ASSERT_TRUE(reopened.open_existing().has_value());
  auto loaded = reopened.load();

  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->id(), task.id());
  EXPECT_EQ(loaded->config(), task.config());
  EXPECT_EQ(loaded->created_at(), task.created_at());
  EXPECT_EQ(loaded->files(), task.files());
}

TEST_F(TaskStoreTest, Create_ExistingFile_IsAlreadyExists) {
  Task task(TaskId{"task_1"}, sample_config());
  {
    TaskStore store(path());
    ASSERT_TRUE(store.create(task).has_value());
  }

  TaskStore again(path());
  auto r = again.create(task);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::AlreadyExists));
}

TEST_F(TaskStoreTest, SaveFile_PersistsEveryField) {
  Task task(TaskId{"task_1"}, sample_config());
  ASSERT_TRUE(task.add_file("a.ts", "null").has_value());
  TaskStore store(path());
  ASSERT_TRUE(store.create(task).has_value());

  FileState next = task.files()[0];
  next.status = FileStatus::FixupInProgress;
  next.retry_count = 2;
  next.last_error = "1 test failed";
  next.result = R"({"ok":false})";
  ASSERT_TRUE(store.save_file(next, 42).has_value());

  auto loaded = store.load();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->files()[0], next);
  EXPECT_EQ(loaded->updated_at(), 42);
}

TEST_F(TaskStoreTest, SaveFile_UnknownPath_IsNotFound) {
  Task task(TaskId{"task_1"}, sample_config());
  TaskStore store(path());
  ASSERT_TRUE(store.create(task).has_value());

  auto r = store.save_file(FileState{.path = "ghost.ts"}, 1);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(TaskStoreTest, SaveConfig_ReplacesStoredSettings) {
  Task task(TaskId{"task_1"}, sample_config());
  TaskStore store(path());
  ASSERT_TRUE(store.create(task).has_value());

  auto config = task.config();
  config.prompt = "New prompt";
  config.max_files.reset();
  config.branch = "looprunner/task_1";
  ASSERT_TRUE(store.save_config(config, 7).has_value());

  auto loaded = store.load();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->config(), config);
}

TEST_F(TaskStoreTest, OpenExisting_MissingFile_IsResumeInconsistency) {
  TaskStore store(path());

  auto r = store.open_existing();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ResumeInconsistency));
}

TEST_F(TaskStoreTest, OpenExisting_GarbageFile_IsResumeInconsistency) {
  test::write_file(path(), std::string(8192, 'x'));
  TaskStore store(path());

  auto r = store.open_existing();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ResumeInconsistency));
}

TEST_F(TaskStoreTest, Load_UnknownStatus_IsResumeInconsistency) {
  Task task(TaskId{"task_1"}, sample_config());
  ASSERT_TRUE(task.add_file("a.ts", "null").has_value());
  {
    TaskStore store(path());
    ASSERT_TRUE(store.create(task).has_value());
  }
  raw_exec(path(), "UPDATE file_states SET status = 'verifying';");

  TaskStore store(path());
  ASSERT_TRUE(store.open_existing().has_value());
  auto r = store.load();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ResumeInconsistency));
}

TEST_F(TaskStoreTest, Load_RetryCountAboveMax_IsResumeInconsistency) {
  Task task(TaskId{"task_1"}, sample_config());
  ASSERT_TRUE(task.add_file("a.ts", "null").has_value());
  {
    TaskStore store(path());
    ASSERT_TRUE(store.create(task).has_value());
  }
  raw_exec(path(), "UPDATE file_states SET retry_count = 9;");

  TaskStore store(path());
  ASSERT_TRUE(store.open_existing().has_value());

  EXPECT_FALSE(store.load().has_value());
}

TEST_F(TaskStoreTest, Load_MissingTaskRow_IsResumeInconsistency) {
  Task task(TaskId{"task_1"}, sample_config());
  {
    TaskStore store(path());
    ASSERT_TRUE(store.create(task).has_value());
  }
  raw_exec(path(), "DELETE FROM task;");

  TaskStore store(path());
  ASSERT_TRUE(store.open_existing().has_value());
  auto r = store.load();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ResumeInconsistency));
}

class RegistryTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(registry_.open().has_value()); }

  auto entry(std::int64_t seq) -> RegistryEntry {
    return RegistryEntry{
        .seq = seq,
        .task_id = make_task_id(seq),
        .state_file = TaskRegistry::state_file_name(seq),
        .description = std::format("task {}", seq),
        .working_dir = "/work",
        .created_at = seq * 10,
        .updated_at = seq * 10,
    };
  }

  TempDir dir_;
  TaskRegistry registry_{dir_.path() / "tasks"};
};

TEST_F(RegistryTest, Open_CreatesDirectoryAndDatabase) {
  EXPECT_TRUE(std::filesystem::exists(dir_ / "tasks" / TaskRegistry::kFileName));
}

TEST_F(RegistryTest, NextSequence_StartsAtOneAndFollowsAppends) {
  auto first = registry_.next_sequence();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, 1);

  ASSERT_TRUE(registry_.append(entry(1)).has_value());
  ASSERT_TRUE(registry_.append(entry(2)).has_value());

  EXPECT_EQ(registry_.next_sequence().value_or(0), 3);
}

TEST_F(RegistryTest, NextSequence_SkipsOrphanStateFile) {
  test::write_file(dir_ / "tasks" / "state_1.db", "");

  EXPECT_EQ(registry_.next_sequence().value_or(0), 2);
}

TEST_F(RegistryTest, Append_DuplicateId_Fails) {
  ASSERT_TRUE(registry_.append(entry(1)).has_value());

  EXPECT_FALSE(registry_.append(entry(1)).has_value());
}

TEST_F(RegistryTest, Find_ReturnsEntry) {
  ASSERT_TRUE(registry_.append(entry(1)).has_value());

  auto found = registry_.find(TaskId{"task_1"});

  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->state_file, "state_1.db");
  EXPECT_EQ(found->status, RegistryStatus::Incomplete);
  EXPECT_EQ(found->description, "task 1");
  EXPECT_EQ(found->working_dir, "/work");
  EXPECT_EQ(registry_.state_path(*found), dir_ / "tasks" / "state_1.db");
}

TEST_F(RegistryTest, Find_Unknown_IsNotFound) {
  auto found = registry_.find(TaskId{"task_9"});

  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error(), make_error_code(Error::NotFound));
}

TEST_F(RegistryTest, FirstIncomplete_SkipsCompletedInOrder) {
  for (int i = 1; i <= 3; ++i) {
    ASSERT_TRUE(registry_.append(entry(i)).has_value());
  }
  ASSERT_TRUE(registry_
                  .set_status(TaskId{"task_1"}, RegistryStatus::Completed, 99)
                  .has_value());

  auto first = registry_.first_incomplete();

  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->task_id, TaskId{"task_2"});
}

TEST_F(RegistryTest, FirstIncomplete_AllCompleted_IsNoIncompleteTasks) {
  ASSERT_TRUE(registry_.append(entry(1)).has_value());
  ASSERT_TRUE(registry_
                  .set_status(TaskId{"task_1"}, RegistryStatus::Completed, 5)
                  .has_value());

  auto first = registry_.first_incomplete();

  ASSERT_FALSE(first.has_value());
  EXPECT_EQ(first.error(), make_error_code(Error::NoIncompleteTasks));
}

TEST_F(RegistryTest, SetStatus_UnknownId_IsNotFound) {
  auto r = registry_.set_status(TaskId{"task_4"}, RegistryStatus::Completed, 1);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(RegistryTest, List_IsOrderedBySequence) {
  ASSERT_TRUE(registry_.append(entry(2)).has_value());
  ASSERT_TRUE(registry_.append(entry(1)).has_value());
  ASSERT_TRUE(registry_.touch(TaskId{"task_1"}, 1234).has_value());

  auto all = registry_.list();

  ASSERT_TRUE(all.has_value());
  ASSERT_EQ(all->size(), 2u);
  EXPECT_EQ((*all)[0].task_id, TaskId{"task_1"});
  EXPECT_EQ((*all)[0].updated_at, 1234);
  EXPECT_EQ((*all)[1].task_id, TaskId{"task_2"});
}

class ResumeLoaderTest : public RegistryTest {
protected:
  // Writes a state file and registers it.
  void add_task(std::int64_t seq, const std::vector<FileState>& files) {
    Task task(make_task_id(seq), sample_config());
    for (const auto& f : files) {
      ASSERT_TRUE(task.restore_file(f).has_value());
    }
    TaskStore store(dir_ / "tasks" / TaskRegistry::state_file_name(seq));
    ASSERT_TRUE(store.create(task).has_value());
    ASSERT_TRUE(registry_.append(entry(seq)).has_value());
  }
};

TEST_F(ResumeLoaderTest, Load_ById_RestoresStatusesAndRetries) {
  add_task(1, {FileState{.path = "a.ts",
                         .status = FileStatus::FixupInProgress,
                         .retry_count = 1,
                         .last_error = "boom"},
               FileState{.path = "b.ts", .status = FileStatus::Completed,
                         .result = "3"}});
  ResumeLoader loader(registry_);

  auto loaded = loader.load(TaskId{"task_1"});

  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->entry.seq, 1);
  ASSERT_EQ(loaded->task.size(), 2u);
  EXPECT_EQ(loaded->task.files()[0].status, FileStatus::FixupInProgress);
  EXPECT_EQ(loaded->task.files()[0].retry_count, 1);
  EXPECT_EQ(loaded->task.files()[0].last_error, "boom");
  EXPECT_EQ(loaded->task.files()[1].result, "3");
  ASSERT_NE(loaded->store, nullptr);
}

TEST_F(ResumeLoaderTest, Load_WithoutId_PicksFirstIncomplete) {
  add_task(1, {FileState{.path = "a.ts", .status = FileStatus::Completed}});
  add_task(2, {FileState{.path = "b.ts"}});
  ASSERT_TRUE(registry_
                  .set_status(TaskId{"task_1"}, RegistryStatus::Completed, 1)
                  .has_value());
  ResumeLoader loader(registry_);

  auto loaded = loader.load(std::nullopt);

  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->task.id(), TaskId{"task_2"});
}

TEST_F(ResumeLoaderTest, Load_UnknownId_IsNotFound) {
  ResumeLoader loader(registry_);

  auto loaded = loader.load(TaskId{"task_3"});

  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), make_error_code(Error::NotFound));
}

TEST_F(ResumeLoaderTest, Load_NothingIncomplete_IsNoIncompleteTasks) {
  ResumeLoader loader(registry_);

  auto loaded = loader.load(std::nullopt);

  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), make_error_code(Error::NoIncompleteTasks));
}

TEST_F(ResumeLoaderTest, Load_MissingStateFile_IsResumeInconsistency) {
  ASSERT_TRUE(registry_.append(entry(1)).has_value());
  ResumeLoader loader(registry_);

  auto loaded = loader.load(TaskId{"task_1"});

  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), make_error_code(Error::ResumeInconsistency));
}

TEST_F(ResumeLoaderTest, Load_CorruptStateFile_IsResumeInconsistency) {
  test::write_file(dir_ / "tasks" / "state_1.db", std::string(8192, 'x'));
  ASSERT_TRUE(registry_.append(entry(1)).has_value());
  ResumeLoader loader(registry_);

  auto loaded = loader.load(TaskId{"task_1"});

  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), make_error_code(Error::ResumeInconsistency));
}

TEST_F(ResumeLoaderTest, Load_StateOfAnotherTask_IsResumeInconsistency) {
  Task other(TaskId{"task_5"}, sample_config());
  TaskStore store(dir_ / "tasks" / "state_1.db");
  ASSERT_TRUE(store.create(other).has_value());
  ASSERT_TRUE(registry_.append(entry(1)).has_value());
  ResumeLoader loader(registry_);

  auto loaded = loader.load(TaskId{"task_1"});

  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), make_error_code(Error::ResumeInconsistency));
}

TEST(FailureLogTest, LogPath_FlattensDirectories) {
  FailureLog log("/tmp/failures/task_1");

  EXPECT_EQ(log.log_path("./src/a/b.ts"),
            std::filesystem::path("/tmp/failures/task_1/src__a__b.ts.log"));
}

TEST(FailureLogTest, Append_AccumulatesEntries) {
  TempDir dir;
  FailureLog log(dir / "failures" / "task_1");

  ASSERT_TRUE(log.append("src/a.ts", "first failure").has_value());
  ASSERT_TRUE(log.append("src/a.ts", "second failure").has_value());

  auto text = test::read_file(log.log_path("src/a.ts"));
  EXPECT_NE(text.find("first failure"), std::string::npos);
  EXPECT_NE(text.find("second failure"), std::string::npos);
  EXPECT_LT(text.find("first failure"), text.find("second failure"));
}
