#include "looprunner/storage/registry.hpp"
#include "looprunner/storage/task_store.hpp"

#include <benchmark/benchmark.h>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <memory>

using namespace looprunner;

class TaskStoreBenchFixture : public benchmark::Fixture {
public:
  void SetUp(const ::benchmark::State& state) override {
    (void)state;
    std::string pattern = "/tmp/looprunner_bench_XXXXXX";
    if (::mkdtemp(pattern.data()) != nullptr) {
      dir_ = pattern;
    }

    TaskConfig config;
    config.prompt = "Add tests";
    config.verify_command = "make test";
    task_ = std::make_unique<Task>(make_task_id(1), config);
    for (int i = 0; i < 100; ++i) {
      (void)task_->add_file(std::format("src/file_{}.ts", i),
                            R"({"owner":"bench"})");
    }
    store_ = std::make_unique<TaskStore>(dir_ / "state_1.db");
    auto created = store_->create(*task_);
    benchmark::DoNotOptimize(created);
  }

  void TearDown(const ::benchmark::State& state) override {
    (void)state;
    store_.reset();
    task_.reset();
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::filesystem::path dir_;
  std::unique_ptr<Task> task_;
  std::unique_ptr<TaskStore> store_;
};

BENCHMARK_F(TaskStoreBenchFixture, BM_TaskStoreSaveFile)(benchmark::State& state) {
  auto file = task_->files()[0];
  std::int64_t now = 0;
  for (auto _ : state) {
    file.retry_count = static_cast<int>(now % 3);
    file.status = now % 2 == 0 ? FileStatus::VerifyInProgress
                               : FileStatus::FixupInProgress;
    auto saved = store_->save_file(file, ++now);
    benchmark::DoNotOptimize(saved);
  }
}

BENCHMARK_F(TaskStoreBenchFixture, BM_TaskStoreLoad)(benchmark::State& state) {
  for (auto _ : state) {
    auto loaded = store_->load();
    benchmark::DoNotOptimize(loaded);
  }
}

BENCHMARK_F(TaskStoreBenchFixture, BM_TaskStoreSaveAll)(benchmark::State& state) {
  for (auto _ : state) {
    auto saved = store_->save_all(*task_);
    benchmark::DoNotOptimize(saved);
  }
}

class RegistryBenchFixture : public benchmark::Fixture {
public:
  void SetUp(const ::benchmark::State& state) override {
    (void)state;
    std::string pattern = "/tmp/looprunner_bench_XXXXXX";
    if (::mkdtemp(pattern.data()) != nullptr) {
      dir_ = pattern;
    }
    registry_ = std::make_unique<TaskRegistry>(dir_);
    auto opened = registry_->open();
    benchmark::DoNotOptimize(opened);
    for (std::int64_t seq = 1; seq <= 50; ++seq) {
      auto appended = registry_->append(RegistryEntry{
          .seq = seq,
          .task_id = make_task_id(seq),
          .state_file = TaskRegistry::state_file_name(seq),
          .status = seq < 50 ? RegistryStatus::Completed
                             : RegistryStatus::Incomplete,
      });
      benchmark::DoNotOptimize(appended);
    }
  }

  void TearDown(const ::benchmark::State& state) override {
    (void)state;
    registry_.reset();
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::filesystem::path dir_;
  std::unique_ptr<TaskRegistry> registry_;
};

BENCHMARK_F(RegistryBenchFixture, BM_RegistryList)(benchmark::State& state) {
  for (auto _ : state) {
    auto result = registry_->list();
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(RegistryBenchFixture,
            BM_RegistryFirstIncomplete)(benchmark::State& state) {
  for (auto _ : state) {
    auto result = registry_->first_incomplete();
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_MAIN();
