#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <format>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace looprunner::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "warn")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  return Level::Info;
}

// Async logger. Records are formatted on the calling thread and written in
// batches by a single writer thread, to stderr and optionally to a file.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;
  static constexpr std::size_t BATCH_SIZE = 64;

  struct Record {
    Level level;
    std::string prefix;
    std::string body;
  };

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> accepting_{false};
  bool running_{false};
  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Record> queue_;
  std::FILE* file_{nullptr};
  std::thread writer_;

  auto write(const Record& rec) -> void {
    std::print(stderr, "{} [{}{}\033[0m] {}\n", rec.prefix,
               level_color(rec.level), level_name(rec.level), rec.body);
    if (file_ != nullptr) {
      std::print(file_, "{} [{}] {}\n", rec.prefix, level_name(rec.level),
                 rec.body);
    }
  }

  auto writer_loop() -> void {
    std::vector<Record> batch;
    batch.reserve(BATCH_SIZE);

    std::unique_lock lock(mu_);
    while (true) {
      cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
      if (queue_.empty() && !running_) {
        break;
      }
      while (!queue_.empty() && batch.size() < BATCH_SIZE) {
        batch.push_back(std::move(queue_.front()));
        queue_.pop_front();
      }
      lock.unlock();
      for (const auto& rec : batch) {
        write(rec);
      }
      if (file_ != nullptr) {
        std::fflush(file_);
      }
      batch.clear();
      lock.lock();
    }
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_ != nullptr) {
      std::fclose(file_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    std::lock_guard lock(mu_);
    if (running_)
      return;
    running_ = true;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    {
      std::lock_guard lock(mu_);
      if (!running_)
        return;
      running_ = false;
    }
    cv_.notify_all();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // Appends to `path`; returns false when the file cannot be opened.
  auto open_file(const std::string& path) -> bool {
    std::lock_guard lock(mu_);
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
    file_ = std::fopen(path.c_str(), "a");
    return file_ != nullptr;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    Record rec{level, std::format("[{:%Y-%m-%d %H:%M:%S}] [{}]", time, tid),
               std::format(fmt, std::forward<Args>(args)...)};

    // Synchronous fallback before start(), after stop(), or when saturated
    if (!accepting_.load(std::memory_order_acquire)) {
      std::lock_guard lock(mu_);
      write(rec);
      return;
    }
    {
      std::lock_guard lock(mu_);
      if (queue_.size() >= QUEUE_CAPACITY) {
        write(rec);
        return;
      }
      queue_.push_back(std::move(rec));
    }
    cv_.notify_one();
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto set_file(const std::string& path) -> bool {
  return logger().open_file(path);
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace looprunner::log
