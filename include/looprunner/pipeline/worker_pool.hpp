#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_set>
#include <vector>

namespace looprunner {

enum class Disposition : std::uint8_t {
  // Not finished; eligible to be claimed again.
  Requeue,
  // Terminal; never handed out again.
  Done,
};

// Items waiting to be claimed, in insertion order. An item is held by at most
// one claimant at a time.
class ReadySet {
public:
  auto push(std::size_t item) -> void;

  // Blocks until an item is available. nullopt once stopped, or once nothing
  // is queued and nothing is held.
  [[nodiscard]] auto claim() -> std::optional<std::size_t>;
  auto release(std::size_t item, Disposition disposition) -> void;

  auto stop() -> void;
  [[nodiscard]] auto stopped() const -> bool;

  [[nodiscard]] auto held() const -> std::size_t;
  [[nodiscard]] auto max_held() const -> std::size_t;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::size_t> queue_;
  std::unordered_set<std::size_t> claimed_;
  std::size_t max_held_{0};
  bool stopped_{false};
};

// Fixed set of worker threads draining a ReadySet.
class WorkerPool {
public:
  using Handler =
      std::function<Disposition(std::size_t worker_id, std::size_t item)>;

  WorkerPool(std::size_t concurrency, Handler handler);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  auto start(const std::vector<std::size_t>& items) -> void;

  // True once every worker has exited.
  [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> bool;
  auto join() -> void;

  // Stops handing out claims; steps already running finish.
  auto request_stop() -> void;
  [[nodiscard]] auto stop_requested() const -> bool;

  [[nodiscard]] auto max_concurrency_observed() const -> std::size_t {
    return ready_.max_held();
  }

private:
  auto worker_loop(std::size_t worker_id) -> void;

  std::size_t concurrency_;
  Handler handler_;
  ReadySet ready_;
  std::vector<std::thread> workers_;

  std::mutex done_mu_;
  std::condition_variable done_cv_;
  std::size_t running_{0};
};

}  // namespace looprunner
