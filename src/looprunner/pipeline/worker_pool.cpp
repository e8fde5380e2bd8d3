#include "looprunner/pipeline/worker_pool.hpp"

#include "looprunner/util/log.hpp"

#include <algorithm>

namespace looprunner {

auto ReadySet::push(std::size_t item) -> void {
  {
    std::lock_guard lock(mu_);
    queue_.push_back(item);
  }
  cv_.notify_one();
}

auto ReadySet::claim() -> std::optional<std::size_t> {
  std::unique_lock lock(mu_);
  cv_.wait(lock, [this] {
    return stopped_ || !queue_.empty() || claimed_.empty();
  });
  if (stopped_ || queue_.empty()) {
    return std::nullopt;
  }
  auto item = queue_.front();
  queue_.pop_front();
  claimed_.insert(item);
  max_held_ = std::max(max_held_, claimed_.size());
  return item;
}

auto ReadySet::release(std::size_t item, Disposition disposition) -> void {
  {
    std::lock_guard lock(mu_);
    claimed_.erase(item);
    if (disposition == Disposition::Requeue && !stopped_) {
      queue_.push_back(item);
    }
  }
  // Wake everyone: either new work or the drained condition.
  cv_.notify_all();
}

auto ReadySet::stop() -> void {
  {
    std::lock_guard lock(mu_);
    stopped_ = true;
  }
  cv_.notify_all();
}

auto ReadySet::stopped() const -> bool {
  std::lock_guard lock(mu_);
  return stopped_;
}

auto ReadySet::held() const -> std::size_t {
  std::lock_guard lock(mu_);
  return claimed_.size();
}

auto ReadySet::max_held() const -> std::size_t {
  std::lock_guard lock(mu_);
  return max_held_;
}

WorkerPool::WorkerPool(std::size_t concurrency, Handler handler)
    : concurrency_(std::max<std::size_t>(concurrency, 1)),
      handler_(std::move(handler)) {
}

WorkerPool::~WorkerPool() {
  request_stop();
  join();
}

auto WorkerPool::start(const std::vector<std::size_t>& items) -> void {
  for (auto item : items) {
    ready_.push(item);
  }
  auto n = std::min(concurrency_, std::max<std::size_t>(items.size(), 1));
  {
    std::lock_guard lock(done_mu_);
    running_ = n;
  }
  workers_.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    workers_.emplace_back([this, i] { worker_loop(i); });
  }
  log::debug("Started {} worker(s) for {} file(s)", n, items.size());
}

auto WorkerPool::worker_loop(std::size_t worker_id) -> void {
  while (auto item = ready_.claim()) {
    auto disposition = handler_(worker_id, *item);
    ready_.release(*item, disposition);
  }
  {
    std::lock_guard lock(done_mu_);
    --running_;
  }
  done_cv_.notify_all();
}

auto WorkerPool::wait_for(std::chrono::milliseconds timeout) -> bool {
  std::unique_lock lock(done_mu_);
  return done_cv_.wait_for(lock, timeout, [this] { return running_ == 0; });
}

auto WorkerPool::join() -> void {
  for (auto& t : workers_) {
    if (t.joinable()) {
      t.join();
    }
  }
  workers_.clear();
}

auto WorkerPool::request_stop() -> void {
  ready_.stop();
}

auto WorkerPool::stop_requested() const -> bool {
  return ready_.stopped();
}

}  // namespace looprunner
