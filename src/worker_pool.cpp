#include "roadnet/core/worker_pool.hpp"

#include <stdexcept>
#include <utility>

#include "roadnet/core/log.hpp"

namespace roadnet::core {

WorkerPool::WorkerPool(std::size_t num_workers, std::size_t queue_capacity) {
  if (num_workers < 1) {
    throw std::invalid_argument("WorkerPool: num_workers must be >= 1");
  }
  capacity_ = queue_capacity == 0 ? 2 * num_workers : queue_capacity;
  workers_.reserve(num_workers);
  for (std::size_t i = 0; i < num_workers; ++i) {
    workers_.emplace_back([this] { run_worker(); });
  }
}

WorkerPool::~WorkerPool() noexcept {
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
  if (first_error_) {
    logger()->error("WorkerPool destroyed with an unobserved task failure");
  }
}

void WorkerPool::submit(std::function<void()> task) {
  std::unique_lock<std::mutex> lk(mu_);
  not_full_.wait(lk, [this] { return closed_ || queue_.size() < capacity_; });
  if (closed_) {
    throw std::logic_error("WorkerPool::submit: pool is closed");
  }
  queue_.push_back(std::move(task));
  ++in_flight_;
  lk.unlock();
  not_empty_.notify_one();
}

void WorkerPool::wait() {
  std::unique_lock<std::mutex> lk(mu_);
  idle_.wait(lk, [this] { return in_flight_ == 0; });
  if (first_error_) {
    auto err = std::exchange(first_error_, nullptr);
    std::rethrow_exception(err);
  }
}

void WorkerPool::run_worker() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lk(mu_);
      not_empty_.wait(lk, [this] { return closed_ || !queue_.empty(); });
      if (queue_.empty()) return;  // closed and drained
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    not_full_.notify_one();
    std::exception_ptr err;
    try {
      task();
    } catch (...) {
      // Handed to the thread calling wait().
      err = std::current_exception();
    }
    bool now_idle = false;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (err && !first_error_) first_error_ = err;
      now_idle = (--in_flight_ == 0);
    }
    if (now_idle) idle_.notify_all();
  }
}

} // namespace roadnet::core
