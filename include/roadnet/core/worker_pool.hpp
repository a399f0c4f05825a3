/*
  WorkerPool — fixed set of worker threads fed through a bounded channel.

  submit() blocks while the channel is full. wait() blocks until every
  submitted task has finished and rethrows the first exception raised by a
  task since the previous wait(); the pool stays usable afterwards. The
  destructor closes the channel, drains remaining tasks and joins.
*/
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace roadnet::core {

class WorkerPool {
public:
  // queue_capacity == 0 selects 2 * num_workers. num_workers must be >= 1.
  explicit WorkerPool(std::size_t num_workers, std::size_t queue_capacity = 0);
  ~WorkerPool() noexcept;

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void submit(std::function<void()> task);
  void wait();

  [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
  void run_worker();

  std::size_t capacity_ {0};
  std::vector<std::thread> workers_ {};
  std::deque<std::function<void()>> queue_ {};
  std::size_t in_flight_ {0};  // queued + running
  bool closed_ {false};
  std::exception_ptr first_error_ {};

  std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::condition_variable idle_;
};

} // namespace roadnet::core
