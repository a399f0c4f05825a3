/*
  Executors — sequential and WorkerPool-backed implementations.
*/
#include "roadnet/core/executor.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include "roadnet/core/worker_pool.hpp"

namespace roadnet::core {

namespace {
class SequentialExecutor final : public Executor {
public:
  std::size_t concurrency() const noexcept override { return 1; }

  void run_indexed(std::size_t n, const std::function<void(std::size_t)>& job) override {
    for (std::size_t i = 0; i < n; ++i) job(i);
  }
};

class PoolExecutor final : public Executor {
public:
  explicit PoolExecutor(std::size_t workers) : pool_(workers) {}

  std::size_t concurrency() const noexcept override { return pool_.size(); }

  void run_indexed(std::size_t n, const std::function<void(std::size_t)>& job) override {
    // Contiguous chunks, several per worker, to balance uneven search costs.
    const std::size_t chunks = std::min(n, pool_.size() * 4);
    if (chunks == 0) return;
    const std::size_t base = n / chunks;
    const std::size_t extra = n % chunks;
    std::size_t begin = 0;
    for (std::size_t c = 0; c < chunks; ++c) {
      const std::size_t end = begin + base + (c < extra ? 1 : 0);
      pool_.submit([&job, begin, end] {
        for (std::size_t i = begin; i < end; ++i) job(i);
      });
      begin = end;
    }
    pool_.wait();
  }

private:
  WorkerPool pool_;
};
} // namespace

ExecutorPtr make_sequential_executor() {
  return std::make_shared<SequentialExecutor>();
}

ExecutorPtr make_pool_executor(std::size_t workers) {
  return std::make_shared<PoolExecutor>(workers);
}

std::size_t resolve_worker_count(std::optional<int> cpus) {
  const std::size_t hw = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  if (!cpus) return hw;
  if (*cpus < 1) {
    throw std::invalid_argument("cpus must be >= 1 (or unset to use all available)");
  }
  return std::min(static_cast<std::size_t>(*cpus), hw);
}

ExecutorPtr make_executor(std::optional<int> cpus) {
  const std::size_t workers = resolve_worker_count(cpus);
  if (workers == 1) return make_sequential_executor();
  return make_pool_executor(workers);
}

} // namespace roadnet::core
