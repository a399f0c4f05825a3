/*
  Executor interface — abstracts how independent indexed jobs are run.

  Batch solvers hand an Executor one job per input index; the job writes its
  own slot of a pre-sized output buffer. The sequential executor runs jobs in
  index order on the calling thread; the pool executor spreads them over a
  WorkerPool. Neither changes results, only scheduling.
*/
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

namespace roadnet::core {

class Executor {
public:
  virtual ~Executor() noexcept = default;

  [[nodiscard]] virtual std::size_t concurrency() const noexcept = 0;

  // Run job(i) for every i in [0, n). Returns after all jobs have finished;
  // rethrows the first exception raised by a job.
  virtual void run_indexed(std::size_t n, const std::function<void(std::size_t)>& job) = 0;
};

using ExecutorPtr = std::shared_ptr<Executor>;

[[nodiscard]] ExecutorPtr make_sequential_executor();
[[nodiscard]] ExecutorPtr make_pool_executor(std::size_t workers);

// Map a requested concurrency to a worker count: nullopt means all hardware
// threads; explicit values are capped at hardware concurrency. Throws
// std::invalid_argument for values < 1.
[[nodiscard]] std::size_t resolve_worker_count(std::optional<int> cpus);

// Sequential executor for one worker, pool executor otherwise.
[[nodiscard]] ExecutorPtr make_executor(std::optional<int> cpus);

} // namespace roadnet::core
