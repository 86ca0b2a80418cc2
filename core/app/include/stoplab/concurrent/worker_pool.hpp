#pragma once

#include "stoplab/concurrent/work_queue.hpp"

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace stoplab {

// -----------------------------------------------------------------------------
// WorkerPool
// -----------------------------------------------------------------------------
// Responsibility: Owns a fixed set of worker threads that drain a
// WorkQueue<Job>. Used by RiskMetricsEngine to compute independent
// per-ticker metric series in parallel before the sequential replay starts.
//
// Usage:
//   WorkerPool pool(4);
//   for (...) pool.submit([&] { ... });
//   pool.wait();      // blocks until every submitted job has finished
//
// Errors:
//   A job that throws does not kill its worker. The first exception is
//   captured and rethrown from wait(); later ones are discarded.
//
// Thread model: submit() and wait() may be called from any thread. Jobs run
// on the pool threads and must only touch state they own (each metrics job
// writes its own pre-allocated output slot).
// -----------------------------------------------------------------------------
class WorkerPool {
 public:
  using Job = std::function<void()>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // What: Starts the worker threads; each runs run() until the queue closes.
  // Input: thread_count, the number of workers. Zero selects
  // std::thread::hardware_concurrency(), and at least one thread is always
  // started.
  // Thread-safety: Construct on the owning thread before sharing the pool.
  // -------------------------------------------------------------------------
  explicit WorkerPool(std::size_t thread_count = 0);

  // Calls shutdown(): queued jobs still run before the threads are joined.
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // -------------------------------------------------------------------------
  // submit(job)
  // -------------------------------------------------------------------------
  // What: Counts the job as in flight and pushes it onto the queue. Some
  // worker runs it later.
  // Why: RiskMetricsEngine::computeAll() submits one job per ticker.
  // Thread-safety: Safe from any thread.
  // Input: job, a callable with no arguments. It must write only to state
  // no other job touches.
  // Output: None.
  // @throws std::logic_error if the pool has been shut down.
  // -------------------------------------------------------------------------
  void submit(Job job);

  // -------------------------------------------------------------------------
  // wait()
  // -------------------------------------------------------------------------
  // What: Blocks until every job submitted so far has completed, then
  // rethrows the first exception a job raised since the previous wait().
  // Why: The replay needs the whole metrics matrix before its first day.
  // Thread-safety: Safe from any thread except a pool thread. Calling it
  // from inside a job would wait on itself.
  // Input: None.
  // Output: None. The captured exception is cleared once rethrown.
  // -------------------------------------------------------------------------
  void wait();

  // -------------------------------------------------------------------------
  // shutdown()
  // -------------------------------------------------------------------------
  // What: Closes the queue, lets the workers drain it and joins them.
  // Idempotent. submit() throws afterwards.
  // Thread-safety: Call from the owning thread only.
  // -------------------------------------------------------------------------
  void shutdown();

  // Number of worker threads started.
  std::size_t size() const { return threads_.size(); }

 private:
  // Worker loop: pop until the queue is closed and drained.
  void run();

  WorkQueue<Job> queue_;
  std::vector<std::thread> threads_;

  // Guards in_flight_ and first_error_. idle_cv_ is signalled when
  // in_flight_ drops to zero.
  std::mutex state_mutex_;
  std::condition_variable idle_cv_;
  std::size_t in_flight_{0};
  std::exception_ptr first_error_;
};

}  // namespace stoplab
