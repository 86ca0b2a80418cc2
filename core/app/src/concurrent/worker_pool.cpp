#include "stoplab/concurrent/worker_pool.hpp"

#include <stdexcept>

namespace stoplab {

// -----------------------------------------------------------------------------
// Constructor: spawn the workers
// -----------------------------------------------------------------------------
WorkerPool::WorkerPool(std::size_t thread_count) {
  if (thread_count == 0) {
    thread_count = std::thread::hardware_concurrency();
  }
  if (thread_count == 0) {
    thread_count = 1;
  }

  threads_.reserve(thread_count);
  for (std::size_t i = 0; i < thread_count; ++i) {
    threads_.emplace_back([this] { run(); });
  }
}

// -----------------------------------------------------------------------------
// Destructor: RAII shutdown
// -----------------------------------------------------------------------------
WorkerPool::~WorkerPool() { shutdown(); }

// -----------------------------------------------------------------------------
// submit(): count the job as in flight before it becomes visible to workers
// -----------------------------------------------------------------------------
void WorkerPool::submit(Job job) {
  {
    std::lock_guard lock(state_mutex_);
    ++in_flight_;
  }
  if (!queue_.push(std::move(job))) {
    {
      std::lock_guard lock(state_mutex_);
      --in_flight_;
    }
    idle_cv_.notify_all();
    throw std::logic_error("WorkerPool::submit after shutdown");
  }
}

// -----------------------------------------------------------------------------
// wait(): block until in_flight_ drops to zero, then surface any failure
// -----------------------------------------------------------------------------
void WorkerPool::wait() {
  std::exception_ptr error;
  {
    std::unique_lock lock(state_mutex_);
    idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
    error = first_error_;
    first_error_ = nullptr;
  }
  if (error) {
    std::rethrow_exception(error);
  }
}

// -----------------------------------------------------------------------------
// shutdown(): close, drain, join
// -----------------------------------------------------------------------------
void WorkerPool::shutdown() {
  queue_.close();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void WorkerPool::run() {
  while (true) {
    std::optional<Job> job = queue_.pop();
    if (!job) {
      return;
    }

    std::exception_ptr error;
    try {
      (*job)();
    } catch (...) {
      // Rethrown from wait() on the submitting thread.
      error = std::current_exception();
    }

    {
      std::lock_guard lock(state_mutex_);
      if (error && !first_error_) {
        first_error_ = error;
      }
      --in_flight_;
    }
    idle_cv_.notify_all();
  }
}

}  // namespace stoplab
