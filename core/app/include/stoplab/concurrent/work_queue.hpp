#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace stoplab {

// -----------------------------------------------------------------------------
// WorkQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Closeable multi-producer / multi-consumer FIFO used to
// hand jobs to WorkerPool threads.
//
// Why in architecture: Metric materialisation fans out one job per ticker.
// The thread that submits jobs pushes; every pool thread pops. Closing the
// queue is how the pool tells its workers to exit once the backlog is done.
//
// Lifecycle:
//   open    push() appends; pop() blocks until an item arrives.
//   closed  push() is refused; pop() keeps draining what is left and then
//           returns std::nullopt, which tells a worker to exit.
//
// Thread model: All methods are thread-safe. A single mutex guards the deque
// and the closed flag; one condition variable signals "item or close".
// -----------------------------------------------------------------------------
template <typename T>
class WorkQueue {
 public:
  WorkQueue() = default;

  // Owns a mutex and condition variable: neither copyable nor movable. Share
  // it by reference.
  WorkQueue(const WorkQueue&) = delete;
  WorkQueue& operator=(const WorkQueue&) = delete;
  WorkQueue(WorkQueue&&) = delete;
  WorkQueue& operator=(WorkQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item to the back of the queue and wakes one consumer
  // blocked in pop().
  // Why: WorkerPool::submit() hands each job to the pool through here.
  // Thread-safety: Safe from any thread. The item is appended under the
  // mutex; the notify happens after the lock is released.
  // Input: value, taken by value so callers can std::move a job in.
  // Output: bool, false if the queue is already closed (the item is
  // dropped), true otherwise.
  // -------------------------------------------------------------------------
  bool push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item. While the queue is open and
  // empty, blocks the caller until a push() or close().
  // Why: The worker loop is `while (auto job = queue.pop()) (*job)();`.
  // An empty optional is its exit signal.
  // Thread-safety: Safe from any thread. The wait re-checks its predicate,
  // so spurious wakeups are harmless.
  // Input: None.
  // Output: std::optional<T>, the front item, or std::nullopt once the
  // queue is closed and fully drained.
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    // Items queued before close() are still handed out.
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop(): non-blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item if there is one; returns
  // immediately either way.
  // Thread-safety: Safe from any thread.
  // Input: None.
  // Output: std::optional<T>, std::nullopt when nothing is queued. Does not
  // distinguish open from closed.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // close()
  // -------------------------------------------------------------------------
  // What: Refuses further pushes and wakes every blocked consumer so each
  // can drain the remainder and observe the close. Idempotent.
  // Why: WorkerPool::shutdown() calls it before joining its threads.
  // Thread-safety: Safe from any thread; uses notify_all().
  // Input: None.
  // Output: None.
  // -------------------------------------------------------------------------
  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    condition_.notify_all();
  }

  // Snapshot; another thread may close right after.
  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  // Snapshot; prefer try_pop() in consumer loops.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

 private:
  // Guards queue_ and closed_. mutable so the const observers can lock.
  mutable std::mutex mutex_;

  // Signalled on push (one waiter) and on close (all waiters).
  std::condition_variable condition_;

  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace stoplab
