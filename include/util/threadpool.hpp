// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace orderwatch {
namespace util {

/**
 * Fixed-size worker pool
 *
 * Runs RPC fetches for the chain tip watcher and contract calls for the
 * state batcher. Workers survive throwing tasks; a task submitted through
 * enqueue() reports its exception through the returned future.
 *
 * Usage:
 *   ThreadPool pool("batch", 4);
 *   auto future = pool.enqueue([] { return 42; });
 *   int result = future.get();
 *   pool.shutdown();             // stop accepting work
 *   pool.wait_for_completion();  // drain and join
 */
class ThreadPool {
public:
  /**
   * @param name Label used in log lines
   * @param num_threads Number of workers (0 = hardware concurrency)
   * @param max_queue_size Maximum queued tasks (0 = unlimited)
   */
  explicit ThreadPool(std::string name, size_t num_threads = 0,
                      size_t max_queue_size = 0);
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;
  ThreadPool(ThreadPool &&) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;

  /**
   * Submit a callable and get its result as a future
   * @throws std::runtime_error if the pool is stopped or the queue is full
   */
  template <class F>
  auto enqueue(F &&f) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

  /**
   * Submit a fire-and-forget task
   * Exceptions escaping the task are logged and counted.
   * @throws std::runtime_error if the pool is stopped or the queue is full
   */
  void post(std::function<void()> task);

  // Stop accepting new tasks. Already queued tasks still run.
  void shutdown();

  // Join all workers (call after shutdown())
  void wait_for_completion();

  const std::string &name() const { return name_; }
  size_t size() const { return workers_.size(); }

  size_t pending_tasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
  }

  size_t busy_workers() const {
    return busy_workers_.load(std::memory_order_relaxed);
  }

  bool is_stopped() const { return stop_.load(std::memory_order_acquire); }

  size_t tasks_completed() const {
    return tasks_completed_.load(std::memory_order_relaxed);
  }

  size_t task_exceptions() const {
    return task_exceptions_.load(std::memory_order_relaxed);
  }

private:
  void WorkerLoop(size_t index);

  const std::string name_;
  std::vector<std::thread> workers_;

  std::deque<std::function<void()>> tasks_;
  const size_t max_queue_size_; // 0 = unlimited

  mutable std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::atomic<bool> stop_{false};

  std::atomic<size_t> busy_workers_{0};
  std::atomic<size_t> tasks_completed_{0};
  std::atomic<size_t> task_exceptions_{0};
};

template <class F>
auto ThreadPool::enqueue(F &&f)
    -> std::future<std::invoke_result_t<std::decay_t<F>>> {
  using return_type = std::invoke_result_t<std::decay_t<F>>;

  auto task =
      std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
  std::future<return_type> result = task->get_future();
  post([task]() { (*task)(); });
  return result;
}

} // namespace util
} // namespace orderwatch
