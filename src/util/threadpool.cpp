// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/threadpool.hpp"
#include "util/logging.hpp"

namespace orderwatch {
namespace util {

ThreadPool::ThreadPool(std::string name, size_t num_threads,
                       size_t max_queue_size)
    : name_(std::move(name)), max_queue_size_(max_queue_size) {
  if (num_threads == 0) {
    num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) {
      num_threads = 4;
    }
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this, i] { WorkerLoop(i); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
  wait_for_completion();
}

void ThreadPool::post(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (stop_.load(std::memory_order_acquire)) {
      throw std::runtime_error("ThreadPool '" + name_ + "' is stopped");
    }
    if (max_queue_size_ > 0 && tasks_.size() >= max_queue_size_) {
      throw std::runtime_error("ThreadPool '" + name_ + "' queue full");
    }
    tasks_.push_back(std::move(task));
  }
  condition_.notify_one();
}

void ThreadPool::WorkerLoop(size_t index) {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      condition_.wait(lock, [this] {
        return stop_.load(std::memory_order_acquire) || !tasks_.empty();
      });
      if (tasks_.empty()) {
        return; // stopped and drained
      }
      task = std::move(tasks_.front());
      tasks_.pop_front();
    }

    busy_workers_.fetch_add(1, std::memory_order_relaxed);
    try {
      task();
      tasks_completed_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception &e) {
      task_exceptions_.fetch_add(1, std::memory_order_relaxed);
      LOG_ERROR("ThreadPool '{}' worker {} task threw: {}", name_, index,
                e.what());
    } catch (...) {
      task_exceptions_.fetch_add(1, std::memory_order_relaxed);
      LOG_ERROR("ThreadPool '{}' worker {} task threw a non-std exception",
                name_, index);
    }
    busy_workers_.fetch_sub(1, std::memory_order_relaxed);
  }
}

void ThreadPool::shutdown() {
  stop_.store(true, std::memory_order_release);
  condition_.notify_all();
}

void ThreadPool::wait_for_completion() {
  for (std::thread &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

} // namespace util
} // namespace orderwatch
