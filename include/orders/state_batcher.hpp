// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/logging.hpp"
#include "util/threadpool.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <fmt/format.h>
#include <functional>
#include <future>
#include <list>
#include <mutex>
#include <optional>
#include <semaphore>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace orderwatch {
namespace orders {

enum class BatchErrorCode {
  kCallFailed,          // the contract query threw
  kInvalidOutputLength, // result count differs from the request count
  kUnavailable,         // batcher stopped before the request was served
};

const char *BatchErrorCodeName(BatchErrorCode code);

class BatchError : public std::runtime_error {
public:
  BatchError(BatchErrorCode code, const std::string &detail);

  BatchErrorCode code() const noexcept { return code_; }

private:
  BatchErrorCode code_;
};

struct BatcherConfig {
  // Most items per contract call
  size_t batch_size{512};
  // Most contract calls in flight at once
  size_t max_concurrent{16};
  // Dispatch delay after the first insert into an empty lane
  std::chrono::milliseconds priority_cork{5};
  std::chrono::milliseconds normal_cork{100};
};

struct BatcherStats {
  uint64_t queued_priority{0}; // new jobs created in the priority lane
  uint64_t queued_normal{0};   // new jobs created in the normal lane
  uint64_t merged{0};          // requests attached to an existing job
  uint64_t promoted{0};        // jobs moved from normal to priority
  uint64_t items_called{0};
  uint64_t calls_issued{0};
  uint64_t calls_completed{0};
  uint64_t calls_failed{0};
  uint64_t in_flight{0};
  uint64_t peak_in_flight{0};
};

/**
 * StateBatcher - coalesces single-item state lookups into batch calls
 *
 * FetchState() may be called from any number of threads. Identical items
 * (by operator== and Hash) share one pending job and therefore one slot in
 * one contract call. Jobs wait in one of two FIFO lanes:
 *
 *   priority  dispatched priority_cork after its first insert
 *   normal    dispatched normal_cork after its first insert
 *
 * or immediately once batch_size jobs are queued. A dispatch drains the
 * lanes in batches of at most batch_size, priority jobs first. A normal job
 * requested again with priority moves to the back of the priority lane; if
 * that lane was empty its cork starts at the promotion.
 *
 * At most max_concurrent calls run at once. A slot is taken before a batch
 * is formed (outside the queue lock) and returned as soon as the call
 * returns, before results are delivered.
 *
 * Every waiter of a batch receives either its item's state or the batch's
 * single shared error. A caller that dropped its future is skipped.
 *
 * Query contract: states[i] is the state of items[i]; throwing fails the
 * whole batch with kCallFailed.
 */
template <class Item, class State, class Hash = std::hash<Item>>
class StateBatcher {
public:
  using QueryFn = std::function<std::vector<State>(const std::vector<Item> &)>;

  StateBatcher(QueryFn query, BatcherConfig config)
      : query_(std::move(query)), config_(Validated(query_, config)),
        slots_(static_cast<std::ptrdiff_t>(config_.max_concurrent)),
        pool_("batch-call", config_.max_concurrent) {}

  ~StateBatcher() { Stop(); }

  StateBatcher(const StateBatcher &) = delete;
  StateBatcher &operator=(const StateBatcher &) = delete;

  // Spawn the dispatcher. Requests made before Start() wait in the lanes.
  void Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (dispatcher_.joinable() || stopping_) {
      return;
    }
    dispatcher_ = std::thread(&StateBatcher::Run, this);
    LOG_ORDERS_INFO("State batcher started (batch size {}, {} concurrent)",
                    config_.batch_size, config_.max_concurrent);
  }

  /**
   * Stop dispatching. Calls in flight complete and deliver; jobs still
   * queued fail with kUnavailable. Idempotent.
   */
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_) {
        return;
      }
      stopping_ = true;
    }
    cv_.notify_all();
    if (dispatcher_.joinable()) {
      dispatcher_.join();
    }
    pool_.shutdown();
    pool_.wait_for_completion();

    std::list<Job> leftovers;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      leftovers.splice(leftovers.end(), priority_);
      leftovers.splice(leftovers.end(), normal_);
      index_.clear();
      priority_deadline_.reset();
      normal_deadline_.reset();
    }
    if (!leftovers.empty()) {
      auto error = std::make_exception_ptr(
          BatchError(BatchErrorCode::kUnavailable, "batcher stopped"));
      for (auto &job : leftovers) {
        for (auto &waiter : job.waiters) {
          waiter.set_exception(error);
        }
      }
    }
    LOG_ORDERS_INFO("State batcher stopped ({} jobs abandoned)",
                    leftovers.size());
  }

  /**
   * Request the state of `item`
   *
   * The future holds the state, or a BatchError (kCallFailed,
   * kInvalidOutputLength, kUnavailable).
   */
  std::future<State> FetchState(const Item &item, bool priority) {
    std::promise<State> promise;
    std::future<State> result = promise.get_future();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_) {
        promise.set_exception(std::make_exception_ptr(
            BatchError(BatchErrorCode::kUnavailable, "batcher stopped")));
        return result;
      }

      auto it = index_.find(item);
      if (it != index_.end()) {
        Entry &entry = it->second;
        entry.job->waiters.push_back(std::move(promise));
        ++merged_;
        if (priority && !entry.priority) {
          const bool was_empty = priority_.empty();
          priority_.splice(priority_.end(), normal_, entry.job);
          entry.priority = true;
          ++promoted_;
          if (normal_.empty()) {
            normal_deadline_.reset();
          }
          if (was_empty) {
            priority_deadline_ =
                std::chrono::steady_clock::now() + config_.priority_cork;
          }
        }
      } else {
        std::list<Job> &lane = priority ? priority_ : normal_;
        const bool was_empty = lane.empty();
        lane.emplace_back(item);
        lane.back().waiters.push_back(std::move(promise));
        index_.emplace(item, Entry{std::prev(lane.end()), priority});
        if (priority) {
          ++queued_priority_;
        } else {
          ++queued_normal_;
        }
        if (was_empty) {
          auto &deadline = priority ? priority_deadline_ : normal_deadline_;
          deadline = std::chrono::steady_clock::now() +
                     (priority ? config_.priority_cork : config_.normal_cork);
        }
      }
    }
    cv_.notify_one();
    return result;
  }

  size_t queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return priority_.size() + normal_.size();
  }

  BatcherStats GetStats() const {
    BatcherStats stats;
    stats.queued_priority = queued_priority_.load();
    stats.queued_normal = queued_normal_.load();
    stats.merged = merged_.load();
    stats.promoted = promoted_.load();
    stats.items_called = items_called_.load();
    stats.calls_issued = calls_issued_.load();
    stats.calls_completed = calls_completed_.load();
    stats.calls_failed = calls_failed_.load();
    stats.in_flight = in_flight_.load();
    stats.peak_in_flight = peak_in_flight_.load();
    return stats;
  }

  const BatcherConfig &config() const { return config_; }

private:
  static constexpr size_t kMaxSlots = 1024;

  // Runs before any member that spawns threads
  static BatcherConfig Validated(const QueryFn &query,
                                 const BatcherConfig &config) {
    if (!query) {
      throw std::invalid_argument("StateBatcher requires a query function");
    }
    if (config.batch_size == 0) {
      throw std::invalid_argument("batch_size must be at least 1");
    }
    if (config.max_concurrent == 0 || config.max_concurrent > kMaxSlots) {
      throw std::invalid_argument(
          fmt::format("max_concurrent must be in [1, {}]", kMaxSlots));
    }
    return config;
  }

  struct Job {
    explicit Job(const Item &i) : item(i) {}
    Item item;
    std::vector<std::promise<State>> waiters;
  };

  struct Entry {
    typename std::list<Job>::iterator job;
    bool priority;
  };

  // Caller holds mutex_
  bool DispatchDueLocked(std::chrono::steady_clock::time_point now) const {
    if (priority_.size() + normal_.size() >= config_.batch_size) {
      return true;
    }
    return (priority_deadline_ && now >= *priority_deadline_) ||
           (normal_deadline_ && now >= *normal_deadline_);
  }

  // Caller holds mutex_
  std::optional<std::chrono::steady_clock::time_point>
  NextDeadlineLocked() const {
    if (priority_deadline_ && normal_deadline_) {
      return std::min(*priority_deadline_, *normal_deadline_);
    }
    return priority_deadline_ ? priority_deadline_ : normal_deadline_;
  }

  // Caller holds mutex_. Up to batch_size jobs, priority lane first.
  std::vector<Job> TakeBatchLocked() {
    std::vector<Job> batch;
    auto drain = [&](std::list<Job> &lane,
                     std::optional<std::chrono::steady_clock::time_point>
                         &deadline) {
      while (!lane.empty() && batch.size() < config_.batch_size) {
        index_.erase(lane.front().item);
        batch.push_back(std::move(lane.front()));
        lane.pop_front();
      }
      if (lane.empty()) {
        deadline.reset();
      }
    };
    drain(priority_, priority_deadline_);
    drain(normal_, normal_deadline_);
    return batch;
  }

  void Run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
      const auto deadline = NextDeadlineLocked();
      // Wake on stop, a full queue, or a sooner deadline
      auto wake = [&] {
        return stopping_ ||
               DispatchDueLocked(std::chrono::steady_clock::now()) ||
               NextDeadlineLocked() != deadline;
      };
      if (deadline) {
        cv_.wait_until(lock, *deadline, wake);
      } else {
        cv_.wait(lock, wake);
      }
      if (stopping_) {
        break;
      }
      if (!DispatchDueLocked(std::chrono::steady_clock::now())) {
        continue;
      }

      // One slot per batch; keep going while a lane is still due
      lock.unlock();
      while (true) {
        slots_.acquire();
        std::vector<Job> batch;
        {
          std::lock_guard<std::mutex> guard(mutex_);
          if (!stopping_ &&
              DispatchDueLocked(std::chrono::steady_clock::now())) {
            batch = TakeBatchLocked();
          }
        }
        if (batch.empty()) {
          slots_.release();
          break;
        }
        Launch(std::move(batch));
      }
      lock.lock();
    }
  }

  void Launch(std::vector<Job> batch) {
    std::vector<Item> items;
    items.reserve(batch.size());
    for (const auto &job : batch) {
      items.push_back(job.item);
    }

    const uint64_t now_in_flight = ++in_flight_;
    uint64_t peak = peak_in_flight_.load();
    while (now_in_flight > peak &&
           !peak_in_flight_.compare_exchange_weak(peak, now_in_flight)) {
    }
    ++calls_issued_;
    items_called_ += items.size();
    LOG_ORDERS_TRACE("Dispatching batch of {} ({} in flight)", items.size(),
                     now_in_flight);

    auto shared_batch = std::make_shared<std::vector<Job>>(std::move(batch));
    auto shared_items = std::make_shared<std::vector<Item>>(std::move(items));
    try {
      pool_.post([this, shared_batch, shared_items] {
        Execute(*shared_batch, *shared_items);
      });
    } catch (const std::runtime_error &e) {
      // Pool refused the task; fail the batch here
      --in_flight_;
      slots_.release();
      Deliver(*shared_batch, {},
              std::make_exception_ptr(
                  BatchError(BatchErrorCode::kUnavailable, e.what())));
    }
  }

  void Execute(std::vector<Job> &batch, const std::vector<Item> &items) {
    std::vector<State> states;
    std::exception_ptr error;
    try {
      states = query_(items);
      if (states.size() != items.size()) {
        error = std::make_exception_ptr(BatchError(
            BatchErrorCode::kInvalidOutputLength,
            fmt::format("expected {} results, got {}", items.size(),
                        states.size())));
      }
    } catch (const BatchError &) {
      error = std::current_exception();
    } catch (const std::exception &e) {
      error = std::make_exception_ptr(
          BatchError(BatchErrorCode::kCallFailed, e.what()));
    } catch (...) {
      error = std::make_exception_ptr(
          BatchError(BatchErrorCode::kCallFailed, "non-standard exception"));
    }

    // Free the slot before fan-out
    --in_flight_;
    slots_.release();
    ++calls_completed_;
    if (error) {
      ++calls_failed_;
      try {
        std::rethrow_exception(error);
      } catch (const BatchError &e) {
        LOG_ORDERS_WARN("Batch call of {} items failed: {}", items.size(),
                        e.what());
      }
    }
    Deliver(batch, states, error);
  }

  static void Deliver(std::vector<Job> &batch, const std::vector<State> &states,
                      const std::exception_ptr &error) {
    for (size_t i = 0; i < batch.size(); ++i) {
      for (auto &waiter : batch[i].waiters) {
        // A dropped future makes these no-ops
        if (error) {
          waiter.set_exception(error);
        } else {
          waiter.set_value(states[i]);
        }
      }
    }
  }

  const QueryFn query_;
  const BatcherConfig config_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::list<Job> priority_;
  std::list<Job> normal_;
  std::unordered_map<Item, Entry, Hash> index_;
  std::optional<std::chrono::steady_clock::time_point> priority_deadline_;
  std::optional<std::chrono::steady_clock::time_point> normal_deadline_;
  bool stopping_{false};

  std::counting_semaphore<kMaxSlots> slots_;
  util::ThreadPool pool_;
  std::thread dispatcher_;

  std::atomic<uint64_t> queued_priority_{0};
  std::atomic<uint64_t> queued_normal_{0};
  std::atomic<uint64_t> merged_{0};
  std::atomic<uint64_t> promoted_{0};
  std::atomic<uint64_t> items_called_{0};
  std::atomic<uint64_t> calls_issued_{0};
  std::atomic<uint64_t> calls_completed_{0};
  std::atomic<uint64_t> calls_failed_{0};
  std::atomic<uint64_t> in_flight_{0};
  std::atomic<uint64_t> peak_in_flight_{0};
};

} // namespace orders
} // namespace orderwatch
