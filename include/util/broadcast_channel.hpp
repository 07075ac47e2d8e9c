// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace orderwatch {
namespace util {

enum class RecvStatus {
  kOk,      // value holds the next item
  kTimeout, // nothing arrived before the deadline
  kClosed,  // sender closed and every buffered item was consumed
};

template <typename T> struct RecvResult {
  RecvStatus status{RecvStatus::kTimeout};
  std::optional<T> value;
  // Items skipped because this receiver fell behind the ring
  uint64_t missed{0};
};

/**
 * Bounded single-producer, multi-consumer broadcast channel
 *
 * Every receiver sees every item sent after it subscribed, in send order.
 * The producer never blocks: the ring keeps the newest `capacity` items and a
 * receiver that falls further behind skips ahead to the oldest retained item.
 * The skip is reported through RecvResult::missed, so delivery is
 * at-most-once and may skip, but never reorders.
 *
 * Closing lets receivers drain what is still buffered before they observe
 * kClosed.
 */
template <typename T> class BroadcastChannel {
  struct State {
    explicit State(size_t cap) : capacity(cap) {}

    const size_t capacity;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<T> ring;
    uint64_t head_seq{0}; // sequence number of ring.front()
    uint64_t next_seq{0}; // sequence number the next Send() gets
    size_t receivers{0};
    bool closed{false};
  };

public:
  class Receiver {
  public:
    Receiver() = default;
    ~Receiver() { Release(); }

    Receiver(Receiver &&other) noexcept
        : state_(std::move(other.state_)), next_(other.next_),
          missed_total_(other.missed_total_) {}
    Receiver &operator=(Receiver &&other) noexcept {
      if (this != &other) {
        Release();
        state_ = std::move(other.state_);
        next_ = other.next_;
        missed_total_ = other.missed_total_;
      }
      return *this;
    }
    Receiver(const Receiver &) = delete;
    Receiver &operator=(const Receiver &) = delete;

    /**
     * Wait up to `timeout` for the next item
     */
    template <class Rep, class Period>
    RecvResult<T> Recv(std::chrono::duration<Rep, Period> timeout) {
      if (!state_) {
        return RecvResult<T>{RecvStatus::kClosed, std::nullopt, 0};
      }
      std::unique_lock<std::mutex> lock(state_->mutex);
      state_->cv.wait_for(lock, timeout, [this] {
        return next_ < state_->next_seq || state_->closed;
      });
      return TakeLocked();
    }

    // Non-blocking variant
    RecvResult<T> TryRecv() {
      if (!state_) {
        return RecvResult<T>{RecvStatus::kClosed, std::nullopt, 0};
      }
      std::lock_guard<std::mutex> lock(state_->mutex);
      return TakeLocked();
    }

    uint64_t missed_total() const { return missed_total_; }
    bool valid() const { return state_ != nullptr; }

  private:
    friend class BroadcastChannel;
    Receiver(std::shared_ptr<State> state, uint64_t next)
        : state_(std::move(state)), next_(next) {}

    RecvResult<T> TakeLocked() {
      RecvResult<T> result;
      if (next_ < state_->head_seq) {
        result.missed = state_->head_seq - next_;
        missed_total_ += result.missed;
        next_ = state_->head_seq;
      }
      if (next_ < state_->next_seq) {
        result.status = RecvStatus::kOk;
        result.value = state_->ring[next_ - state_->head_seq];
        ++next_;
      } else if (state_->closed) {
        result.status = RecvStatus::kClosed;
      } else {
        result.status = RecvStatus::kTimeout;
      }
      return result;
    }

    void Release() {
      if (state_) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        --state_->receivers;
      }
      state_.reset();
    }

    std::shared_ptr<State> state_;
    uint64_t next_{0};
    uint64_t missed_total_{0};
  };

  explicit BroadcastChannel(size_t capacity) {
    if (capacity == 0) {
      throw std::invalid_argument("BroadcastChannel capacity must be > 0");
    }
    state_ = std::make_shared<State>(capacity);
  }

  BroadcastChannel(const BroadcastChannel &) = delete;
  BroadcastChannel &operator=(const BroadcastChannel &) = delete;

  /**
   * Publish an item to every current receiver
   * @return false if the channel is closed (item dropped)
   */
  bool Send(T value) {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (state_->closed) {
        return false;
      }
      state_->ring.push_back(std::move(value));
      ++state_->next_seq;
      if (state_->ring.size() > state_->capacity) {
        state_->ring.pop_front();
        ++state_->head_seq;
      }
    }
    state_->cv.notify_all();
    return true;
  }

  /**
   * New receiver starting at the next item to be sent
   */
  [[nodiscard]] Receiver Subscribe() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->receivers;
    return Receiver(state_, state_->next_seq);
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->closed = true;
    }
    state_->cv.notify_all();
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->closed;
  }

  size_t receiver_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->receivers;
  }

  size_t capacity() const { return state_->capacity; }

private:
  std::shared_ptr<State> state_;
};

} // namespace util
} // namespace orderwatch
