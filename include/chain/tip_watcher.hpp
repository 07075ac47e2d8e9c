// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block_header.hpp"
#include "chain/chain_event.hpp"
#include "chain/header_source.hpp"
#include "util/broadcast_channel.hpp"
#include "util/threadpool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace orderwatch {
namespace chain {

class HeaderInbox;

struct WatcherConfig {
  // Wait this long on the subscription before polling the latest header
  std::chrono::milliseconds poll_delay{std::chrono::seconds(5)};
  // Bound on every header fetch
  std::chrono::milliseconds fetch_timeout{std::chrono::seconds(5)};
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
  // Deepest reorg that is resolved (number of replaced blocks)
  size_t max_reorg_depth{10};
  // Consecutive failed connection cycles without progress before giving up
  uint32_t max_retries{10};
  std::chrono::milliseconds retry_delay{std::chrono::seconds(1)};
  // Broadcast backlog per subscriber
  size_t event_capacity{20};
};

struct WatcherStats {
  uint64_t connection_attempts{0};
  uint64_t headers_received{0}; // from the subscription or polling
  uint64_t headers_accepted{0}; // emitted as HeaderAccepted
  uint64_t stale_headers{0};    // not newer than the last accepted header
  uint64_t reorgs_detected{0};
  uint64_t blocks_rewound{0};
};

using EventReceiver = util::BroadcastChannel<ChainEvent>::Receiver;

/**
 * ChainTipWatcher - linearizes an unreliable header feed
 *
 * Runs a supervised background thread that connects to a HeaderSource,
 * follows new heads, resolves reorgs up to max_reorg_depth and publishes a
 * gap-free, hash-linked sequence of ChainEvents to any number of
 * subscribers. Subscribers that fall more than event_capacity events behind
 * skip the oldest events instead of stalling the watcher.
 *
 * Connection loop:
 *   connect -> (first time only) fetch latest -> follow heads -> error
 *   -> wait retry_delay -> reconnect
 * The retry counter resets once a cycle ends after accepting at least one
 * new header. When it exceeds max_retries the watcher stops, closes the
 * event channel and reports through the fatal callback.
 *
 * Threading: everything except the public methods below runs on the
 * watcher thread. The last accepted header and the retry counter are owned
 * by that thread.
 */
class ChainTipWatcher {
public:
  using FatalCallback = std::function<void(const std::string &reason)>;

  ChainTipWatcher(std::shared_ptr<HeaderSource> source, WatcherConfig config);
  ~ChainTipWatcher();

  ChainTipWatcher(const ChainTipWatcher &) = delete;
  ChainTipWatcher &operator=(const ChainTipWatcher &) = delete;

  // Invoked once from the watcher thread when the retry budget is exhausted.
  // Must be set before Start().
  void SetFatalCallback(FatalCallback callback);

  /**
   * Spawn the watcher thread
   * @return a receiver that sees every event including the initial header
   * @throws std::invalid_argument on an unusable configuration
   * @throws std::logic_error if already started
   */
  [[nodiscard]] EventReceiver Start();

  // Additional subscriber. Sees events published after this call.
  [[nodiscard]] EventReceiver Subscribe();

  // Signal shutdown, close the connection and join. Idempotent.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }
  bool Failed() const { return failed_.load(std::memory_order_acquire); }

  std::optional<BlockHeader> LastAccepted() const;
  WatcherStats GetStats() const;
  const WatcherConfig &config() const { return config_; }

private:
  void Run();
  void RunConnection();
  std::optional<BlockHeader> NextHeader(const HeaderConnectionPtr &conn,
                                        const std::shared_ptr<HeaderInbox> &inbox);
  void SendWithReorgs(HeaderConnection &conn, const BlockHeader &latest);
  void Publish(ChainEvent event);
  void SetLast(const BlockHeader &header);
  bool SleepUnlessStopped(std::chrono::milliseconds delay);
  bool stopping() const { return stopping_.load(std::memory_order_acquire); }

  const std::shared_ptr<HeaderSource> source_;
  const WatcherConfig config_;
  FatalCallback fatal_callback_;

  util::BroadcastChannel<ChainEvent> events_;
  util::ThreadPool poll_pool_;

  // Watcher thread state
  std::optional<BlockHeader> last_;

  // Shared with Stop() and observers
  mutable std::mutex mutex_;
  std::condition_variable stop_cv_;
  std::optional<BlockHeader> last_snapshot_;
  HeaderConnectionPtr connection_;
  std::shared_ptr<HeaderInbox> inbox_;

  std::thread thread_;
  std::atomic<bool> started_{false};
  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<bool> failed_{false};

  std::atomic<uint64_t> connection_attempts_{0};
  std::atomic<uint64_t> headers_received_{0};
  std::atomic<uint64_t> headers_accepted_{0};
  std::atomic<uint64_t> stale_headers_{0};
  std::atomic<uint64_t> reorgs_detected_{0};
  std::atomic<uint64_t> blocks_rewound_{0};
};

} // namespace chain
} // namespace orderwatch
