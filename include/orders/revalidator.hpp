// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/chain_event.hpp"
#include "chain/tip_watcher.hpp"
#include "orders/order_state.hpp"
#include "orders/signed_order.hpp"
#include "orders/state_batcher.hpp"
#include "util/broadcast_channel.hpp"
#include "util/uint.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace orderwatch {
namespace orders {

using OrderBatcher = StateBatcher<SignedOrder, OrderState>;

// Published when an order is added or its fillability changes
struct OrderEvent {
  SignedOrder order;
  uint256 hash;
  OrderStatus status{OrderStatus::kAdded};
  uint256 remaining; // taker amount still fillable
  // Block the status was observed at (0 for submissions before the first
  // header)
  uint64_t block_number{0};
};

struct TrackedOrder {
  SignedOrder order;
  uint256 hash;
  OrderStatus status{OrderStatus::kAdded};
  uint256 remaining;
  int64_t created_at{0};
  // First block at which the order was seen unfillable
  std::optional<uint64_t> invalid_since;
};

/**
 * Revalidator - keeps the tracked order set in step with the chain tip
 *
 * Submissions are checked statically and then against the chain with a
 * priority state fetch. Every accepted header triggers a normal-priority
 * refetch of every tracked order; changes are published as OrderEvents.
 * Transitions between two unfillable statuses are not published.
 *
 * Orders that stay unfillable for more than ChainInfo::max_reorg blocks are
 * forgotten. A reorg clears unfillability observed at or above the restart
 * height.
 */
class Revalidator {
public:
  Revalidator(OrderBatcher &batcher, ChainInfo chain,
              size_t event_capacity = 256);
  ~Revalidator();

  Revalidator(const Revalidator &) = delete;
  Revalidator &operator=(const Revalidator &) = delete;

  /**
   * Validate and start tracking an order
   * @return the reason the order was rejected, or nullopt when accepted
   * @throws BatchError if the state could not be fetched
   */
  std::optional<OrderError> Submit(const SignedOrder &order);

  // Process one chain event synchronously
  void OnEvent(const chain::ChainEvent &event);

  // Consume watcher events on a background thread until Stop() or until the
  // watcher closes its channel
  void Start(chain::EventReceiver receiver);
  void Stop();

  [[nodiscard]] util::BroadcastChannel<OrderEvent>::Receiver Subscribe();

  size_t tracked() const;
  std::vector<TrackedOrder> Snapshot() const;
  std::optional<uint64_t> last_block() const;
  const ChainInfo &chain() const { return chain_; }

private:
  void Revalidate(uint64_t block_number);
  void ForgetExpiredInvalid(uint64_t block_number);
  void ConsumeLoop(chain::EventReceiver receiver);

  OrderBatcher &batcher_;
  const ChainInfo chain_;
  util::BroadcastChannel<OrderEvent> events_;

  mutable std::mutex mutex_;
  std::unordered_map<uint256, TrackedOrder> orders_;
  std::optional<uint64_t> last_block_;

  std::thread consumer_;
  std::atomic<bool> stopping_{false};
};

} // namespace orders
} // namespace orderwatch
