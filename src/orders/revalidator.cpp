// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "orders/revalidator.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <chrono>
#include <future>
#include <utility>

namespace orderwatch {
namespace orders {

namespace {

// Added and Fillable orders can be traded against
bool IsFillable(OrderStatus status) {
  return status == OrderStatus::kAdded || status == OrderStatus::kFillable;
}

OrderStatus StatusOf(const OrderState &state,
                     const std::optional<OrderError> &error) {
  if (error == OrderError::kInvalidSignature) {
    return OrderStatus::kInvalid;
  }
  return state.status;
}

} // namespace

Revalidator::Revalidator(OrderBatcher &batcher, ChainInfo chain,
                         size_t event_capacity)
    : batcher_(batcher), chain_(std::move(chain)), events_(event_capacity) {}

Revalidator::~Revalidator() { Stop(); }

std::optional<OrderError> Revalidator::Submit(const SignedOrder &order) {
  if (auto error = ValidateOrder(order.order, chain_)) {
    LOG_ORDERS_DEBUG("Rejected order {}: {}", order.ToShortString(),
                     OrderErrorMessage(*error));
    return error;
  }

  // Throws BatchError
  const OrderState state = batcher_.FetchState(order, true).get();
  if (auto error = ValidateState(state)) {
    LOG_ORDERS_DEBUG("Rejected order {}: {}", order.ToShortString(),
                     OrderErrorMessage(*error));
    return error;
  }

  OrderEvent event;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    TrackedOrder tracked;
    tracked.order = order;
    tracked.hash = state.hash;
    tracked.status = OrderStatus::kAdded;
    tracked.remaining = state.taker_fillable;
    tracked.created_at = util::GetTime();
    orders_[state.hash] = tracked;

    event.order = order;
    event.hash = state.hash;
    event.status = OrderStatus::kAdded;
    event.remaining = state.taker_fillable;
    event.block_number = last_block_.value_or(0);
  }
  LOG_ORDERS_INFO("Order {} added ({} fillable)", state.hash.ToShortString(),
                  util::FormatUint256(state.taker_fillable));
  events_.Send(std::move(event));
  return std::nullopt;
}

void Revalidator::OnEvent(const chain::ChainEvent &event) {
  if (const auto *accepted = std::get_if<chain::HeaderAccepted>(&event)) {
    const uint64_t number = accepted->header.number;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_block_ = number;
    }
    ForgetExpiredInvalid(number);
    Revalidate(number);
    return;
  }

  const auto &reorg = std::get<chain::ReorgDetected>(event);
  LOG_ORDERS_INFO("Chain reorganized from block {}, revalidating on next "
                  "header",
                  reorg.restart_height);
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[hash, tracked] : orders_) {
    if (tracked.invalid_since && *tracked.invalid_since >= reorg.restart_height) {
      tracked.invalid_since.reset();
    }
  }
  if (last_block_ && *last_block_ >= reorg.restart_height) {
    last_block_ = reorg.restart_height > 0 ? reorg.restart_height - 1 : 0;
  }
}

void Revalidator::ForgetExpiredInvalid(uint64_t block_number) {
  if (block_number < chain_.max_reorg) {
    return;
  }
  const uint64_t horizon = block_number - chain_.max_reorg;
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = orders_.begin(); it != orders_.end();) {
    if (it->second.invalid_since && *it->second.invalid_since < horizon) {
      LOG_ORDERS_DEBUG("Forgetting order {} (unfillable since block {})",
                       it->first.ToShortString(), *it->second.invalid_since);
      it = orders_.erase(it);
    } else {
      ++it;
    }
  }
}

void Revalidator::Revalidate(uint64_t block_number) {
  std::vector<SignedOrder> orders;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    orders.reserve(orders_.size());
    for (const auto &[hash, tracked] : orders_) {
      orders.push_back(tracked.order);
    }
  }
  if (orders.empty()) {
    return;
  }

  std::vector<std::future<OrderState>> pending;
  pending.reserve(orders.size());
  for (const auto &order : orders) {
    pending.push_back(batcher_.FetchState(order, false));
  }

  std::vector<OrderEvent> events;
  size_t failures = 0;
  for (size_t i = 0; i < pending.size(); ++i) {
    OrderState state;
    try {
      state = pending[i].get();
    } catch (const BatchError &e) {
      // Retried on the next header
      ++failures;
      LOG_ORDERS_DEBUG("State fetch for {} failed: {}",
                       orders[i].ToShortString(), e.what());
      continue;
    }

    const auto error = ValidateState(state);
    const OrderStatus status = StatusOf(state, error);
    const uint256 remaining = error ? uint256() : state.taker_fillable;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(state.hash);
    if (it == orders_.end()) {
      continue;
    }
    TrackedOrder &tracked = it->second;
    const bool was_fillable = IsFillable(tracked.status);
    const bool changed =
        tracked.status != status || tracked.remaining != remaining;

    if (error) {
      if (!tracked.invalid_since) {
        tracked.invalid_since = block_number;
      }
    } else {
      tracked.invalid_since.reset();
    }

    if (changed && (was_fillable || status == OrderStatus::kFillable)) {
      OrderEvent event;
      event.order = tracked.order;
      event.hash = tracked.hash;
      event.status = status;
      event.remaining = remaining;
      event.block_number = block_number;
      events.push_back(std::move(event));
    }
    tracked.status = status;
    tracked.remaining = remaining;
  }

  if (failures > 0) {
    LOG_ORDERS_WARN("Revalidation at block {}: {} of {} state fetches failed",
                    block_number, failures, orders.size());
  }
  LOG_ORDERS_DEBUG("Revalidated {} orders at block {} ({} changed)",
                   orders.size() - failures, block_number, events.size());
  for (auto &event : events) {
    LOG_ORDERS_INFO("Order {} is now {} ({} fillable)",
                    event.hash.ToShortString(), OrderStatusName(event.status),
                    util::FormatUint256(event.remaining));
    events_.Send(std::move(event));
  }
}

void Revalidator::Start(chain::EventReceiver receiver) {
  if (consumer_.joinable()) {
    throw std::logic_error("Revalidator already started");
  }
  stopping_.store(false, std::memory_order_release);
  consumer_ = std::thread(&Revalidator::ConsumeLoop, this, std::move(receiver));
}

void Revalidator::Stop() {
  stopping_.store(true, std::memory_order_release);
  if (consumer_.joinable()) {
    consumer_.join();
  }
  events_.Close();
}

void Revalidator::ConsumeLoop(chain::EventReceiver receiver) {
  while (!stopping_.load(std::memory_order_acquire)) {
    auto result = receiver.Recv(std::chrono::milliseconds(200));
    if (result.missed > 0) {
      LOG_ORDERS_WARN("Fell {} chain events behind, revalidating on next "
                      "header",
                      result.missed);
    }
    if (result.status == util::RecvStatus::kClosed) {
      LOG_ORDERS_INFO("Chain event stream closed");
      break;
    }
    if (result.status == util::RecvStatus::kOk) {
      OnEvent(*result.value);
    }
  }
}

util::BroadcastChannel<OrderEvent>::Receiver Revalidator::Subscribe() {
  return events_.Subscribe();
}

size_t Revalidator::tracked() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return orders_.size();
}

std::vector<TrackedOrder> Revalidator::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TrackedOrder> out;
  out.reserve(orders_.size());
  for (const auto &[hash, tracked] : orders_) {
    out.push_back(tracked);
  }
  return out;
}

std::optional<uint64_t> Revalidator::last_block() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_block_;
}

} // namespace orders
} // namespace orderwatch
