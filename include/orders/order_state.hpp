// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "orders/signed_order.hpp"
#include "util/uint.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace orderwatch {
namespace orders {

enum class OrderStatus {
  kAdded, // accepted by us, not yet revalidated
  kInvalid,
  kFillable,
  kFullyFilled,
  kCancelled,
  kExpired,
};

const char *OrderStatusName(OrderStatus status);

// Map the exchange contract's status code (0 invalid, 1 fillable,
// 2 filled, 3 cancelled, 4 expired)
std::optional<OrderStatus> OrderStatusFromContract(uint8_t code);

// On-chain state of one order as returned by the exchange contract
struct OrderState {
  uint256 hash;
  OrderStatus status{OrderStatus::kInvalid};
  uint256 taker_filled;   // taker token amount already filled
  uint256 taker_fillable; // taker token amount still fillable
  bool signature_valid{false};

  friend bool operator==(const OrderState &a, const OrderState &b) {
    return a.hash == b.hash && a.status == b.status &&
           a.taker_filled == b.taker_filled &&
           a.taker_fillable == b.taker_fillable &&
           a.signature_valid == b.signature_valid;
  }
};

// Rejection reasons; messages follow the 0x order validator
enum class OrderError {
  kZeroMakerAmount,
  kZeroTakerAmount,
  kInvalidMakerAddress,
  kInvalidTakerAddress,
  kInvalidVerifyingContract,
  kInvalidSignature,
  kCancelled,
  kExpired,
  kUnfunded,
  kFullyFilled,
};

// e.g. "ORDER_CANCELLED"
const char *OrderErrorCode(OrderError error);
// e.g. "ORDER_CANCELLED: order cancelled"
const char *OrderErrorMessage(OrderError error);

// Deployment the orders must target
struct ChainInfo {
  uint64_t chain_id{1};
  uint160 exchange;
  uint160 flash_wallet;
  // Invalid orders are forgotten after this many blocks
  size_t max_reorg{10};

  // Ethereum main net
  static ChainInfo Mainnet();
};

/**
 * Static checks that need no chain state
 * @return the first violated rule, or nullopt
 */
std::optional<OrderError> ValidateOrder(const LimitOrder &order,
                                        const ChainInfo &chain);

/**
 * Checks on the fetched on-chain state
 * @return the reason the order cannot be filled, or nullopt
 */
std::optional<OrderError> ValidateState(const OrderState &state);

} // namespace orders
} // namespace orderwatch
