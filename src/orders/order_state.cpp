// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "orders/order_state.hpp"

namespace orderwatch {
namespace orders {

const char *OrderStatusName(OrderStatus status) {
  switch (status) {
  case OrderStatus::kAdded:
    return "ADDED";
  case OrderStatus::kInvalid:
    return "INVALID";
  case OrderStatus::kFillable:
    return "FILLABLE";
  case OrderStatus::kFullyFilled:
    return "FULLY_FILLED";
  case OrderStatus::kCancelled:
    return "CANCELLED";
  case OrderStatus::kExpired:
    return "EXPIRED";
  }
  return "UNKNOWN";
}

std::optional<OrderStatus> OrderStatusFromContract(uint8_t code) {
  switch (code) {
  case 0:
    return OrderStatus::kInvalid;
  case 1:
    return OrderStatus::kFillable;
  case 2:
    return OrderStatus::kFullyFilled;
  case 3:
    return OrderStatus::kCancelled;
  case 4:
    return OrderStatus::kExpired;
  default:
    return std::nullopt;
  }
}

const char *OrderErrorCode(OrderError error) {
  switch (error) {
  case OrderError::kZeroMakerAmount:
    return "ORDER_HAS_INVALID_MAKER_ASSET_AMOUNT";
  case OrderError::kZeroTakerAmount:
    return "ORDER_HAS_INVALID_TAKER_ASSET_AMOUNT";
  case OrderError::kInvalidMakerAddress:
    return "ORDER_HAS_INVALID_MAKER_ASSET_DATA";
  case OrderError::kInvalidTakerAddress:
    return "ORDER_HAS_INVALID_TAKER_ASSET_DATA";
  case OrderError::kInvalidVerifyingContract:
    return "INCORRECT_EXCHANGE_ADDRESS";
  case OrderError::kInvalidSignature:
    return "ORDER_HAS_INVALID_SIGNATURE";
  case OrderError::kCancelled:
    return "ORDER_CANCELLED";
  case OrderError::kExpired:
    return "ORDER_EXPIRED";
  case OrderError::kUnfunded:
    return "ORDER_UNFUNDED";
  case OrderError::kFullyFilled:
    return "ORDER_FULLY_FILLED";
  }
  return "UNKNOWN";
}

const char *OrderErrorMessage(OrderError error) {
  switch (error) {
  case OrderError::kZeroMakerAmount:
    return "ORDER_HAS_INVALID_MAKER_ASSET_AMOUNT: order makerAssetAmount "
           "cannot be 0";
  case OrderError::kZeroTakerAmount:
    return "ORDER_HAS_INVALID_TAKER_ASSET_AMOUNT: order takerAssetAmount "
           "cannot be 0";
  case OrderError::kInvalidMakerAddress:
    return "ORDER_HAS_INVALID_MAKER_ASSET_DATA: order makerAssetData must "
           "encode a supported assetData type";
  case OrderError::kInvalidTakerAddress:
    return "ORDER_HAS_INVALID_TAKER_ASSET_DATA: order takerAssetData must "
           "encode a supported assetData type";
  case OrderError::kInvalidVerifyingContract:
    return "INCORRECT_EXCHANGE_ADDRESS: the exchange address for the order "
           "does not match the chain ID/network ID";
  case OrderError::kInvalidSignature:
    return "ORDER_HAS_INVALID_SIGNATURE: order signature must be valid";
  case OrderError::kCancelled:
    return "ORDER_CANCELLED: order cancelled";
  case OrderError::kExpired:
    return "ORDER_EXPIRED: order expired according to latest block timestamp";
  case OrderError::kUnfunded:
    return "ORDER_UNFUNDED: maker has insufficient balance or allowance for "
           "this order to be filled";
  case OrderError::kFullyFilled:
    return "ORDER_FULLY_FILLED: order already fully filled";
  }
  return "UNKNOWN";
}

ChainInfo ChainInfo::Mainnet() {
  ChainInfo info;
  info.chain_id = 1;
  info.exchange = uint160::FromHex("0xdef1c0ded9bec7f1a1670819833240f027b25eff").value();
  info.flash_wallet =
      uint160::FromHex("0x22f9dcf4647084d6c31b2765f6910cd85c178c18").value();
  info.max_reorg = 10;
  return info;
}

std::optional<OrderError> ValidateOrder(const LimitOrder &order,
                                        const ChainInfo &chain) {
  if (order.maker_amount.IsNull()) {
    return OrderError::kZeroMakerAmount;
  }
  if (order.taker_amount.IsNull()) {
    return OrderError::kZeroTakerAmount;
  }
  if (order.maker.IsNull()) {
    return OrderError::kInvalidMakerAddress;
  }
  if (order.taker == chain.flash_wallet) {
    return OrderError::kInvalidTakerAddress;
  }
  if (order.chain_id != chain.chain_id ||
      order.verifying_contract != chain.exchange) {
    return OrderError::kInvalidVerifyingContract;
  }
  return std::nullopt;
}

std::optional<OrderError> ValidateState(const OrderState &state) {
  if (!state.signature_valid) {
    return OrderError::kInvalidSignature;
  }
  switch (state.status) {
  case OrderStatus::kAdded:
  case OrderStatus::kFillable:
    return std::nullopt;
  case OrderStatus::kInvalid:
    return OrderError::kUnfunded;
  case OrderStatus::kFullyFilled:
    return OrderError::kFullyFilled;
  case OrderStatus::kCancelled:
    return OrderError::kCancelled;
  case OrderStatus::kExpired:
    return OrderError::kExpired;
  }
  return OrderError::kUnfunded;
}

} // namespace orders
} // namespace orderwatch
