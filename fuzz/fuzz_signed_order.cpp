// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Fuzz target for order submissions

#include "orders/order_state.hpp"
#include "orders/signed_order.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

using namespace orderwatch::orders;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
  auto json = nlohmann::json::parse(data, data + size, nullptr, false);
  if (json.is_discarded()) {
    return 0;
  }

  SignedOrder order;
  try {
    order = ParseSignedOrder(json);
  } catch (const OrderParseError &) {
    return 0;
  }

  // Encoding a decoded order must decode to the same order
  SignedOrder again;
  try {
    again = ParseSignedOrder(SignedOrderToJson(order));
  } catch (const OrderParseError &) {
    __builtin_trap();
  }
  if (again != order || std::hash<SignedOrder>{}(again) != std::hash<SignedOrder>{}(order)) {
    __builtin_trap();
  }

  // Static validation never throws
  (void)ValidateOrder(order.order, ChainInfo::Mainnet());
  return 0;
}
