// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace orderwatch {
namespace orders {

// Signature scheme codes used by the exchange contract
enum class SignatureType : uint8_t {
  kEip712 = 2,
  kEthSign = 3,
};

struct Signature {
  SignatureType type{SignatureType::kEip712};
  uint8_t v{0};
  uint256 r;
  uint256 s;

  friend bool operator==(const Signature &a, const Signature &b) {
    return a.type == b.type && a.v == b.v && a.r == b.r && a.s == b.s;
  }
};

// 0x v4 limit order. Amounts are big-endian words; the 128-bit ones are
// range checked on decode.
struct LimitOrder {
  uint160 maker;
  uint160 taker;
  uint160 maker_token;
  uint160 taker_token;
  uint256 maker_amount;
  uint256 taker_amount;
  uint64_t expiry{0};
  uint256 salt;
  uint160 fee_recipient;
  uint256 pool;
  uint256 taker_token_fee_amount;
  uint160 sender;
  uint160 verifying_contract;
  uint64_t chain_id{0};

  friend bool operator==(const LimitOrder &a, const LimitOrder &b) {
    return a.maker == b.maker && a.taker == b.taker &&
           a.maker_token == b.maker_token && a.taker_token == b.taker_token &&
           a.maker_amount == b.maker_amount &&
           a.taker_amount == b.taker_amount && a.expiry == b.expiry &&
           a.salt == b.salt && a.fee_recipient == b.fee_recipient &&
           a.pool == b.pool &&
           a.taker_token_fee_amount == b.taker_token_fee_amount &&
           a.sender == b.sender && a.verifying_contract == b.verifying_contract &&
           a.chain_id == b.chain_id;
  }
};

/**
 * Order plus signature
 *
 * This is the identity used to deduplicate state requests: two requests are
 * the same job only if every field (signature included) matches.
 */
struct SignedOrder {
  LimitOrder order;
  Signature signature;

  // "maker/salt" prefix for log lines
  std::string ToShortString() const;

  friend bool operator==(const SignedOrder &a, const SignedOrder &b) {
    return a.order == b.order && a.signature == b.signature;
  }
  friend bool operator!=(const SignedOrder &a, const SignedOrder &b) {
    return !(a == b);
  }
};

class OrderParseError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/**
 * Decode the JSON submission format (camelCase order fields with a nested
 * "signature" object; amounts, expiry and salt as decimal strings)
 * @throws OrderParseError naming the offending field
 */
SignedOrder ParseSignedOrder(const nlohmann::json &json);

nlohmann::json SignedOrderToJson(const SignedOrder &order);

} // namespace orders
} // namespace orderwatch

namespace std {
template <> struct hash<orderwatch::orders::SignedOrder> {
  size_t operator()(const orderwatch::orders::SignedOrder &o) const noexcept;
};
} // namespace std
