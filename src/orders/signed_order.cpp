// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "orders/signed_order.hpp"
#include "util/string_parsing.hpp"
#include <fmt/format.h>

namespace orderwatch {
namespace orders {

using json = nlohmann::json;

namespace {

const json &Field(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    throw OrderParseError(fmt::format("missing field '{}'", key));
  }
  return *it;
}

std::string StringField(const json &obj, const char *key) {
  const json &value = Field(obj, key);
  if (!value.is_string()) {
    throw OrderParseError(fmt::format("field '{}' must be a string", key));
  }
  return value.get<std::string>();
}

uint160 AddressField(const json &obj, const char *key) {
  auto address = uint160::FromHex(StringField(obj, key));
  if (!address) {
    throw OrderParseError(fmt::format("field '{}' is not an address", key));
  }
  return *address;
}

uint256 WordField(const json &obj, const char *key) {
  auto word = uint256::FromHex(StringField(obj, key));
  if (!word) {
    throw OrderParseError(fmt::format("field '{}' is not a 32-byte word", key));
  }
  return *word;
}

// Decimal string amount, at most `bits` wide
uint256 AmountField(const json &obj, const char *key, unsigned bits) {
  const std::string text = StringField(obj, key);
  if (text.empty() || text.rfind("0x", 0) == 0) {
    throw OrderParseError(fmt::format("field '{}' must be decimal", key));
  }
  auto amount = util::SafeParseUint256(text);
  if (!amount) {
    throw OrderParseError(fmt::format("field '{}' is not an amount", key));
  }
  const unsigned high_bytes = uint256::size() - bits / 8;
  for (unsigned i = 0; i < high_bytes; ++i) {
    if (amount->data()[i] != 0) {
      throw OrderParseError(
          fmt::format("field '{}' exceeds {} bits", key, bits));
    }
  }
  return *amount;
}

// Accepts a JSON number or a decimal string
uint64_t Uint64Field(const json &obj, const char *key) {
  const json &value = Field(obj, key);
  if (value.is_number_unsigned()) {
    return value.get<uint64_t>();
  }
  if (value.is_string()) {
    auto parsed = util::SafeParseInt64(value.get<std::string>(), 0, INT64_MAX);
    if (parsed) {
      return static_cast<uint64_t>(*parsed);
    }
  }
  throw OrderParseError(fmt::format("field '{}' is not an unsigned integer", key));
}

} // namespace

std::string SignedOrder::ToShortString() const {
  return fmt::format("{}/{}", order.maker.ToShortString(),
                     util::FormatUint256(order.salt));
}

SignedOrder ParseSignedOrder(const json &obj) {
  if (!obj.is_object()) {
    throw OrderParseError("order must be a JSON object");
  }

  SignedOrder signed_order;
  LimitOrder &o = signed_order.order;
  o.maker = AddressField(obj, "maker");
  o.taker = AddressField(obj, "taker");
  o.maker_token = AddressField(obj, "makerToken");
  o.taker_token = AddressField(obj, "takerToken");
  o.maker_amount = AmountField(obj, "makerAmount", 128);
  o.taker_amount = AmountField(obj, "takerAmount", 128);
  o.expiry = Uint64Field(obj, "expiry");
  o.salt = AmountField(obj, "salt", 256);
  o.fee_recipient = AddressField(obj, "feeRecipient");
  o.pool = WordField(obj, "pool");
  o.taker_token_fee_amount = AmountField(obj, "takerTokenFeeAmount", 128);
  o.sender = AddressField(obj, "sender");
  o.verifying_contract = AddressField(obj, "verifyingContract");
  o.chain_id = Uint64Field(obj, "chainId");

  const json &sig = Field(obj, "signature");
  if (!sig.is_object()) {
    throw OrderParseError("field 'signature' must be an object");
  }
  const uint64_t type = Uint64Field(sig, "signatureType");
  if (type == static_cast<uint64_t>(SignatureType::kEip712)) {
    signed_order.signature.type = SignatureType::kEip712;
  } else if (type == static_cast<uint64_t>(SignatureType::kEthSign)) {
    signed_order.signature.type = SignatureType::kEthSign;
  } else {
    throw OrderParseError("Unsupported signature type, expected 2 or 3");
  }
  const uint64_t v = Uint64Field(sig, "v");
  if (v > 255) {
    throw OrderParseError("field 'v' out of range");
  }
  signed_order.signature.v = static_cast<uint8_t>(v);
  signed_order.signature.r = WordField(sig, "r");
  signed_order.signature.s = WordField(sig, "s");
  return signed_order;
}

json SignedOrderToJson(const SignedOrder &signed_order) {
  const LimitOrder &o = signed_order.order;
  return json{
      {"maker", o.maker.GetHex()},
      {"taker", o.taker.GetHex()},
      {"makerToken", o.maker_token.GetHex()},
      {"takerToken", o.taker_token.GetHex()},
      {"makerAmount", util::FormatUint256(o.maker_amount)},
      {"takerAmount", util::FormatUint256(o.taker_amount)},
      {"expiry", std::to_string(o.expiry)},
      {"salt", util::FormatUint256(o.salt)},
      {"feeRecipient", o.fee_recipient.GetHex()},
      {"pool", o.pool.GetHex()},
      {"takerTokenFeeAmount", util::FormatUint256(o.taker_token_fee_amount)},
      {"sender", o.sender.GetHex()},
      {"verifyingContract", o.verifying_contract.GetHex()},
      {"chainId", o.chain_id},
      {"signature",
       {{"signatureType", static_cast<int>(signed_order.signature.type)},
        {"v", signed_order.signature.v},
        {"r", signed_order.signature.r.GetHex()},
        {"s", signed_order.signature.s.GetHex()}}}};
}

} // namespace orders
} // namespace orderwatch

namespace {

// boost::hash_combine mixing step
inline void HashCombine(size_t &seed, size_t value) {
  seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

template <unsigned BITS>
void HashBlob(size_t &seed, const base_blob<BITS> &blob) {
  for (const unsigned char byte : blob) {
    HashCombine(seed, byte);
  }
}

} // namespace

size_t std::hash<orderwatch::orders::SignedOrder>::operator()(
    const orderwatch::orders::SignedOrder &signed_order) const noexcept {
  const auto &o = signed_order.order;
  size_t seed = 0;
  HashBlob(seed, o.maker);
  HashBlob(seed, o.taker);
  HashBlob(seed, o.maker_token);
  HashBlob(seed, o.taker_token);
  HashBlob(seed, o.maker_amount);
  HashBlob(seed, o.taker_amount);
  HashCombine(seed, static_cast<size_t>(o.expiry));
  HashBlob(seed, o.salt);
  HashBlob(seed, o.fee_recipient);
  HashBlob(seed, o.pool);
  HashBlob(seed, o.taker_token_fee_amount);
  HashBlob(seed, o.sender);
  HashBlob(seed, o.verifying_contract);
  HashCombine(seed, static_cast<size_t>(o.chain_id));
  HashCombine(seed, static_cast<size_t>(signed_order.signature.type));
  HashCombine(seed, signed_order.signature.v);
  HashBlob(seed, signed_order.signature.r);
  HashBlob(seed, signed_order.signature.s);
  return seed;
}
