// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rpc/json_rpc.hpp"
#include "chain/watcher_error.hpp"
#include "util/string_parsing.hpp"
#include <fmt/format.h>
#include <optional>
#include <stdexcept>

namespace orderwatch {
namespace rpc {

using chain::WatcherError;
using chain::WatcherErrorCode;
using json = nlohmann::json;

namespace {

std::optional<std::string> StringField(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

// Optional quantity: absent or null yields nullopt, malformed throws
std::optional<uint64_t> QuantityField(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw WatcherError(WatcherErrorCode::kTransport,
                       fmt::format("field '{}' is not a quantity", key));
  }
  auto value = util::SafeParseQuantity(it->get<std::string>());
  if (!value) {
    throw WatcherError(WatcherErrorCode::kTransport,
                       fmt::format("field '{}' is not a quantity", key));
  }
  return value;
}

} // namespace

chain::BlockHeader ParseBlockHeader(const json &block) {
  if (block.is_null()) {
    throw WatcherError(WatcherErrorCode::kNotFound, "");
  }
  if (!block.is_object()) {
    throw WatcherError(WatcherErrorCode::kTransport, "block is not an object");
  }

  chain::BlockHeader header;

  auto number_str = StringField(block, "number");
  auto number = number_str ? util::SafeParseQuantity(*number_str) : std::nullopt;
  if (!number) {
    throw WatcherError(WatcherErrorCode::kNumberMissing, "");
  }
  header.number = *number;

  auto hash_str = StringField(block, "hash");
  auto hash = hash_str ? uint256::FromHex(*hash_str) : std::nullopt;
  if (!hash) {
    throw WatcherError(WatcherErrorCode::kHashMissing,
                       fmt::format("block {}", header.number));
  }
  header.hash = *hash;

  auto parent_str = StringField(block, "parentHash");
  auto parent = parent_str ? uint256::FromHex(*parent_str) : std::nullopt;
  if (!parent) {
    throw WatcherError(WatcherErrorCode::kTransport,
                       fmt::format("block {} has no parentHash", header.number));
  }
  header.parent_hash = *parent;

  header.timestamp = QuantityField(block, "timestamp").value_or(0);
  header.gas_used = QuantityField(block, "gasUsed").value_or(0);
  header.gas_limit = QuantityField(block, "gasLimit").value_or(0);
  header.base_fee = QuantityField(block, "baseFeePerGas");

  if (auto miner_str = StringField(block, "miner")) {
    auto miner = uint160::FromHex(*miner_str);
    if (!miner) {
      throw WatcherError(WatcherErrorCode::kTransport,
                         "field 'miner' is not an address");
    }
    header.miner = *miner;
  }

  return header;
}

RpcCall BlockIdToCall(const chain::BlockId &id) {
  switch (id.kind()) {
  case chain::BlockId::Kind::kLatest:
    return {"eth_getBlockByNumber", json::array({"latest", false})};
  case chain::BlockId::Kind::kNumber:
    return {"eth_getBlockByNumber",
            json::array({FormatQuantity(id.number()), false})};
  case chain::BlockId::Kind::kHash:
    return {"eth_getBlockByHash", json::array({id.hash().GetHex(), false})};
  }
  throw std::logic_error("unhandled BlockId kind");
}

RpcCall NewHeadsSubscribeCall() {
  return {"eth_subscribe", json::array({"newHeads"})};
}

json MakeRequest(uint64_t id, const RpcCall &call) {
  return json{{"jsonrpc", "2.0"},
              {"id", id},
              {"method", call.method},
              {"params", call.params}};
}

std::string FormatQuantity(uint64_t value) {
  return fmt::format("0x{:x}", value);
}

} // namespace rpc
} // namespace orderwatch
