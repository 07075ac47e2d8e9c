// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block_header.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace orderwatch {
namespace rpc {

// Method and params of a JSON-RPC call
struct RpcCall {
  std::string method;
  nlohmann::json params;
};

/**
 * Decode an eth_getBlockBy* result or a newHeads notification payload
 *
 * Throws chain::WatcherError:
 * - kNotFound for a null block
 * - kNumberMissing if "number" is absent, null (pending block) or malformed
 * - kHashMissing if "hash" is absent, null or malformed
 * - kTransport for any other malformed field
 */
chain::BlockHeader ParseBlockHeader(const nlohmann::json &block);

// eth_getBlockByNumber / eth_getBlockByHash without transaction bodies
RpcCall BlockIdToCall(const chain::BlockId &id);

// eth_subscribe for new heads
RpcCall NewHeadsSubscribeCall();

// Complete request envelope
nlohmann::json MakeRequest(uint64_t id, const RpcCall &call);

// "0x"-prefixed minimal hex quantity
std::string FormatQuantity(uint64_t value);

} // namespace rpc
} // namespace orderwatch
