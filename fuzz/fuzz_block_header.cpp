// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Fuzz target for block header JSON from the node

#include "chain/watcher_error.hpp"
#include "rpc/json_rpc.hpp"
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
  // Non-throwing parse: malformed JSON is discarded like the connection does
  auto block = nlohmann::json::parse(data, data + size, nullptr, false);
  if (block.is_discarded()) {
    return 0;
  }

  orderwatch::chain::BlockHeader header;
  try {
    header = orderwatch::rpc::ParseBlockHeader(block);
  } catch (const orderwatch::chain::WatcherError &) {
    return 0;
  }

  // An accepted header must describe itself and identify itself by hash
  if (header.ToString().empty()) {
    __builtin_trap();
  }
  auto by_hash = orderwatch::chain::BlockId::Hash(header.hash);
  if (by_hash.hash() != header.hash) {
    __builtin_trap();
  }
  return 0;
}
