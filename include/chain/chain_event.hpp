// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block_header.hpp"
#include <cstdint>
#include <string>
#include <variant>

namespace orderwatch {
namespace chain {

// A header extending the previously emitted one
struct HeaderAccepted {
  BlockHeader header;
};

// Everything at or above restart_height is provisional. Replacement headers
// starting at restart_height follow.
struct ReorgDetected {
  uint64_t restart_height{0};
};

using ChainEvent = std::variant<HeaderAccepted, ReorgDetected>;

std::string DescribeEvent(const ChainEvent &event);

} // namespace chain
} // namespace orderwatch
