// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block_header.hpp"
#include "chain/chain_event.hpp"
#include "util/time.hpp"
#include <fmt/format.h>

namespace orderwatch {
namespace chain {

std::string BlockHeader::ToString() const {
  return fmt::format("BlockHeader(number={}, hash={}, parent={}, time={})",
                     number, hash.ToShortString(), parent_hash.ToShortString(),
                     util::FormatTime(static_cast<int64_t>(timestamp)));
}

std::string BlockId::ToString() const {
  switch (kind_) {
  case Kind::kLatest:
    return "latest";
  case Kind::kNumber:
    return fmt::format("#{}", number_);
  case Kind::kHash:
    return hash_.GetHex();
  }
  return "unknown";
}

std::string DescribeEvent(const ChainEvent &event) {
  if (const auto *accepted = std::get_if<HeaderAccepted>(&event)) {
    return fmt::format("header {} {}", accepted->header.number,
                       accepted->header.hash.ToShortString());
  }
  return fmt::format("reorg from height {}",
                     std::get<ReorgDetected>(event).restart_height);
}

} // namespace chain
} // namespace orderwatch
