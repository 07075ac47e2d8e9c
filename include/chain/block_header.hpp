// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace orderwatch {
namespace chain {

/**
 * Ethereum block header as seen by the chain tip watcher
 *
 * Only number, hash and parent_hash drive the watcher's logic. The remaining
 * fields are carried through to subscribers.
 */
struct BlockHeader {
  uint64_t number{0};
  uint256 hash;
  uint256 parent_hash;
  uint64_t timestamp{0}; // seconds since epoch
  uint160 miner;
  uint64_t gas_used{0};
  uint64_t gas_limit{0};
  std::optional<uint64_t> base_fee; // absent before London

  // True if this header directly extends `parent`
  bool Extends(const BlockHeader &parent) const {
    return number == parent.number + 1 && parent_hash == parent.hash;
  }

  std::string ToString() const;

  friend bool operator==(const BlockHeader &a, const BlockHeader &b) {
    return a.number == b.number && a.hash == b.hash &&
           a.parent_hash == b.parent_hash && a.timestamp == b.timestamp &&
           a.miner == b.miner && a.gas_used == b.gas_used &&
           a.gas_limit == b.gas_limit && a.base_fee == b.base_fee;
  }
  friend bool operator!=(const BlockHeader &a, const BlockHeader &b) {
    return !(a == b);
  }
};

/**
 * Block selector for header fetches: the current tip, a height or a hash
 */
class BlockId {
public:
  enum class Kind { kLatest, kNumber, kHash };

  static BlockId Latest() { return BlockId(Kind::kLatest, 0, uint256()); }
  static BlockId Number(uint64_t number) {
    return BlockId(Kind::kNumber, number, uint256());
  }
  static BlockId Hash(const uint256 &hash) {
    return BlockId(Kind::kHash, 0, hash);
  }

  Kind kind() const { return kind_; }
  uint64_t number() const { return number_; }
  const uint256 &hash() const { return hash_; }

  std::string ToString() const;

  friend bool operator==(const BlockId &a, const BlockId &b) {
    return a.kind_ == b.kind_ && a.number_ == b.number_ && a.hash_ == b.hash_;
  }

private:
  BlockId(Kind kind, uint64_t number, const uint256 &hash)
      : kind_(kind), number_(number), hash_(hash) {}

  Kind kind_;
  uint64_t number_;
  uint256 hash_;
};

} // namespace chain
} // namespace orderwatch
