// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block_header.hpp"
#include "chain/watcher_error.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace orderwatch {
namespace chain {

// Abstract header feed consumed by the chain tip watcher.
// Implementations:
// - rpc::WsHeaderSource: eth_subscribe/eth_getBlockBy* over a websocket
// - ScriptedHeaderSource: in-memory chain for tests (in test/)

class HeaderConnection;
using HeaderConnectionPtr = std::shared_ptr<HeaderConnection>;

using HeaderCallback = std::function<void(const BlockHeader &header)>;
using ClosedCallback = std::function<void(const WatcherError &error)>;

// One live connection to a node: a push subscription of new heads plus
// on-demand header fetches
class HeaderConnection {
public:
  virtual ~HeaderConnection() = default;

  // Start the new-heads subscription. on_header may be invoked from any
  // thread, in arrival order. on_closed is invoked at most once, after the
  // last on_header, when the subscription ends for any reason other than
  // Close(): kEndOfStream for a clean close, kTransport for a socket error,
  // kNumberMissing/kHashMissing for an undecodable notification.
  virtual void Subscribe(HeaderCallback on_header, ClosedCallback on_closed) = 0;

  // Blocking fetch, bounded by `timeout`.
  // Throws WatcherError (kTransport, kTimeout, kNotFound, kNumberMissing,
  // kHashMissing).
  virtual BlockHeader FetchHeader(const BlockId &id,
                                  std::chrono::milliseconds timeout) = 0;

  // Tear down the connection. Pending fetches fail with kTransport.
  // Safe to call more than once and from any thread.
  virtual void Close() = 0;

  virtual std::string Describe() const = 0;
};

// Factory for connections
class HeaderSource {
public:
  virtual ~HeaderSource() = default;

  // Throws WatcherError(kTransport or kTimeout) if no connection could be
  // established
  virtual HeaderConnectionPtr Connect(std::chrono::milliseconds timeout) = 0;
};

} // namespace chain
} // namespace orderwatch
