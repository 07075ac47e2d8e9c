// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/header_source.hpp"
#include "rpc/endpoint.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <string>
#include <thread>

namespace orderwatch {
namespace rpc {

/**
 * WsHeaderSource - Ethereum JSON-RPC over a websocket (Boost.Beast)
 *
 * Each Connect() opens a fresh websocket (TLS for wss://) served by the
 * source's single I/O thread. Connections subscribe to newHeads with
 * eth_subscribe and fetch headers with eth_getBlockByNumber /
 * eth_getBlockByHash. Responses are correlated by request id; a request
 * without a response inside its timeout fails with kTimeout and its late
 * response is ignored.
 *
 * Connections must be closed before the source is destroyed.
 */
class WsHeaderSource : public chain::HeaderSource {
public:
  // @throws std::invalid_argument if the URL is not ws:// or wss://
  explicit WsHeaderSource(const std::string &url);
  ~WsHeaderSource() override;

  WsHeaderSource(const WsHeaderSource &) = delete;
  WsHeaderSource &operator=(const WsHeaderSource &) = delete;

  chain::HeaderConnectionPtr Connect(std::chrono::milliseconds timeout) override;

  const Endpoint &endpoint() const { return endpoint_; }

private:
  const Endpoint endpoint_;
  boost::asio::io_context io_context_;
  boost::asio::ssl::context ssl_context_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      work_guard_;
  std::thread io_thread_;
};

} // namespace rpc
} // namespace orderwatch
