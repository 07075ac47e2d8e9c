// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace orderwatch {
namespace rpc {

// Websocket JSON-RPC endpoint
struct Endpoint {
  bool tls{false};
  std::string host;
  uint16_t port{0};
  std::string target{"/"}; // path and query

  std::string ToString() const;
};

/**
 * Parse a ws:// or wss:// URL
 *
 * Port defaults to 80 (ws) or 443 (wss), target to "/". IPv6 hosts use the
 * bracketed form ("ws://[::1]:8546").
 *
 * @throws std::invalid_argument for any other scheme, an empty host,
 *         embedded credentials or a bad port
 */
Endpoint ParseEndpointUrl(const std::string &url);

} // namespace rpc
} // namespace orderwatch
