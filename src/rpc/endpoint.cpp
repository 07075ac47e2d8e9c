// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rpc/endpoint.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <stdexcept>

namespace orderwatch {
namespace rpc {

namespace {

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

} // namespace

std::string Endpoint::ToString() const {
  const bool v6 = host.find(':') != std::string::npos;
  return fmt::format("{}://{}{}{}:{}{}", tls ? "wss" : "ws", v6 ? "[" : "",
                     host, v6 ? "]" : "", port, target);
}

Endpoint ParseEndpointUrl(const std::string &url) {
  const size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    throw std::invalid_argument("Missing URL scheme: " + url);
  }

  Endpoint endpoint;
  const std::string scheme = ToLower(url.substr(0, scheme_end));
  if (scheme == "ws") {
    endpoint.tls = false;
    endpoint.port = 80;
  } else if (scheme == "wss") {
    endpoint.tls = true;
    endpoint.port = 443;
  } else {
    throw std::invalid_argument("Unsupported transport scheme '" + scheme +
                                "' (expected ws or wss)");
  }

  const std::string rest = url.substr(scheme_end + 3);
  const size_t target_start = rest.find_first_of("/?");
  std::string authority = rest.substr(0, target_start);
  if (target_start != std::string::npos) {
    endpoint.target = rest.substr(target_start);
    if (endpoint.target.front() == '?') {
      endpoint.target.insert(endpoint.target.begin(), '/');
    }
  }

  if (authority.find('@') != std::string::npos) {
    throw std::invalid_argument("Credentials in endpoint URL are not supported");
  }

  std::string port_str;
  if (!authority.empty() && authority.front() == '[') {
    const size_t close = authority.find(']');
    if (close == std::string::npos) {
      throw std::invalid_argument("Unterminated IPv6 host in URL: " + url);
    }
    endpoint.host = authority.substr(1, close - 1);
    const std::string after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        throw std::invalid_argument("Malformed authority in URL: " + url);
      }
      port_str = after.substr(1);
    }
  } else {
    const size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
      endpoint.host = authority.substr(0, colon);
      port_str = authority.substr(colon + 1);
    } else {
      endpoint.host = authority;
    }
  }

  if (endpoint.host.empty()) {
    throw std::invalid_argument("Missing host in URL: " + url);
  }
  if (!port_str.empty()) {
    auto port = util::SafeParseInt(port_str, 1, 65535);
    if (!port) {
      throw std::invalid_argument("Invalid port '" + port_str + "' in URL");
    }
    endpoint.port = static_cast<uint16_t>(*port);
  } else if (authority.back() == ':') {
    throw std::invalid_argument("Empty port in URL: " + url);
  }

  return endpoint;
}

} // namespace rpc
} // namespace orderwatch
