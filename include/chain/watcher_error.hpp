// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <stdexcept>
#include <string>

namespace orderwatch {
namespace chain {

enum class WatcherErrorCode {
  kTransport,        // connect, send or receive failed
  kTimeout,          // request exceeded its deadline
  kEndOfStream,      // header subscription closed
  kNotFound,         // node returned null for the requested block
  kNumberMissing,    // header without a usable number
  kHashMissing,      // header without a usable hash
  kReorgOverflow,    // reorg deeper than the configured maximum
  kInsaneParentHash, // replay found a broken parent link
  kInsaneNumber,     // replay found a non-consecutive number
};

const char *WatcherErrorCodeName(WatcherErrorCode code);

// Transient connectivity failures, as opposed to structural ones (malformed
// headers, reorg overflow, broken hash chain). Both end the current
// connection cycle and consume one retry.
bool IsRetryable(WatcherErrorCode code);

class WatcherError : public std::runtime_error {
public:
  WatcherError(WatcherErrorCode code, const std::string &detail);

  WatcherErrorCode code() const noexcept { return code_; }
  bool retryable() const { return IsRetryable(code_); }

private:
  WatcherErrorCode code_;
};

} // namespace chain
} // namespace orderwatch
