// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/watcher_error.hpp"

namespace orderwatch {
namespace chain {

const char *WatcherErrorCodeName(WatcherErrorCode code) {
  switch (code) {
  case WatcherErrorCode::kTransport:
    return "transport error";
  case WatcherErrorCode::kTimeout:
    return "provider timeout";
  case WatcherErrorCode::kEndOfStream:
    return "header stream ended";
  case WatcherErrorCode::kNotFound:
    return "block not found";
  case WatcherErrorCode::kNumberMissing:
    return "header has no number";
  case WatcherErrorCode::kHashMissing:
    return "header has no hash";
  case WatcherErrorCode::kReorgOverflow:
    return "reorg exceeds maximum depth";
  case WatcherErrorCode::kInsaneParentHash:
    return "parent hash does not match previous block";
  case WatcherErrorCode::kInsaneNumber:
    return "block number does not follow previous block";
  }
  return "unknown watcher error";
}

bool IsRetryable(WatcherErrorCode code) {
  switch (code) {
  case WatcherErrorCode::kTransport:
  case WatcherErrorCode::kTimeout:
  case WatcherErrorCode::kEndOfStream:
    return true;
  default:
    return false;
  }
}

WatcherError::WatcherError(WatcherErrorCode code, const std::string &detail)
    : std::runtime_error(detail.empty()
                             ? std::string(WatcherErrorCodeName(code))
                             : std::string(WatcherErrorCodeName(code)) + ": " +
                                   detail),
      code_(code) {}

} // namespace chain
} // namespace orderwatch
