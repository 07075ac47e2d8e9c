// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "orders/state_batcher.hpp"

namespace orderwatch {
namespace orders {

const char *BatchErrorCodeName(BatchErrorCode code) {
  switch (code) {
  case BatchErrorCode::kCallFailed:
    return "batch call failed";
  case BatchErrorCode::kInvalidOutputLength:
    return "batch call returned wrong number of results";
  case BatchErrorCode::kUnavailable:
    return "state batcher unavailable";
  }
  return "unknown batch error";
}

BatchError::BatchError(BatchErrorCode code, const std::string &detail)
    : std::runtime_error(detail.empty()
                             ? std::string(BatchErrorCodeName(code))
                             : std::string(BatchErrorCodeName(code)) + ": " +
                                   detail),
      code_(code) {}

} // namespace orders
} // namespace orderwatch
