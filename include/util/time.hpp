// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace orderwatch {
namespace util {

/**
 * Wall-clock time in seconds since the epoch
 * Returns the mock time when one is set (tests)
 */
int64_t GetTime();

// 0 disables mocking
void SetMockTime(int64_t time);
int64_t GetMockTime();

/**
 * Format a Unix timestamp as "YYYY-MM-DD HH:MM:SS UTC"
 */
std::string FormatTime(int64_t unix_time);

/**
 * Seconds between `unix_time` and now, clamped at zero for timestamps in
 * the future (clock skew between us and the block producer)
 */
int64_t AgeSeconds(int64_t unix_time);

// Sets mock time for the lifetime of the scope
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }
  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace orderwatch
