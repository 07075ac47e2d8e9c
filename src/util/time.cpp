// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <fmt/format.h>

namespace orderwatch {
namespace util {

namespace {
std::atomic<int64_t> g_mock_time{0};
} // namespace

int64_t GetTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
}

int64_t GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

std::string FormatTime(int64_t unix_time) {
  std::time_t t = static_cast<std::time_t>(unix_time);
  std::tm tm_utc{};
  if (gmtime_r(&t, &tm_utc) == nullptr) {
    return fmt::format("@{}", unix_time);
  }
  return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02} UTC",
                     tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                     tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec);
}

int64_t AgeSeconds(int64_t unix_time) {
  int64_t age = GetTime() - unix_time;
  return age > 0 ? age : 0;
}

} // namespace util
} // namespace orderwatch
