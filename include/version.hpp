// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace orderwatch {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Unicity Foundation";

inline std::string GetFullVersionString() {
  return "orderwatch version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *BLUE = "\033[1;34m";
} // namespace colors

// One-box startup banner naming the provider endpoint
inline std::string GetStartupBanner(const std::string &endpoint) {
  std::string banner;
  banner += "\n";
  banner += colors::BLUE;
  banner += "+-------------------------------------------------------------+\n";
  banner += "|  orderwatch  chain tip watcher / order state revalidation   |\n";
  banner += "+-------------------------------------------------------------+\n";
  banner += "  Version:  " + GetVersionString() + "\n";
  banner += "  Provider: " + endpoint + "\n";
  banner += "  " + GetCopyrightString() + "\n";
  banner += colors::RESET;
  banner += "\n";
  return banner;
}

} // namespace orderwatch
