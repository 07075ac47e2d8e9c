// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace orderwatch {
namespace util {

/**
 * LogManager - one spdlog logger per daemon component
 *
 * Components: "default", "chain" (tip watcher), "rpc" (node connection)
 * and "orders" (batcher and revalidator). All loggers share one sink: the
 * console, or a rotating file when requested.
 *
 * Initialization happens once; any GetLogger() call before Initialize()
 * initializes with defaults. After Shutdown() loggers are silent.
 */
class LogManager {
public:
  // level: trace, debug, info, warn, error, critical or off
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "orderwatch.log");

  // Flushes and drops every logger
  static void Shutdown();

  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Level for every component
  static void SetLogLevel(const std::string &level);

  static void SetComponentLevel(const std::string &component,
                                const std::string &level);

  /**
   * Trace logging for a comma-separated list of components ("chain,rpc").
   * "all" enables every component.
   * @return the names that are not components
   */
  static std::vector<std::string> EnableDebug(std::string_view categories);

  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace orderwatch

#define LOG_TRACE(...)                                                         \
  orderwatch::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  orderwatch::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  orderwatch::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  orderwatch::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  orderwatch::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Tip watcher
#define LOG_CHAIN_TRACE(...)                                                   \
  orderwatch::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  orderwatch::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  orderwatch::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  orderwatch::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  orderwatch::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

// Node connection
#define LOG_RPC_TRACE(...)                                                     \
  orderwatch::util::LogManager::GetLogger("rpc")->trace(__VA_ARGS__)
#define LOG_RPC_DEBUG(...)                                                     \
  orderwatch::util::LogManager::GetLogger("rpc")->debug(__VA_ARGS__)
#define LOG_RPC_WARN(...)                                                      \
  orderwatch::util::LogManager::GetLogger("rpc")->warn(__VA_ARGS__)
#define LOG_RPC_ERROR(...)                                                     \
  orderwatch::util::LogManager::GetLogger("rpc")->error(__VA_ARGS__)

// Batcher and revalidator
#define LOG_ORDERS_TRACE(...)                                                  \
  orderwatch::util::LogManager::GetLogger("orders")->trace(__VA_ARGS__)
#define LOG_ORDERS_DEBUG(...)                                                  \
  orderwatch::util::LogManager::GetLogger("orders")->debug(__VA_ARGS__)
#define LOG_ORDERS_INFO(...)                                                   \
  orderwatch::util::LogManager::GetLogger("orders")->info(__VA_ARGS__)
#define LOG_ORDERS_WARN(...)                                                   \
  orderwatch::util::LogManager::GetLogger("orders")->warn(__VA_ARGS__)
#define LOG_ORDERS_ERROR(...)                                                  \
  orderwatch::util::LogManager::GetLogger("orders")->error(__VA_ARGS__)
