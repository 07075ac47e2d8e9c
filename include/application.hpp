// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/header_source.hpp"
#include "chain/tip_watcher.hpp"
#include "orders/order_state.hpp"
#include "orders/revalidator.hpp"
#include "orders/state_batcher.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace orderwatch {
namespace app {

// Application configuration
struct AppConfig {
  // Ethereum websocket JSON-RPC endpoint (ws:// or wss://)
  std::string ethereum_url;

  chain::WatcherConfig watcher;
  orders::BatcherConfig batcher;
  orders::ChainInfo chain_info = orders::ChainInfo::Mainnet();

  // Logging
  std::string log_level = "info";
  bool log_to_file = false;
  std::string log_file;
};

// Application - wires the chain tip watcher and, when a contract query is
// supplied, the order revalidation pipeline. Handles signals and shutdown.
class Application {
public:
  explicit Application(const AppConfig &config,
                       orders::OrderBatcher::QueryFn state_query = nullptr);
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Tests inject a scripted source before initialize()
  void set_header_source(std::shared_ptr<chain::HeaderSource> source) {
    header_source_ = std::move(source);
  }

  chain::ChainTipWatcher &watcher() { return *watcher_; }
  orders::Revalidator *revalidator() { return revalidator_.get(); }

  bool is_running() const { return running_; }
  // Set when the watcher exhausted its retries
  bool failed() const { return failed_; }

  void request_shutdown() { shutdown_requested_ = true; }

  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  orders::OrderBatcher::QueryFn state_query_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> failed_{false};

  // Components (initialized in order)
  std::shared_ptr<chain::HeaderSource> header_source_;
  std::unique_ptr<chain::ChainTipWatcher> watcher_;
  std::unique_ptr<orders::OrderBatcher> batcher_;
  std::unique_ptr<orders::Revalidator> revalidator_;

  // Logs every chain event
  std::unique_ptr<std::thread> event_log_thread_;

  bool init_source();
  bool init_orders();
  void event_log_loop(chain::EventReceiver receiver);

  void shutdown();

  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace orderwatch
