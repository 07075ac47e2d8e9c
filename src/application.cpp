// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "rpc/ws_header_source.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <unistd.h> // For write(), STDOUT_FILENO (async-signal-safe)

namespace orderwatch {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config,
                         orders::OrderBatcher::QueryFn state_query)
    : config_(config), state_query_(std::move(state_query)) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  std::cout << GetStartupBanner(config_.ethereum_url) << std::flush;

  LOG_INFO("Initializing orderwatch...");

  if (!init_source()) {
    LOG_ERROR("Failed to initialize header source");
    return false;
  }

  try {
    watcher_ = std::make_unique<chain::ChainTipWatcher>(header_source_,
                                                        config_.watcher);
  } catch (const std::invalid_argument &e) {
    LOG_ERROR("Invalid watcher configuration: {}", e.what());
    return false;
  }
  watcher_->SetFatalCallback([this](const std::string &reason) {
    LOG_ERROR("Application: chain tip watcher gave up ({}). Shutting down.",
              reason);
    failed_ = true;
    request_shutdown();
  });

  if (!init_orders()) {
    LOG_ERROR("Failed to initialize order revalidation");
    return false;
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::init_source() {
  if (header_source_) {
    return true;
  }
  if (config_.ethereum_url.empty()) {
    LOG_ERROR("No Ethereum endpoint configured (use --ethereum= or set "
              "ETHEREUM)");
    return false;
  }
  try {
    header_source_ = std::make_shared<rpc::WsHeaderSource>(config_.ethereum_url);
  } catch (const std::invalid_argument &e) {
    LOG_ERROR("Invalid Ethereum endpoint '{}': {}", config_.ethereum_url,
              e.what());
    return false;
  }
  return true;
}

bool Application::init_orders() {
  if (!state_query_) {
    LOG_INFO("No contract query configured, order revalidation disabled");
    return true;
  }
  try {
    batcher_ = std::make_unique<orders::OrderBatcher>(state_query_,
                                                      config_.batcher);
  } catch (const std::invalid_argument &e) {
    LOG_ERROR("Invalid batcher configuration: {}", e.what());
    return false;
  }
  revalidator_ =
      std::make_unique<orders::Revalidator>(*batcher_, config_.chain_info);
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }
  if (!watcher_) {
    LOG_ERROR("Application not initialized");
    return false;
  }

  LOG_INFO("Starting orderwatch...");

  setup_signal_handlers();

  if (batcher_) {
    batcher_->Start();
  }

  chain::EventReceiver log_receiver = watcher_->Start();
  if (revalidator_) {
    revalidator_->Start(watcher_->Subscribe());
  }
  event_log_thread_ = std::make_unique<std::thread>(
      &Application::event_log_loop, this, std::move(log_receiver));

  running_ = true;
  LOG_INFO("orderwatch started, following {}", config_.ethereum_url);
  LOG_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::event_log_loop(chain::EventReceiver receiver) {
  while (true) {
    auto result = receiver.Recv(std::chrono::milliseconds(500));
    if (result.missed > 0) {
      LOG_WARN("Event log fell behind, {} chain events skipped",
               result.missed);
    }
    if (result.status == util::RecvStatus::kClosed) {
      break;
    }
    if (result.status == util::RecvStatus::kOk) {
      LOG_INFO("{}", chain::DescribeEvent(*result.value));
    }
  }
  LOG_DEBUG("Chain event stream closed");
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }
  LOG_INFO("Shutting down orderwatch...");
  running_ = false;

  // Closing the watcher closes the event channel, which ends both consumers
  if (watcher_) {
    LOG_INFO("Stopping chain tip watcher...");
    watcher_->Stop();
  }
  if (revalidator_) {
    LOG_INFO("Stopping revalidator...");
    revalidator_->Stop();
  }
  if (batcher_) {
    LOG_INFO("Stopping state batcher...");
    batcher_->Stop();
  }
  if (event_log_thread_ && event_log_thread_->joinable()) {
    event_log_thread_->join();
    event_log_thread_.reset();
  }

  LOG_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t written = write(STDOUT_FILENO, msg, 17);
    (void)written;
    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace orderwatch
