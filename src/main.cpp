// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Provider:\n"
      << "  --ethereum=<url>     Websocket JSON-RPC endpoint (ws:// or wss://)\n"
      << "                       Default: $ETHEREUM\n"
      << "\n"
      << "Chain tip watcher:\n"
      << "  --maxreorg=<n>       Deepest reorg that is resolved (default: 10)\n"
      << "  --maxretries=<n>     Reconnects without progress before giving up\n"
      << "                       (default: 10)\n"
      << "  --polldelay=<ms>     Poll the latest header after this much silence\n"
      << "                       (default: 5000)\n"
      << "  --fetchtimeout=<ms>  Bound on every header fetch (default: 5000)\n"
      << "\n"
      << "State batcher:\n"
      << "  --batchsize=<n>      Most orders per contract call (default: 512)\n"
      << "  --concurrent=<n>     Most contract calls in flight (default: 16)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: chain, rpc, orders, all\n"
      << "                       Can be comma-separated: --debug=chain,rpc\n"
      << "  --logfile=<path>     Log to a rotating file instead of the console\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

// Parse "<prefix><n>" into [min, max], printing an error on failure
std::optional<int64_t> parse_bounded(const std::string &arg, size_t prefix_len,
                                     const char *what, int64_t min,
                                     int64_t max) {
  auto value = orderwatch::util::SafeParseInt64(arg.substr(prefix_len), min, max);
  if (!value) {
    std::cerr << "Error: Invalid " << what << ": " << arg.substr(prefix_len)
              << std::endl;
    std::cerr << "Must be a number between " << min << " and " << max
              << std::endl;
  }
  return value;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    orderwatch::app::AppConfig config;
    std::string debug_categories;

    if (const char *env = std::getenv("ETHEREUM")) {
      config.ethereum_url = env;
    }

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << orderwatch::GetFullVersionString() << std::endl;
        std::cout << orderwatch::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--ethereum=") == 0) {
        config.ethereum_url = arg.substr(11);
      } else if (arg.find("--maxreorg=") == 0) {
        auto v = parse_bounded(arg, 11, "max reorg depth", 1, 1000);
        if (!v) {
          return 1;
        }
        config.watcher.max_reorg_depth = static_cast<size_t>(*v);
        config.chain_info.max_reorg = static_cast<size_t>(*v);
      } else if (arg.find("--maxretries=") == 0) {
        auto v = parse_bounded(arg, 13, "max retries", 0, 1000000);
        if (!v) {
          return 1;
        }
        config.watcher.max_retries = static_cast<uint32_t>(*v);
      } else if (arg.find("--polldelay=") == 0) {
        auto v = parse_bounded(arg, 12, "poll delay", 1, 3600000);
        if (!v) {
          return 1;
        }
        config.watcher.poll_delay = std::chrono::milliseconds(*v);
      } else if (arg.find("--fetchtimeout=") == 0) {
        auto v = parse_bounded(arg, 15, "fetch timeout", 1, 3600000);
        if (!v) {
          return 1;
        }
        config.watcher.fetch_timeout = std::chrono::milliseconds(*v);
      } else if (arg.find("--batchsize=") == 0) {
        auto v = parse_bounded(arg, 12, "batch size", 1, 100000);
        if (!v) {
          return 1;
        }
        config.batcher.batch_size = static_cast<size_t>(*v);
      } else if (arg.find("--concurrent=") == 0) {
        auto v = parse_bounded(arg, 13, "concurrency", 1, 1024);
        if (!v) {
          return 1;
        }
        config.batcher.max_concurrent = static_cast<size_t>(*v);
      } else if (arg.find("--loglevel=") == 0) {
        config.log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        config.log_to_file = true;
        config.log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        debug_categories = arg.substr(8);
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    orderwatch::util::LogManager::Initialize(config.log_level,
                                             config.log_to_file,
                                             config.log_file);

    for (const auto &name :
         orderwatch::util::LogManager::EnableDebug(debug_categories)) {
      LOG_WARN("Ignoring unknown debug category '{}'", name);
    }

    bool failed = false;
    // Nested scope: the app must be destroyed before LogManager::Shutdown()
    {
      orderwatch::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        orderwatch::util::LogManager::Shutdown();
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        orderwatch::util::LogManager::Shutdown();
        return 1;
      }

      app.wait_for_shutdown();
      failed = app.failed();
    }

    orderwatch::util::LogManager::Shutdown();
    return failed ? 2 : 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    orderwatch::util::LogManager::Shutdown();
    return 1;
  }
}
