// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/tip_watcher.hpp"
#include "chain/watcher_error.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <deque>
#include <exception>
#include <fmt/format.h>
#include <stdexcept>
#include <vector>

namespace orderwatch {
namespace chain {

namespace {

// Subscription headers buffered between two fetch loop iterations
constexpr size_t kInboxCapacity = 64;

// Extra wait on top of fetch_timeout for a poll result to arrive
constexpr std::chrono::milliseconds kPollGrace{500};

BlockHeader FetchLogged(HeaderConnection &conn, const BlockId &id,
                        std::chrono::milliseconds timeout) {
  BlockHeader header = conn.FetchHeader(id, timeout);
  LOG_CHAIN_TRACE("Fetched header {} for {}", header.ToString(), id.ToString());
  return header;
}

} // namespace

/**
 * HeaderInbox - merges the two header producers of one connection
 *
 * The push subscription appends headers (and finally its closure). A poll
 * started by the fetch loop delivers one result tagged with its race id;
 * results of a race that already ended are discarded. Pop() prefers
 * subscription headers over a poll result, and reports closure only once
 * every buffered header was consumed.
 */
class HeaderInbox {
public:
  enum class Kind { kHeader, kPolled, kFailed };

  struct Item {
    Kind kind;
    BlockHeader header;
    std::exception_ptr error;
  };

  explicit HeaderInbox(size_t capacity) : capacity_(capacity) {}

  void PushHeader(const BlockHeader &header) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return;
      }
      if (headers_.size() >= capacity_) {
        // Keep the newest; older heads are superseded anyway
        headers_.pop_front();
        LOG_CHAIN_DEBUG("Header inbox full, dropped oldest pending header");
      }
      headers_.push_back(header);
    }
    cv_.notify_all();
  }

  void PushClosed(const WatcherError &error) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return;
      }
      closed_ = std::make_exception_ptr(error);
    }
    cv_.notify_all();
  }

  uint64_t BeginRace() {
    std::lock_guard<std::mutex> lock(mutex_);
    race_ = ++last_race_;
    poll_result_.reset();
    return race_;
  }

  void EndRace() {
    std::lock_guard<std::mutex> lock(mutex_);
    race_ = 0;
    poll_result_.reset();
  }

  void PushPollResult(uint64_t race, const BlockHeader &header) {
    PushPoll(race, Item{Kind::kPolled, header, nullptr});
  }

  void PushPollError(uint64_t race, std::exception_ptr error) {
    PushPoll(race, Item{Kind::kFailed, BlockHeader{}, std::move(error)});
  }

  void Interrupt() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      interrupted_ = true;
    }
    cv_.notify_all();
  }

  // nullopt on deadline or interrupt
  std::optional<Item> Pop(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this] {
      return interrupted_ || !headers_.empty() || poll_result_ || closed_;
    });
    if (interrupted_) {
      return std::nullopt;
    }
    if (!headers_.empty()) {
      Item item{Kind::kHeader, headers_.front(), nullptr};
      headers_.pop_front();
      return item;
    }
    if (poll_result_) {
      Item item = std::move(*poll_result_);
      poll_result_.reset();
      return item;
    }
    if (closed_) {
      return Item{Kind::kFailed, BlockHeader{}, closed_};
    }
    return std::nullopt;
  }

private:
  void PushPoll(uint64_t race, Item item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (race == 0 || race != race_) {
        return; // race already decided
      }
      poll_result_ = std::move(item);
    }
    cv_.notify_all();
  }

  const size_t capacity_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<BlockHeader> headers_;
  std::optional<Item> poll_result_;
  std::exception_ptr closed_;
  uint64_t race_{0};
  uint64_t last_race_{0};
  bool interrupted_{false};
};

ChainTipWatcher::ChainTipWatcher(std::shared_ptr<HeaderSource> source,
                                 WatcherConfig config)
    : source_(std::move(source)), config_(config),
      events_(config.event_capacity == 0 ? 1 : config.event_capacity),
      poll_pool_("chain-poll", 2) {
  if (!source_) {
    throw std::invalid_argument("ChainTipWatcher requires a header source");
  }
  if (config_.event_capacity == 0) {
    throw std::invalid_argument("event_capacity must be at least 1");
  }
  if (config_.max_reorg_depth == 0) {
    throw std::invalid_argument("max_reorg_depth must be at least 1");
  }
  if (config_.poll_delay.count() <= 0 || config_.fetch_timeout.count() <= 0) {
    throw std::invalid_argument("poll_delay and fetch_timeout must be positive");
  }
}

ChainTipWatcher::~ChainTipWatcher() { Stop(); }

void ChainTipWatcher::SetFatalCallback(FatalCallback callback) {
  fatal_callback_ = std::move(callback);
}

EventReceiver ChainTipWatcher::Start() {
  if (started_.exchange(true)) {
    throw std::logic_error("ChainTipWatcher already started");
  }
  EventReceiver receiver = events_.Subscribe();
  running_.store(true, std::memory_order_release);
  thread_ = std::thread(&ChainTipWatcher::Run, this);
  LOG_CHAIN_INFO("Chain tip watcher started (max reorg {}, max retries {})",
                 config_.max_reorg_depth, config_.max_retries);
  return receiver;
}

EventReceiver ChainTipWatcher::Subscribe() { return events_.Subscribe(); }

void ChainTipWatcher::Stop() {
  if (stopping_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (inbox_) {
      inbox_->Interrupt();
    }
    if (connection_) {
      connection_->Close();
    }
  }
  stop_cv_.notify_all();

  if (thread_.joinable()) {
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
    } else {
      thread_.join();
    }
  }
  poll_pool_.shutdown();
  poll_pool_.wait_for_completion();
  events_.Close();
  running_.store(false, std::memory_order_release);
  if (started_.load()) {
    LOG_CHAIN_INFO("Chain tip watcher stopped");
  }
}

std::optional<BlockHeader> ChainTipWatcher::LastAccepted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_snapshot_;
}

WatcherStats ChainTipWatcher::GetStats() const {
  WatcherStats stats;
  stats.connection_attempts = connection_attempts_.load();
  stats.headers_received = headers_received_.load();
  stats.headers_accepted = headers_accepted_.load();
  stats.stale_headers = stale_headers_.load();
  stats.reorgs_detected = reorgs_detected_.load();
  stats.blocks_rewound = blocks_rewound_.load();
  return stats;
}

void ChainTipWatcher::Run() {
  uint32_t retries = 0;
  while (!stopping()) {
    const uint64_t accepted_before = headers_accepted_.load();
    std::string error;
    try {
      RunConnection();
      break; // only returns normally on shutdown
    } catch (const WatcherError &e) {
      error = e.what();
    } catch (const std::exception &e) {
      error = fmt::format("unexpected error: {}", e.what());
    }
    if (stopping()) {
      break;
    }
    LOG_CHAIN_WARN("Header connection failed: {}", error);

    // An accepted header since the last connect resets the budget
    if (headers_accepted_.load() != accepted_before) {
      retries = 0;
    }

    if (retries > config_.max_retries) {
      failed_.store(true, std::memory_order_release);
      LOG_CHAIN_ERROR("Maximum retries exceeded, chain tip watcher exiting: {}",
                      error);
      events_.Close();
      running_.store(false, std::memory_order_release);
      if (fatal_callback_) {
        fatal_callback_("Maximum retries exceeded: " + error);
      }
      return;
    }

    if (!SleepUnlessStopped(config_.retry_delay)) {
      break;
    }
    ++retries;
  }
  running_.store(false, std::memory_order_release);
}

void ChainTipWatcher::RunConnection() {
  const uint64_t attempt = ++connection_attempts_;
  LOG_CHAIN_DEBUG("Connecting to header source (attempt {})", attempt);
  HeaderConnectionPtr conn = source_->Connect(config_.connect_timeout);
  auto inbox = std::make_shared<HeaderInbox>(kInboxCapacity);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping()) {
      conn->Close();
      return;
    }
    connection_ = conn;
    inbox_ = inbox;
  }

  // Detach and close on every exit path
  struct Detach {
    ChainTipWatcher *self;
    HeaderConnectionPtr conn;
    ~Detach() {
      conn->Close();
      std::lock_guard<std::mutex> lock(self->mutex_);
      self->connection_.reset();
      self->inbox_.reset();
    }
  } detach{this, conn};

  conn->Subscribe(
      [inbox](const BlockHeader &header) { inbox->PushHeader(header); },
      [inbox](const WatcherError &error) { inbox->PushClosed(error); });
  LOG_CHAIN_INFO("Connected to {}", conn->Describe());

  if (!last_) {
    BlockHeader latest =
        FetchLogged(*conn, BlockId::Latest(), config_.fetch_timeout);
    ++headers_received_;
    LOG_CHAIN_INFO("Initial chain tip {}", latest.ToString());
    Publish(HeaderAccepted{latest});
    ++headers_accepted_;
    SetLast(latest);
  }

  while (!stopping()) {
    std::optional<BlockHeader> header = NextHeader(conn, inbox);
    if (!header) {
      return;
    }
    ++headers_received_;

    if (header->number <= last_->number) {
      ++stale_headers_;
      LOG_CHAIN_DEBUG("Header {} is not on the longest known chain, ignoring",
                      header->number);
      continue;
    }

    LOG_CHAIN_DEBUG("Received header {} {} (age {}s)", header->number,
                    header->hash.ToShortString(),
                    util::AgeSeconds(static_cast<int64_t>(header->timestamp)));
    SendWithReorgs(*conn, *header);
  }
}

std::optional<BlockHeader>
ChainTipWatcher::NextHeader(const HeaderConnectionPtr &conn,
                            const std::shared_ptr<HeaderInbox> &inbox) {
  std::optional<HeaderInbox::Item> item =
      inbox->Pop(std::chrono::steady_clock::now() + config_.poll_delay);

  if (!item) {
    if (stopping()) {
      return std::nullopt;
    }
    // Subscription is quiet: race it against a fetch of the latest header.
    // The fetch also proves the connection still works.
    const uint64_t race = inbox->BeginRace();
    const auto timeout = config_.fetch_timeout;
    poll_pool_.post([conn, target = inbox, race, timeout] {
      try {
        target->PushPollResult(race, conn->FetchHeader(BlockId::Latest(),
                                                       timeout));
      } catch (...) {
        target->PushPollError(race, std::current_exception());
      }
    });

    item = inbox->Pop(std::chrono::steady_clock::now() + timeout + kPollGrace);
    inbox->EndRace();
    if (!item) {
      if (stopping()) {
        return std::nullopt;
      }
      throw WatcherError(WatcherErrorCode::kTimeout,
                         "poll for the latest header did not complete");
    }
  }

  if (item->kind == HeaderInbox::Kind::kFailed) {
    std::rethrow_exception(item->error);
  }
  return item->header;
}

void ChainTipWatcher::SendWithReorgs(HeaderConnection &conn,
                                     const BlockHeader &latest) {
  BlockHeader base = *last_;
  std::vector<BlockHeader> pending{latest}; // newest first
  size_t rewound = 0;

  while (true) {
    if (pending.size() > config_.max_reorg_depth + 1) {
      throw WatcherError(
          WatcherErrorCode::kReorgOverflow,
          fmt::format("no common ancestor within {} blocks of {}",
                      config_.max_reorg_depth, latest.number));
    }
    const uint64_t tip_number = pending.back().number;
    const uint256 tip_parent = pending.back().parent_hash;

    if (tip_number == base.number + 1) {
      if (tip_parent == base.hash) {
        break;
      }
      // Accepted block at this height was replaced
      ++rewound;
      LOG_CHAIN_INFO("Reorg detected at height {}, rewinding", base.number);
      base = FetchLogged(conn, BlockId::Hash(base.parent_hash),
                         config_.fetch_timeout);
    }

    pending.push_back(
        FetchLogged(conn, BlockId::Hash(tip_parent), config_.fetch_timeout));
  }

  if (rewound > 0) {
    ++reorgs_detected_;
    blocks_rewound_ += rewound;
    LOG_CHAIN_INFO("Reorg of depth {} resolved, restarting at height {}",
                   rewound, base.number + 1);
    Publish(ReorgDetected{base.number + 1});
    SetLast(base);
  }

  for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
    if (it->number != last_->number + 1) {
      throw WatcherError(WatcherErrorCode::kInsaneNumber,
                         fmt::format("expected {} got {}", last_->number + 1,
                                     it->number));
    }
    if (it->parent_hash != last_->hash) {
      throw WatcherError(WatcherErrorCode::kInsaneParentHash,
                         fmt::format("block {} parent {} expected {}",
                                     it->number, it->parent_hash.GetHex(),
                                     last_->hash.GetHex()));
    }
    Publish(HeaderAccepted{*it});
    ++headers_accepted_;
    SetLast(*it);
  }
}

void ChainTipWatcher::Publish(ChainEvent event) {
  LOG_CHAIN_TRACE("Publishing {}", DescribeEvent(event));
  if (!events_.Send(std::move(event))) {
    LOG_CHAIN_DEBUG("Event channel closed, event dropped");
  }
}

void ChainTipWatcher::SetLast(const BlockHeader &header) {
  last_ = header;
  std::lock_guard<std::mutex> lock(mutex_);
  last_snapshot_ = header;
}

bool ChainTipWatcher::SleepUnlessStopped(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(mutex_);
  stop_cv_.wait_for(lock, delay, [this] { return stopping(); });
  return !stopping();
}

} // namespace chain
} // namespace orderwatch
