// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// In-memory header source for chain tip watcher tests

#pragma once

#include "chain/block_header.hpp"
#include "chain/chain_event.hpp"
#include "chain/header_source.hpp"
#include "chain/tip_watcher.hpp"
#include "chain/watcher_error.hpp"
#include "util/broadcast_channel.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace orderwatch {
namespace test {

using namespace std::chrono_literals;

/**
 * ScriptedHeaderSource - a block tree plus a movable tip
 *
 * Tests build branches with Extend(), move the tip with Announce() (pushed
 * to every live subscription) or SetTip() (visible to polling only), and
 * inject failures. All methods are thread-safe.
 */
class ScriptedHeaderSource : public chain::HeaderSource {
public:
    class Connection : public chain::HeaderConnection {
    public:
        Connection(ScriptedHeaderSource* source, int id) : source_(source), id_(id) {}

        void Subscribe(chain::HeaderCallback on_header,
                       chain::ClosedCallback on_closed) override {
            std::lock_guard<std::mutex> lock(mutex_);
            on_header_ = std::move(on_header);
            on_closed_ = std::move(on_closed);
        }

        chain::BlockHeader FetchHeader(const chain::BlockId& id,
                                       std::chrono::milliseconds timeout) override {
            if (closed_) {
                throw chain::WatcherError(chain::WatcherErrorCode::kTransport, "closed");
            }
            return source_->Fetch(id, timeout);
        }

        void Close() override { closed_ = true; }

        std::string Describe() const override {
            return "scripted connection " + std::to_string(id_);
        }

        bool closed() const { return closed_; }

        // Returns false if nothing is subscribed or the connection is closed
        bool Push(const chain::BlockHeader& header) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || !on_header_) {
                return false;
            }
            on_header_(header);
            return true;
        }

        bool EndSubscription(const chain::WatcherError& error) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || !on_closed_ || ended_) {
                return false;
            }
            ended_ = true;
            on_closed_(error);
            return true;
        }

        bool subscribed() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<bool>(on_header_) && !closed_ && !ended_;
        }

    private:
        ScriptedHeaderSource* source_;
        const int id_;
        mutable std::mutex mutex_;
        chain::HeaderCallback on_header_;
        chain::ClosedCallback on_closed_;
        std::atomic<bool> closed_{false};
        bool ended_{false};
    };

    // Genesis-like root at `start_number`
    static std::shared_ptr<ScriptedHeaderSource> Create(uint64_t start_number = 100) {
        auto source = std::shared_ptr<ScriptedHeaderSource>(new ScriptedHeaderSource());
        chain::BlockHeader root = source->MakeHeader(start_number, uint256());
        source->Store(root);
        source->tip_ = root;
        return source;
    }

    // New child of `parent` (stored, not announced)
    chain::BlockHeader Extend(const chain::BlockHeader& parent) {
        chain::BlockHeader child = MakeHeader(parent.number + 1, parent.hash);
        Store(child);
        return child;
    }

    // `count` successive children of `parent`; returns the last
    chain::BlockHeader ExtendBy(const chain::BlockHeader& parent, size_t count) {
        chain::BlockHeader h = parent;
        for (size_t i = 0; i < count; ++i) {
            h = Extend(h);
        }
        return h;
    }

    // Ancestor of `header` `depth` blocks back
    chain::BlockHeader Ancestor(const chain::BlockHeader& header, size_t depth) const {
        std::lock_guard<std::mutex> lock(mutex_);
        chain::BlockHeader h = header;
        for (size_t i = 0; i < depth; ++i) {
            h = blocks_.at(h.parent_hash);
        }
        return h;
    }

    // Make `header` the tip and push it to live subscriptions
    void Announce(const chain::BlockHeader& header) {
        SetTip(header);
        for (auto& conn : Connections()) {
            conn->Push(header);
        }
    }

    // Push without moving the tip (stale or duplicate notifications)
    void PushOnly(const chain::BlockHeader& header) {
        for (auto& conn : Connections()) {
            conn->Push(header);
        }
    }

    // Move the tip silently (seen by polling)
    void SetTip(const chain::BlockHeader& header) {
        std::lock_guard<std::mutex> lock(mutex_);
        tip_ = header;
    }

    chain::BlockHeader tip() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tip_;
    }

    // End every live subscription with `error`
    void EndSubscriptions(chain::WatcherErrorCode code) {
        for (auto& conn : Connections()) {
            conn->EndSubscription(chain::WatcherError(code, "scripted"));
        }
    }

    // Fetching `requested` by hash returns `served` instead (a lying node)
    void SetFetchSubstitute(const uint256& requested, const chain::BlockHeader& served) {
        std::lock_guard<std::mutex> lock(mutex_);
        substitutes_[requested] = served;
    }

    void ClearFetchSubstitutes() {
        std::lock_guard<std::mutex> lock(mutex_);
        substitutes_.clear();
    }

    void SetConnectFailures(int count) { connect_failures_ = count; }
    void SetFetchFailures(bool fail) { fetch_failures_ = fail; }

    int connect_calls() const { return connect_calls_; }

    size_t live_subscriptions() const {
        size_t n = 0;
        for (auto& conn : Connections()) {
            if (conn->subscribed()) {
                ++n;
            }
        }
        return n;
    }

    chain::HeaderConnectionPtr Connect(std::chrono::milliseconds) override {
        const int id = ++connect_calls_;
        if (connect_failures_ != 0) {
            if (connect_failures_ > 0) {
                --connect_failures_;
            }
            throw chain::WatcherError(chain::WatcherErrorCode::kTransport,
                                      "scripted connect failure");
        }
        auto conn = std::make_shared<Connection>(this, id);
        std::lock_guard<std::mutex> lock(mutex_);
        connections_.push_back(conn);
        return conn;
    }

    // Canonical chain ending at `tip`, oldest first, down to `from_number`
    std::vector<chain::BlockHeader> ChainTo(const chain::BlockHeader& tip,
                                            uint64_t from_number) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<chain::BlockHeader> out;
        chain::BlockHeader h = tip;
        while (true) {
            out.push_back(h);
            if (h.number <= from_number) {
                break;
            }
            h = blocks_.at(h.parent_hash);
        }
        return {out.rbegin(), out.rend()};
    }

private:
    ScriptedHeaderSource() = default;

    chain::BlockHeader MakeHeader(uint64_t number, const uint256& parent) {
        chain::BlockHeader h;
        h.number = number;
        h.parent_hash = parent;
        const uint64_t salt = ++salt_;
        for (int i = 0; i < 8; ++i) {
            h.hash.data()[i] = static_cast<uint8_t>(number >> (56 - 8 * i));
            h.hash.data()[8 + i] = static_cast<uint8_t>(salt >> (56 - 8 * i));
        }
        h.hash.data()[31] = 0x5c;
        h.timestamp = 1700000000 + number * 12;
        h.gas_limit = 30000000;
        return h;
    }

    void Store(const chain::BlockHeader& header) {
        std::lock_guard<std::mutex> lock(mutex_);
        blocks_[header.hash] = header;
    }

    chain::BlockHeader Fetch(const chain::BlockId& id, std::chrono::milliseconds) {
        if (fetch_failures_) {
            throw chain::WatcherError(chain::WatcherErrorCode::kTransport,
                                      "scripted fetch failure");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        switch (id.kind()) {
        case chain::BlockId::Kind::kLatest:
            return tip_;
        case chain::BlockId::Kind::kHash: {
            auto substitute = substitutes_.find(id.hash());
            if (substitute != substitutes_.end()) {
                return substitute->second;
            }
            auto it = blocks_.find(id.hash());
            if (it == blocks_.end()) {
                throw chain::WatcherError(chain::WatcherErrorCode::kNotFound, id.ToString());
            }
            return it->second;
        }
        case chain::BlockId::Kind::kNumber: {
            chain::BlockHeader h = tip_;
            while (h.number > id.number()) {
                auto it = blocks_.find(h.parent_hash);
                if (it == blocks_.end()) {
                    break;
                }
                h = it->second;
            }
            if (h.number != id.number()) {
                throw chain::WatcherError(chain::WatcherErrorCode::kNotFound, id.ToString());
            }
            return h;
        }
        }
        throw chain::WatcherError(chain::WatcherErrorCode::kNotFound, id.ToString());
    }

    std::vector<std::shared_ptr<Connection>> Connections() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_;
    }

    mutable std::mutex mutex_;
    std::map<uint256, chain::BlockHeader> blocks_;
    std::map<uint256, chain::BlockHeader> substitutes_;
    chain::BlockHeader tip_;
    std::vector<std::shared_ptr<Connection>> connections_;
    std::atomic<uint64_t> salt_{0};
    std::atomic<int> connect_calls_{0};
    std::atomic<int> connect_failures_{0};
    std::atomic<bool> fetch_failures_{false};
};

// Poll `pred` until true or `timeout`
inline bool WaitFor(const std::function<bool()>& pred,
                    std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

// Next event or nullopt after `timeout`
inline std::optional<chain::ChainEvent> NextEvent(chain::EventReceiver& rx,
                                                  std::chrono::milliseconds timeout = 5s) {
    auto result = rx.Recv(timeout);
    if (result.status != util::RecvStatus::kOk) {
        return std::nullopt;
    }
    return result.value;
}

// Fast watcher settings for tests
inline chain::WatcherConfig TestWatcherConfig() {
    chain::WatcherConfig config;
    config.poll_delay = 2s;
    config.fetch_timeout = 500ms;
    config.connect_timeout = 500ms;
    config.max_reorg_depth = 5;
    config.max_retries = 3;
    config.retry_delay = 10ms;
    config.event_capacity = 64;
    return config;
}

} // namespace test
} // namespace orderwatch
