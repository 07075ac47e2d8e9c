// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// State batcher: dedup, lanes, corking, bounded concurrency and fan-out

#include "orders/state_batcher.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <latch>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace orderwatch::orders;
using namespace std::chrono_literals;

namespace {

using IntBatcher = StateBatcher<int, int>;

// Contract stand-in: state of item x is 10 * x. Records every call.
class FakeQuery {
public:
    std::vector<int> operator()(const std::vector<int>& items) {
        const int now = ++in_flight_;
        int peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(items);
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        --in_flight_;
        if (fail_) {
            throw std::runtime_error("rpc down");
        }
        std::vector<int> out;
        for (int item : items) {
            out.push_back(item * 10);
        }
        if (short_by_one_ && !out.empty()) {
            out.pop_back();
        }
        return out;
    }

    std::vector<std::vector<int>> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::chrono::milliseconds delay_{0};
    bool fail_{false};
    bool short_by_one_{false};
    std::atomic<int> peak_{0};

private:
    mutable std::mutex mutex_;
    std::vector<std::vector<int>> calls_;
    std::atomic<int> in_flight_{0};
};

IntBatcher::QueryFn Bind(const std::shared_ptr<FakeQuery>& query) {
    return [query](const std::vector<int>& items) { return (*query)(items); };
}

BatcherConfig Config(size_t batch_size, size_t concurrent,
                     std::chrono::milliseconds priority_cork,
                     std::chrono::milliseconds normal_cork) {
    BatcherConfig config;
    config.batch_size = batch_size;
    config.max_concurrent = concurrent;
    config.priority_cork = priority_cork;
    config.normal_cork = normal_cork;
    return config;
}

BatchErrorCode ErrorCodeOf(std::future<int>& future) {
    try {
        future.get();
    } catch (const BatchError& e) {
        return e.code();
    }
    FAIL("future did not fail with a BatchError");
    return BatchErrorCode::kCallFailed;
}

bool Ready(std::future<int>& future, std::chrono::milliseconds timeout = 2s) {
    return future.wait_for(timeout) == std::future_status::ready;
}

} // namespace

TEST_CASE("StateBatcher: concurrent duplicate requests share one query item", "[orders][batcher]") {
    auto query = std::make_shared<FakeQuery>();
    IntBatcher batcher(Bind(query), Config(512, 4, 5ms, 300ms));
    batcher.Start();

    constexpr int kCallers = 20;
    std::vector<int> results(kCallers, -1);
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&, i] { results[i] = batcher.FetchState(7, false).get(); });
    }
    for (auto& t : callers) {
        t.join();
    }

    for (int r : results) {
        REQUIRE(r == 70);
    }
    auto calls = query->calls();
    REQUIRE(calls.size() == 1);
    REQUIRE(calls[0] == std::vector<int>{7});

    auto stats = batcher.GetStats();
    REQUIRE(stats.queued_normal == 1);
    REQUIRE(stats.merged == kCallers - 1);
    REQUIRE(stats.items_called == 1);
    batcher.Stop();
}

TEST_CASE("StateBatcher: normal cork coalesces a burst into one call", "[orders][batcher]") {
    auto query = std::make_shared<FakeQuery>();
    IntBatcher batcher(Bind(query), Config(512, 4, 5ms, 200ms));
    batcher.Start();

    std::vector<std::future<int>> futures;
    for (int i = 1; i <= 10; ++i) {
        futures.push_back(batcher.FetchState(i, false));
    }
    for (int i = 0; i < 10; ++i) {
        REQUIRE(futures[i].get() == (i + 1) * 10);
    }

    auto calls = query->calls();
    REQUIRE(calls.size() == 1);
    // FIFO within the lane
    REQUIRE(calls[0] == std::vector<int>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10});
    batcher.Stop();
}

TEST_CASE("StateBatcher: priority requests are not held by the normal cork", "[orders][batcher]") {
    auto query = std::make_shared<FakeQuery>();
    IntBatcher batcher(Bind(query), Config(512, 4, 5ms, 10s));
    batcher.Start();

    auto normal = batcher.FetchState(2, false);
    const auto start = std::chrono::steady_clock::now();
    auto urgent = batcher.FetchState(1, true);

    REQUIRE(Ready(urgent));
    REQUIRE(std::chrono::steady_clock::now() - start < 2s);
    REQUIRE(urgent.get() == 10);

    // The queued normal job rides along, after the priority one
    REQUIRE(Ready(normal, 100ms));
    REQUIRE(normal.get() == 20);
    auto calls = query->calls();
    REQUIRE(calls.size() == 1);
    REQUIRE(calls[0] == std::vector<int>{1, 2});
    batcher.Stop();
}

TEST_CASE("StateBatcher: simultaneous priority callers share one single-item call", "[orders][batcher]") {
    auto query = std::make_shared<FakeQuery>();
    IntBatcher batcher(Bind(query), Config(512, 4, 50ms, 10s));
    batcher.Start();

    constexpr int kCallers = 20;
    std::latch go(kCallers);
    std::vector<int> results(kCallers, -1);
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&, i] {
            go.arrive_and_wait();
            results[i] = batcher.FetchState(7, true).get();
        });
    }
    for (auto& t : callers) {
        t.join();
    }

    REQUIRE(std::all_of(results.begin(), results.end(), [](int r) { return r == 70; }));
    auto calls = query->calls();
    REQUIRE(calls.size() == 1);
    REQUIRE(calls[0] == std::vector<int>{7});

    auto stats = batcher.GetStats();
    REQUIRE(stats.queued_priority == 1);
    REQUIRE(stats.queued_normal == 0);
    REQUIRE(stats.merged == kCallers - 1);
    batcher.Stop();
}

TEST_CASE("StateBatcher: priority latency holds under sustained normal traffic", "[orders][batcher]") {
    constexpr auto kPriorityCork = 5ms;
    constexpr auto kTolerance = 100ms;
    auto query = std::make_shared<FakeQuery>();
    IntBatcher batcher(Bind(query), Config(64, 4, kPriorityCork, 10s));
    batcher.Start();

    std::atomic<bool> feeding{true};
    std::vector<std::thread> feeders;
    for (int f = 0; f < 4; ++f) {
        feeders.emplace_back([&, f] {
            int next = 1'000 + f * 1'000'000;
            while (feeding) {
                // Nobody waits on these; dropped futures are skipped
                (void)batcher.FetchState(next++, false);
                std::this_thread::sleep_for(50us);
            }
        });
    }
    // Let the normal lane fill up first
    std::this_thread::sleep_for(20ms);

    std::chrono::steady_clock::duration worst{0};
    for (int i = 1; i <= 20; ++i) {
        const auto start = std::chrono::steady_clock::now();
        auto urgent = batcher.FetchState(i, true);
        REQUIRE(Ready(urgent));
        worst = std::max(worst, std::chrono::steady_clock::now() - start);
        REQUIRE(urgent.get() == i * 10);
    }

    feeding = false;
    for (auto& t : feeders) {
        t.join();
    }
    REQUIRE(worst < kPriorityCork + kTolerance);
    REQUIRE(batcher.GetStats().queued_normal > 0);
    batcher.Stop();
}

TEST_CASE("StateBatcher: a promoted job keeps its waiters", "[orders][batcher]") {
    auto query = std::make_shared<FakeQuery>();
    IntBatcher batcher(Bind(query), Config(512, 4, 5ms, 10s));
    batcher.Start();

    auto first = batcher.FetchState(5, false);
    auto second = batcher.FetchState(5, true);

    REQUIRE(Ready(first));
    REQUIRE(Ready(second));
    REQUIRE(first.get() == 50);
    REQUIRE(second.get() == 50);

    auto stats = batcher.GetStats();
    REQUIRE(stats.promoted == 1);
    REQUIRE(stats.merged == 1);
    REQUIRE(stats.calls_issued == 1);
    REQUIRE(query->calls()[0] == std::vector<int>{5});
    batcher.Stop();
}

TEST_CASE("StateBatcher: a full lane dispatches immediately in bounded batches", "[orders][batcher]") {
    auto query = std::make_shared<FakeQuery>();
    IntBatcher batcher(Bind(query), Config(4, 4, 10s, 10s));
    batcher.Start();

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(batcher.FetchState(i, false));
    }

    // Two full batches go out, the remaining two wait for a cork
    for (int i = 0; i < 8; ++i) {
        REQUIRE(Ready(futures[i]));
        REQUIRE(futures[i].get() == i * 10);
    }
    REQUIRE(batcher.queued() == 2);
    for (const auto& call : query->calls()) {
        REQUIRE(call.size() == 4);
    }

    batcher.Stop();
    REQUIRE(ErrorCodeOf(futures[8]) == BatchErrorCode::kUnavailable);
    REQUIRE(ErrorCodeOf(futures[9]) == BatchErrorCode::kUnavailable);
}

TEST_CASE("StateBatcher: in-flight calls never exceed the limit", "[orders][batcher]") {
    auto query = std::make_shared<FakeQuery>();
    query->delay_ = 30ms;
    IntBatcher batcher(Bind(query), Config(1, 2, 1ms, 1ms));
    batcher.Start();

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(batcher.FetchState(i, i % 2 == 0));
    }
    for (int i = 0; i < 10; ++i) {
        REQUIRE(futures[i].get() == i * 10);
    }

    REQUIRE(query->peak_ <= 2);
    auto stats = batcher.GetStats();
    REQUIRE(stats.peak_in_flight <= 2);
    REQUIRE(stats.calls_issued == 10);
    REQUIRE(stats.calls_completed == 10);
    REQUIRE(stats.in_flight == 0);
    batcher.Stop();
}

TEST_CASE("StateBatcher: a failed call reaches every waiter of the batch", "[orders][batcher]") {
    auto query = std::make_shared<FakeQuery>();
    query->fail_ = true;
    IntBatcher batcher(Bind(query), Config(512, 4, 5ms, 50ms));
    batcher.Start();

    auto a = batcher.FetchState(1, false);
    auto a_again = batcher.FetchState(1, false);
    auto b = batcher.FetchState(2, false);

    for (auto* f : {&a, &a_again, &b}) {
        try {
            f->get();
            FAIL("expected a BatchError");
        } catch (const BatchError& e) {
            REQUIRE(e.code() == BatchErrorCode::kCallFailed);
            REQUIRE(std::string(e.what()).find("rpc down") != std::string::npos);
        }
    }
    REQUIRE(batcher.GetStats().calls_failed == 1);

    // Not retried by the batcher; a new request makes a new call
    query->fail_ = false;
    auto retry = batcher.FetchState(1, true);
    REQUIRE(retry.get() == 10);
    REQUIRE(query->calls().size() == 2);
    batcher.Stop();
}

TEST_CASE("StateBatcher: a result count mismatch is a protocol error", "[orders][batcher]") {
    auto query = std::make_shared<FakeQuery>();
    query->short_by_one_ = true;
    IntBatcher batcher(Bind(query), Config(512, 4, 5ms, 50ms));
    batcher.Start();

    auto a = batcher.FetchState(1, false);
    auto b = batcher.FetchState(2, false);
    REQUIRE(ErrorCodeOf(a) == BatchErrorCode::kInvalidOutputLength);
    REQUIRE(ErrorCodeOf(b) == BatchErrorCode::kInvalidOutputLength);
    batcher.Stop();
}

TEST_CASE("StateBatcher: dropped callers are skipped silently", "[orders][batcher]") {
    auto query = std::make_shared<FakeQuery>();
    IntBatcher batcher(Bind(query), Config(512, 4, 5ms, 50ms));
    batcher.Start();

    {
        auto abandoned = batcher.FetchState(3, false);
    }
    auto kept = batcher.FetchState(4, false);
    REQUIRE(kept.get() == 40);
    REQUIRE(query->calls()[0] == std::vector<int>{3, 4});
    batcher.Stop();
}

TEST_CASE("StateBatcher: lifecycle and configuration", "[orders][batcher]") {
    auto query = std::make_shared<FakeQuery>();

    SECTION("Requests after Stop fail as unavailable") {
        IntBatcher batcher(Bind(query), Config(512, 4, 5ms, 50ms));
        batcher.Start();
        batcher.Stop();
        batcher.Stop();
        auto f = batcher.FetchState(1, true);
        REQUIRE(ErrorCodeOf(f) == BatchErrorCode::kUnavailable);
        REQUIRE(query->calls().empty());
    }

    SECTION("Requests made before Start wait for the dispatcher") {
        IntBatcher batcher(Bind(query), Config(512, 4, 5ms, 5ms));
        auto f = batcher.FetchState(6, true);
        REQUIRE(f.wait_for(50ms) == std::future_status::timeout);
        batcher.Start();
        REQUIRE(Ready(f));
        REQUIRE(f.get() == 60);
        batcher.Stop();
    }

    SECTION("Unusable configuration is rejected") {
        REQUIRE_THROWS_AS(IntBatcher(Bind(query), Config(0, 4, 5ms, 50ms)), std::invalid_argument);
        REQUIRE_THROWS_AS(IntBatcher(Bind(query), Config(512, 0, 5ms, 50ms)), std::invalid_argument);
        REQUIRE_THROWS_AS(IntBatcher(nullptr, Config(512, 4, 5ms, 50ms)), std::invalid_argument);
        // Rejected before any worker thread is spawned
        REQUIRE_THROWS_AS(IntBatcher(Bind(query), Config(512, 1'000'000'000, 5ms, 50ms)),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(IntBatcher(Bind(query), Config(512, 1025, 5ms, 50ms)), std::invalid_argument);
    }
}
