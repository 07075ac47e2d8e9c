// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/watcher_error.hpp"
#include "rpc/json_rpc.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace orderwatch;
using nlohmann::json;

namespace {

json SampleBlock() {
    return json{
        {"number", "0x10d4f"},
        {"hash", "0x1111111111111111111111111111111111111111111111111111111111111111"},
        {"parentHash", "0x2222222222222222222222222222222222222222222222222222222222222222"},
        {"timestamp", "0x5f5e100"},
        {"miner", "0xea674fdde714fd979de3edf0f56aa9716b898ec8"},
        {"gasUsed", "0x5208"},
        {"gasLimit", "0x1c9c380"},
        {"baseFeePerGas", "0x7"},
    };
}

chain::WatcherErrorCode CodeOf(const json& block) {
    try {
        rpc::ParseBlockHeader(block);
    } catch (const chain::WatcherError& e) {
        return e.code();
    }
    FAIL("ParseBlockHeader did not throw");
    return chain::WatcherErrorCode::kTransport;
}

} // namespace

TEST_CASE("JSON-RPC: decode a block header", "[rpc][json]") {
    auto header = rpc::ParseBlockHeader(SampleBlock());
    REQUIRE(header.number == 0x10d4f);
    REQUIRE(header.hash.GetHex() == "0x1111111111111111111111111111111111111111111111111111111111111111");
    REQUIRE(header.parent_hash.GetHex() == "0x2222222222222222222222222222222222222222222222222222222222222222");
    REQUIRE(header.timestamp == 100000000);
    REQUIRE(header.miner.GetHex() == "0xea674fdde714fd979de3edf0f56aa9716b898ec8");
    REQUIRE(header.gas_used == 21000);
    REQUIRE(header.gas_limit == 30000000);
    REQUIRE(header.base_fee == uint64_t{7});
}

TEST_CASE("JSON-RPC: pre-London blocks have no base fee", "[rpc][json]") {
    auto block = SampleBlock();
    block.erase("baseFeePerGas");
    auto header = rpc::ParseBlockHeader(block);
    REQUIRE_FALSE(header.base_fee.has_value());
}

TEST_CASE("JSON-RPC: malformed headers map to watcher errors", "[rpc][json]") {
    SECTION("null result is NotFound") {
        REQUIRE(CodeOf(json(nullptr)) == chain::WatcherErrorCode::kNotFound);
    }

    SECTION("pending block without number") {
        auto block = SampleBlock();
        block["number"] = nullptr;
        REQUIRE(CodeOf(block) == chain::WatcherErrorCode::kNumberMissing);
    }

    SECTION("pending block without hash") {
        auto block = SampleBlock();
        block.erase("hash");
        REQUIRE(CodeOf(block) == chain::WatcherErrorCode::kHashMissing);
    }

    SECTION("bad quantity is a transport error") {
        auto block = SampleBlock();
        block["gasUsed"] = 21000;
        REQUIRE(CodeOf(block) == chain::WatcherErrorCode::kTransport);
    }

    SECTION("non-object result") {
        REQUIRE(CodeOf(json::array()) == chain::WatcherErrorCode::kTransport);
    }
}

TEST_CASE("JSON-RPC: structural errors are not retryable", "[rpc][json]") {
    REQUIRE(chain::IsRetryable(chain::WatcherErrorCode::kTransport));
    REQUIRE(chain::IsRetryable(chain::WatcherErrorCode::kTimeout));
    REQUIRE(chain::IsRetryable(chain::WatcherErrorCode::kEndOfStream));
    REQUIRE_FALSE(chain::IsRetryable(chain::WatcherErrorCode::kNumberMissing));
    REQUIRE_FALSE(chain::IsRetryable(chain::WatcherErrorCode::kReorgOverflow));
}

TEST_CASE("JSON-RPC: block fetch requests", "[rpc][json]") {
    SECTION("latest") {
        auto call = rpc::BlockIdToCall(chain::BlockId::Latest());
        REQUIRE(call.method == "eth_getBlockByNumber");
        REQUIRE(call.params == json::array({"latest", false}));
    }

    SECTION("by number") {
        auto call = rpc::BlockIdToCall(chain::BlockId::Number(255));
        REQUIRE(call.method == "eth_getBlockByNumber");
        REQUIRE(call.params == json::array({"0xff", false}));
    }

    SECTION("by hash") {
        auto hash = uint256S("0x3333333333333333333333333333333333333333333333333333333333333333");
        auto call = rpc::BlockIdToCall(chain::BlockId::Hash(hash));
        REQUIRE(call.method == "eth_getBlockByHash");
        REQUIRE(call.params[0] == hash.GetHex());
    }

    SECTION("request envelope") {
        auto request = rpc::MakeRequest(7, rpc::NewHeadsSubscribeCall());
        REQUIRE(request["jsonrpc"] == "2.0");
        REQUIRE(request["id"] == 7);
        REQUIRE(request["method"] == "eth_subscribe");
        REQUIRE(request["params"] == json::array({"newHeads"}));
    }
}
