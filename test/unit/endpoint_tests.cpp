// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rpc/endpoint.hpp"
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>

using orderwatch::rpc::ParseEndpointUrl;

TEST_CASE("Endpoint: default ports and targets", "[rpc][endpoint]") {
    SECTION("ws defaults to port 80 and root target") {
        auto ep = ParseEndpointUrl("ws://localhost");
        REQUIRE_FALSE(ep.tls);
        REQUIRE(ep.host == "localhost");
        REQUIRE(ep.port == 80);
        REQUIRE(ep.target == "/");
    }

    SECTION("wss defaults to port 443") {
        auto ep = ParseEndpointUrl("wss://mainnet.example.io/ws/v3/abc");
        REQUIRE(ep.tls);
        REQUIRE(ep.host == "mainnet.example.io");
        REQUIRE(ep.port == 443);
        REQUIRE(ep.target == "/ws/v3/abc");
    }

    SECTION("Scheme is case-insensitive") {
        auto ep = ParseEndpointUrl("WSS://node.example:8546");
        REQUIRE(ep.tls);
        REQUIRE(ep.port == 8546);
    }

    SECTION("Query without a path gets a root path") {
        auto ep = ParseEndpointUrl("ws://node:8546?key=1");
        REQUIRE(ep.target == "/?key=1");
    }
}

TEST_CASE("Endpoint: IPv6 hosts", "[rpc][endpoint]") {
    auto ep = ParseEndpointUrl("ws://[::1]:8546/");
    REQUIRE(ep.host == "::1");
    REQUIRE(ep.port == 8546);
    REQUIRE(ep.ToString() == "ws://[::1]:8546/");

    REQUIRE_THROWS_AS(ParseEndpointUrl("ws://[::1:8546"), std::invalid_argument);
}

TEST_CASE("Endpoint: unsupported or malformed URLs fail synchronously", "[rpc][endpoint]") {
    REQUIRE_THROWS_AS(ParseEndpointUrl("http://localhost:8545"), std::invalid_argument);
    REQUIRE_THROWS_AS(ParseEndpointUrl("ipc:///tmp/geth.ipc"), std::invalid_argument);
    REQUIRE_THROWS_AS(ParseEndpointUrl("localhost:8546"), std::invalid_argument);
    REQUIRE_THROWS_AS(ParseEndpointUrl("ws://"), std::invalid_argument);
    REQUIRE_THROWS_AS(ParseEndpointUrl("ws://:8546"), std::invalid_argument);
    REQUIRE_THROWS_AS(ParseEndpointUrl("ws://host:"), std::invalid_argument);
    REQUIRE_THROWS_AS(ParseEndpointUrl("ws://host:0"), std::invalid_argument);
    REQUIRE_THROWS_AS(ParseEndpointUrl("ws://host:70000"), std::invalid_argument);
    REQUIRE_THROWS_AS(ParseEndpointUrl("ws://user:pass@host"), std::invalid_argument);
}
