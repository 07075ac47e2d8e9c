// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Bounded parsing of command-line values and JSON-RPC quantities
 - Every function rejects trailing garbage, leading whitespace and
   out-of-range values by returning std::nullopt (never throws)

 Key functions:
 - SafeParseInt / SafeParseInt64: decimal integers within [min, max]
 - SafeParseQuantity: Ethereum "0x"-prefixed hex quantity to uint64_t
 - SafeParseUint256: decimal or "0x" hex string to a 256-bit big-endian word
 - FormatUint256: decimal rendering for logs and JSON
 - IsValidHex: hex digit check
*/

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "util/uint.hpp"

namespace orderwatch {
namespace util {

/**
 * Parse a decimal integer within [min, max]
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

/**
 * Parse a decimal int64_t within [min, max]
 */
std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max);

/**
 * Parse a JSON-RPC hex quantity
 *
 * Requires the "0x" prefix and at least one digit. Leading zeros are
 * tolerated (some providers emit them).
 *
 * Examples:
 *   SafeParseQuantity("0x0") -> 0
 *   SafeParseQuantity("0x1b4") -> 436
 *   SafeParseQuantity("1b4") -> std::nullopt (no prefix)
 *   SafeParseQuantity("0x") -> std::nullopt
 *   SafeParseQuantity("0x10000000000000000") -> std::nullopt (overflow)
 */
std::optional<uint64_t> SafeParseQuantity(std::string_view str);

/**
 * Parse an unsigned 256-bit amount given in decimal, or in hex with a
 * "0x" prefix. The result is stored big-endian (most significant byte
 * first), the layout used on the wire by the exchange contract.
 *
 * Examples:
 *   SafeParseUint256("1000000000000000000") -> 10^18
 *   SafeParseUint256("0xff") -> 255
 *   SafeParseUint256("-1") -> std::nullopt
 */
std::optional<uint256> SafeParseUint256(std::string_view str);

/**
 * Decimal rendering of a big-endian 256-bit word (inverse of the decimal
 * form accepted by SafeParseUint256)
 */
std::string FormatUint256(const uint256 &value);

/**
 * Validate a hexadecimal string
 *
 * @return true if non-empty and every character is [0-9a-fA-F]
 */
bool IsValidHex(std::string_view str);

} // namespace util
} // namespace orderwatch
