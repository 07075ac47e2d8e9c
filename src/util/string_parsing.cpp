// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <charconv>

namespace orderwatch {
namespace util {

namespace {

template <typename T>
std::optional<T> ParseDecimal(const std::string &str, T min, T max) {
  // from_chars accepts a leading '-' but not '+' or whitespace
  if (str.empty()) {
    return std::nullopt;
  }
  T value{};
  const char *first = str.data();
  const char *last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  if (value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool HasHexPrefix(std::string_view str) {
  return str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X');
}

// word = word * mul + add, big-endian bytes. Returns false on overflow.
bool MulAdd(uint256 &word, unsigned mul, unsigned add) {
  unsigned carry = add;
  for (int i = static_cast<int>(uint256::size()) - 1; i >= 0; --i) {
    unsigned v = word.data()[i] * mul + carry;
    word.data()[i] = static_cast<uint8_t>(v & 0xff);
    carry = v >> 8;
  }
  return carry == 0;
}

} // namespace

std::optional<int> SafeParseInt(const std::string &str, int min, int max) {
  return ParseDecimal<int>(str, min, max);
}

std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max) {
  return ParseDecimal<int64_t>(str, min, max);
}

std::optional<uint64_t> SafeParseQuantity(std::string_view str) {
  if (!HasHexPrefix(str)) {
    return std::nullopt;
  }
  std::string_view digits = str.substr(2);
  if (!IsValidHex(digits)) {
    return std::nullopt;
  }

  uint64_t value = 0;
  for (char c : digits) {
    if (value > (UINT64_MAX >> 4)) {
      return std::nullopt;
    }
    value = (value << 4) | static_cast<uint64_t>(HexValue(c));
  }
  return value;
}

std::optional<uint256> SafeParseUint256(std::string_view str) {
  unsigned base = 10;
  if (HasHexPrefix(str)) {
    base = 16;
    str.remove_prefix(2);
  }
  if (str.empty()) {
    return std::nullopt;
  }

  uint256 word;
  for (char c : str) {
    int digit = HexValue(c);
    if (digit < 0 || static_cast<unsigned>(digit) >= base) {
      return std::nullopt;
    }
    if (!MulAdd(word, base, static_cast<unsigned>(digit))) {
      return std::nullopt;
    }
  }
  return word;
}

std::string FormatUint256(const uint256 &value) {
  uint256 work = value;
  std::string digits;
  while (!work.IsNull()) {
    // work /= 10, collecting the remainder
    unsigned remainder = 0;
    for (unsigned i = 0; i < uint256::size(); ++i) {
      unsigned cur = (remainder << 8) | work.data()[i];
      work.data()[i] = static_cast<uint8_t>(cur / 10);
      remainder = cur % 10;
    }
    digits.push_back(static_cast<char>('0' + remainder));
  }
  if (digits.empty()) {
    return "0";
  }
  return std::string(digits.rbegin(), digits.rend());
}

bool IsValidHex(std::string_view str) {
  if (str.empty()) {
    return false;
  }
  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

} // namespace util
} // namespace orderwatch
