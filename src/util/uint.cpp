// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/uint.hpp"

namespace {

// Helper function to convert hex character to value
inline int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

constexpr char kHexChars[] = "0123456789abcdef";

} // namespace

template <unsigned int BITS> std::string base_blob<BITS>::GetHex() const {
  std::string out;
  out.reserve(2 + WIDTH * 2);
  out += "0x";
  for (uint8_t byte : m_data) {
    out += kHexChars[byte >> 4];
    out += kHexChars[byte & 0x0f];
  }
  return out;
}

template <unsigned int BITS>
bool base_blob<BITS>::SetHex(std::string_view str) {
  SetNull();

  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }
  if (str.size() != static_cast<size_t>(WIDTH) * 2) {
    return false;
  }

  std::array<uint8_t, WIDTH> parsed{};
  for (int i = 0; i < WIDTH; ++i) {
    int hi = HexDigit(str[2 * i]);
    int lo = HexDigit(str[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    parsed[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  m_data = parsed;
  return true;
}

template <unsigned int BITS> std::string base_blob<BITS>::ToString() const {
  return GetHex();
}

template <unsigned int BITS>
std::string base_blob<BITS>::ToShortString() const {
  return GetHex().substr(0, 10) + "..";
}

// Explicit instantiations for base_blob<160>
template std::string base_blob<160>::GetHex() const;
template bool base_blob<160>::SetHex(std::string_view);
template std::string base_blob<160>::ToString() const;
template std::string base_blob<160>::ToShortString() const;

// Explicit instantiations for base_blob<256>
template std::string base_blob<256>::GetHex() const;
template bool base_blob<256>::SetHex(std::string_view);
template std::string base_blob<256>::ToString() const;
template std::string base_blob<256>::ToShortString() const;

// Static constants
const uint256 uint256::ZERO(0);
const uint256 uint256::ONE(1);
