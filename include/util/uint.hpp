// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

/** Template base class for fixed-sized opaque blobs.
 *
 * Bytes are stored in wire order: GetHex() prints m_data[0] first, which is
 * how Ethereum JSON-RPC renders hashes, addresses and 256-bit words.
 */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0,
                "base_blob currently only supports whole bytes.");
  std::array<uint8_t, WIDTH> m_data;
  static_assert(WIDTH == sizeof(m_data), "Sanity check");

public:
  /* construct 0 value by default */
  constexpr base_blob() : m_data() {}

  /* constructor for constants between 1 and 255, stored in the last byte */
  constexpr explicit base_blob(uint8_t v) : m_data() { m_data[WIDTH - 1] = v; }

  explicit base_blob(std::span<const unsigned char> vch) : m_data() {
    std::copy_n(vch.begin(), std::min<size_t>(vch.size(), WIDTH),
                m_data.begin());
  }

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  int Compare(const base_blob &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }

  /** @name Hex representation
   *
   * GetHex() returns "0x" followed by 2*WIDTH lowercase digits.
   * SetHex() accepts an optional "0x" prefix and returns false (leaving the
   * blob null) unless the remaining text is exactly 2*WIDTH hex digits.
   * @{*/
  std::string GetHex() const;
  std::string ToString() const;
  bool SetHex(std::string_view str);
  /**@}*/

  /** Short form used in log lines ("0x1234abcd..") */
  std::string ToShortString() const;

  constexpr const unsigned char *data() const { return m_data.data(); }
  constexpr unsigned char *data() { return m_data.data(); }

  constexpr unsigned char *begin() { return m_data.data(); }
  constexpr unsigned char *end() { return m_data.data() + WIDTH; }

  constexpr const unsigned char *begin() const { return m_data.data(); }
  constexpr const unsigned char *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }

  /** First eight bytes folded into an integer, for hash tables. */
  uint64_t GetCheapHash() const {
    uint64_t out = 0;
    std::memcpy(&out, m_data.data(), sizeof(out) < WIDTH ? sizeof(out) : WIDTH);
    return out;
  }
};

/** 160-bit opaque blob (Ethereum account address). */
class uint160 : public base_blob<160> {
public:
  constexpr uint160() = default;
  explicit uint160(std::span<const unsigned char> vch) : base_blob<160>(vch) {}

  static std::optional<uint160> FromHex(std::string_view str) {
    uint160 rv;
    if (!rv.SetHex(str)) return std::nullopt;
    return rv;
  }
};

/** 256-bit opaque blob (block hashes, order hashes and big-endian words). */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  constexpr explicit uint256(uint8_t v) : base_blob<256>(v) {}
  explicit uint256(std::span<const unsigned char> vch) : base_blob<256>(vch) {}

  static std::optional<uint256> FromHex(std::string_view str) {
    uint256 rv;
    if (!rv.SetHex(str)) return std::nullopt;
    return rv;
  }

  static const uint256 ZERO;
  static const uint256 ONE;
};

/* uint256 from a hex literal, null on malformed input.
 * Separate function so that uint256(0) is never picked up by accident.
 */
inline uint256 uint256S(std::string_view str) {
  uint256 rv;
  rv.SetHex(str);
  return rv;
}

namespace std {
template <> struct hash<uint160> {
  size_t operator()(const uint160 &v) const noexcept {
    return static_cast<size_t>(v.GetCheapHash());
  }
};

template <> struct hash<uint256> {
  size_t operator()(const uint256 &v) const noexcept {
    return static_cast<size_t>(v.GetCheapHash());
  }
};
} // namespace std
