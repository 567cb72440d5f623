#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Little-endian encoders for the Elements transaction wire format and the
// wallet store records.  Readers throw std::runtime_error on truncated or
// non-canonical input.

#include "core/stream.h"
#include "core/types.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

namespace core {

/// Upper bound on any decoded length prefix or element count.
inline constexpr size_t MAX_VECTOR_SIZE = 1u << 24;

// ===================================================================
// Fixed-width integers
// ===================================================================

namespace detail {

template <typename Stream, typename UInt>
inline void write_le(Stream& s, UInt v) {
    std::array<uint8_t, sizeof(UInt)> buf;
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        buf[i] = static_cast<uint8_t>(v >> (8 * i));
    }
    s.write(buf);
}

template <typename UInt, typename Stream>
inline UInt read_le(Stream& s) {
    std::array<uint8_t, sizeof(UInt)> buf;
    s.read(buf);
    UInt v = 0;
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        v |= static_cast<UInt>(buf[i]) << (8 * i);
    }
    return v;
}

} // namespace detail

template <typename Stream>
inline void ser_write_u8(Stream& s, uint8_t v) { detail::write_le(s, v); }
template <typename Stream>
inline void ser_write_u32(Stream& s, uint32_t v) { detail::write_le(s, v); }
template <typename Stream>
inline void ser_write_u64(Stream& s, uint64_t v) { detail::write_le(s, v); }
template <typename Stream>
inline void ser_write_i32(Stream& s, int32_t v) {
    detail::write_le(s, static_cast<uint32_t>(v));
}

template <typename Stream>
inline uint8_t ser_read_u8(Stream& s) { return detail::read_le<uint8_t>(s); }
template <typename Stream>
inline uint32_t ser_read_u32(Stream& s) { return detail::read_le<uint32_t>(s); }
template <typename Stream>
inline uint64_t ser_read_u64(Stream& s) { return detail::read_le<uint64_t>(s); }
template <typename Stream>
inline int32_t ser_read_i32(Stream& s) {
    return static_cast<int32_t>(detail::read_le<uint32_t>(s));
}

/// One byte, 0 or 1.
template <typename Stream>
inline void ser_write_bool(Stream& s, bool v) { ser_write_u8(s, v ? 1 : 0); }

template <typename Stream>
inline bool ser_read_bool(Stream& s) {
    uint8_t v = ser_read_u8(s);
    if (v > 1) throw std::runtime_error("invalid boolean byte");
    return v != 0;
}

// ===================================================================
// CompactSize
// ===================================================================
//   < 0xFD        1 byte
//   <= 0xFFFF     0xFD + u16
//   <= 0xFFFFFFFF 0xFE + u32
//   otherwise     0xFF + u64
// ===================================================================

template <typename Stream>
void ser_write_compact_size(Stream& s, uint64_t n) {
    if (n < 0xFD) {
        ser_write_u8(s, static_cast<uint8_t>(n));
    } else if (n <= 0xFFFF) {
        ser_write_u8(s, 0xFD);
        detail::write_le(s, static_cast<uint16_t>(n));
    } else if (n <= 0xFFFFFFFFULL) {
        ser_write_u8(s, 0xFE);
        detail::write_le(s, static_cast<uint32_t>(n));
    } else {
        ser_write_u8(s, 0xFF);
        detail::write_le(s, n);
    }
}

/// Rejects encodings that a shorter form could have carried.
template <typename Stream>
uint64_t ser_read_compact_size(Stream& s) {
    uint8_t tag = ser_read_u8(s);
    uint64_t n = tag;
    uint64_t min = 0;
    switch (tag) {
    case 0xFD: n = detail::read_le<uint16_t>(s); min = 0xFD; break;
    case 0xFE: n = detail::read_le<uint32_t>(s); min = 0x10000; break;
    case 0xFF: n = detail::read_le<uint64_t>(s); min = 0x100000000ULL; break;
    default: break;
    }
    if (n < min) throw std::runtime_error("non-canonical compact size");
    return n;
}

/// Length prefix that is about to size an allocation.
template <typename Stream>
size_t ser_read_length(Stream& s) {
    uint64_t n = ser_read_compact_size(s);
    if (n > MAX_VECTOR_SIZE) throw std::runtime_error("length prefix too large");
    return static_cast<size_t>(n);
}

// ===================================================================
// Byte strings
// ===================================================================

template <typename Stream>
inline void ser_write_bytes(Stream& s, std::span<const uint8_t> data) {
    s.write(data);
}

template <typename Stream>
inline void ser_read_bytes(Stream& s, std::span<uint8_t> out) {
    s.read(out);
}

/// CompactSize length, then the bytes.
template <typename Stream>
void ser_write_vector(Stream& s, const std::vector<uint8_t>& v) {
    ser_write_compact_size(s, v.size());
    s.write(v);
}

template <typename Stream>
std::vector<uint8_t> ser_read_vector(Stream& s) {
    std::vector<uint8_t> out(ser_read_length(s));
    s.read(out);
    return out;
}

/// A witness stack: item count, then each item length-prefixed.
template <typename Stream>
void ser_write_stack(Stream& s, const std::vector<std::vector<uint8_t>>& stack) {
    ser_write_compact_size(s, stack.size());
    for (const auto& item : stack) ser_write_vector(s, item);
}

template <typename Stream>
std::vector<std::vector<uint8_t>> ser_read_stack(Stream& s) {
    size_t count = ser_read_length(s);
    std::vector<std::vector<uint8_t>> stack;
    stack.reserve(count);
    for (size_t i = 0; i < count; ++i) stack.push_back(ser_read_vector(s));
    return stack;
}

/// 32 raw bytes in internal order.
template <typename Stream>
inline void ser_write_uint256(Stream& s, const core::uint256& v) {
    s.write(std::span<const uint8_t>(v.data(), 32));
}

template <typename Stream>
inline core::uint256 ser_read_uint256(Stream& s) {
    std::array<uint8_t, 32> bytes{};
    s.read(bytes);
    return core::uint256::from_bytes(bytes);
}

}  // namespace core
