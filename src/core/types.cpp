// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include <algorithm>
#include <stdexcept>

#include "core/hex.h"

namespace core {

template <std::size_t N>
Blob<N> Blob<N>::from_bytes(std::span<const uint8_t, N> bytes) noexcept {
    Blob<N> out;
    std::copy(bytes.begin(), bytes.end(), out.bytes_.begin());
    return out;
}

template <std::size_t N>
Blob<N> Blob<N>::from_bytes_be(std::span<const uint8_t, N> bytes) noexcept {
    Blob<N> out;
    std::reverse_copy(bytes.begin(), bytes.end(), out.bytes_.begin());
    return out;
}

template <std::size_t N>
Blob<N> Blob<N>::from_hex(std::string_view hex) {
    auto decoded = core::from_hex(hex);
    if (!decoded || decoded->size() != N) {
        throw std::invalid_argument("expected " + std::to_string(2 * N) +
                                    " hex digits, got '" + std::string(hex) +
                                    "'");
    }
    return from_bytes_be(std::span<const uint8_t, N>(decoded->data(), N));
}

template <std::size_t N>
std::string Blob<N>::to_hex() const {
    std::array<uint8_t, N> display;
    std::reverse_copy(bytes_.begin(), bytes_.end(), display.begin());
    return core::to_hex(display);
}

template <std::size_t N>
bool Blob<N>::is_zero() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(),
                       [](uint8_t b) { return b == 0; });
}

template <std::size_t N>
std::strong_ordering Blob<N>::operator<=>(const Blob& other) const noexcept {
    for (std::size_t i = N; i-- > 0;) {
        if (auto c = bytes_[i] <=> other.bytes_[i]; c != 0) return c;
    }
    return std::strong_ordering::equal;
}

template class Blob<32>;
template class Blob<20>;

}  // namespace core
