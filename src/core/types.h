#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// Blob<N> -- fixed-size opaque hash
// ---------------------------------------------------------------------------
// Storage is in wire order, which for txids and block hashes is the reverse
// of the hex shown by explorers and Electrum servers. to_hex()/from_hex()
// use the display order; from_bytes()/data() use the wire order.
// ---------------------------------------------------------------------------
template <std::size_t N>
class Blob {
public:
    constexpr Blob() noexcept : bytes_{} {}

    /// Wrap |bytes| as given (wire order).
    static Blob from_bytes(std::span<const uint8_t, N> bytes) noexcept;

    /// Wrap |bytes| given in display order.
    static Blob from_bytes_be(std::span<const uint8_t, N> bytes) noexcept;

    /// Exactly 2*N hex digits in display order. Throws
    /// std::invalid_argument otherwise.
    static Blob from_hex(std::string_view hex);

    [[nodiscard]] std::string to_hex() const;

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]] uint8_t* data() noexcept { return bytes_.data(); }
    [[nodiscard]] const std::array<uint8_t, N>& bytes() const noexcept {
        return bytes_;
    }
    [[nodiscard]] static constexpr std::size_t size() noexcept { return N; }

    [[nodiscard]] bool is_zero() const noexcept;

    // Ordered by display order, so sorted containers list hashes the way
    // their hex sorts.
    [[nodiscard]] std::strong_ordering operator<=>(const Blob& other) const noexcept;
    [[nodiscard]] bool operator==(const Blob& other) const noexcept = default;

private:
    std::array<uint8_t, N> bytes_;
};

/// Txids, block hashes, asset ids, blinding factors.
using uint256 = Blob<32>;

/// Hash160 key identifiers inside P2WPKH scripts.
using uint160 = Blob<20>;

extern template class Blob<32>;
extern template class Blob<20>;

}  // namespace core
