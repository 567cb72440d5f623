#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/serialize.h"
#include "core/types.h"

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

namespace primitives {

// ---------------------------------------------------------------------------
// ConfidentialField -- Elements asset / value / nonce slot
// ---------------------------------------------------------------------------
// Wire form is selected by the first byte:
//   0x00                  null (one byte)
//   0x01                  explicit (ExplicitSize bytes including the 0x01)
//   PrefixA / PrefixB     33-byte commitment
// ---------------------------------------------------------------------------
template <size_t ExplicitSize, uint8_t PrefixA, uint8_t PrefixB>
struct ConfidentialField {
    static constexpr size_t COMMITTED_SIZE = 33;
    static constexpr size_t EXPLICIT_SIZE = ExplicitSize;

    std::vector<uint8_t> data;

    [[nodiscard]] bool is_null() const { return data.empty(); }
    [[nodiscard]] bool is_explicit() const {
        return data.size() == ExplicitSize && data[0] == 0x01;
    }
    [[nodiscard]] bool is_commitment() const {
        return data.size() == COMMITTED_SIZE &&
               (data[0] == PrefixA || data[0] == PrefixB);
    }

    /// The 33 commitment bytes. Only meaningful when is_commitment().
    [[nodiscard]] std::array<uint8_t, 33> commitment() const {
        std::array<uint8_t, 33> out{};
        if (is_commitment()) {
            std::copy(data.begin(), data.end(), out.begin());
        }
        return out;
    }

    bool operator==(const ConfidentialField&) const = default;

    template <typename Stream>
    void serialize(Stream& s) const {
        if (data.empty()) {
            core::ser_write_u8(s, 0x00);
            return;
        }
        core::ser_write_bytes(s, std::span<const uint8_t>(data));
    }

    template <typename Stream>
    static ConfidentialField deserialize(Stream& s) {
        ConfidentialField f;
        uint8_t version = core::ser_read_u8(s);
        size_t size = 0;
        if (version == 0x00) {
            return f;
        } else if (version == 0x01) {
            size = ExplicitSize;
        } else if (version == PrefixA || version == PrefixB) {
            size = COMMITTED_SIZE;
        } else {
            throw std::runtime_error(
                "ConfidentialField: invalid version byte");
        }
        f.data.resize(size);
        f.data[0] = version;
        core::ser_read_bytes(s, std::span<uint8_t>(f.data.data() + 1,
                                                   size - 1));
        return f;
    }
};

using ConfidentialAssetBase = ConfidentialField<33, 0x0a, 0x0b>;
using ConfidentialValueBase = ConfidentialField<9, 0x08, 0x09>;
using ConfidentialNonce     = ConfidentialField<33, 0x02, 0x03>;

struct ConfidentialAsset : ConfidentialAssetBase {
    ConfidentialAsset() = default;
    ConfidentialAsset(const ConfidentialAssetBase& base)  // NOLINT implicit
        : ConfidentialAssetBase(base) {}

    static ConfidentialAsset from_explicit(const core::uint256& asset);
    static ConfidentialAsset from_commitment(const std::array<uint8_t, 33>& c);

    /// Asset id when explicit.
    [[nodiscard]] std::optional<core::uint256> explicit_asset() const;

    template <typename Stream>
    static ConfidentialAsset deserialize(Stream& s) {
        return ConfidentialAssetBase::deserialize(s);
    }
};

struct ConfidentialValue : ConfidentialValueBase {
    ConfidentialValue() = default;
    ConfidentialValue(const ConfidentialValueBase& base)  // NOLINT implicit
        : ConfidentialValueBase(base) {}

    /// Explicit values are stored big-endian after the 0x01 tag.
    static ConfidentialValue from_explicit(uint64_t value);
    static ConfidentialValue from_commitment(const std::array<uint8_t, 33>& c);

    [[nodiscard]] std::optional<uint64_t> explicit_value() const;

    template <typename Stream>
    static ConfidentialValue deserialize(Stream& s) {
        return ConfidentialValueBase::deserialize(s);
    }
};

/// Nonce slot helper: an ephemeral public key.
ConfidentialNonce nonce_from_pubkey(const std::array<uint8_t, 33>& pubkey);

} // namespace primitives
