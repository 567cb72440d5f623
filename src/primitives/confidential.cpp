// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/confidential.h"

namespace primitives {

ConfidentialAsset ConfidentialAsset::from_explicit(const core::uint256& asset) {
    ConfidentialAsset a;
    a.data.reserve(33);
    a.data.push_back(0x01);
    a.data.insert(a.data.end(), asset.bytes().begin(), asset.bytes().end());
    return a;
}

ConfidentialAsset ConfidentialAsset::from_commitment(
    const std::array<uint8_t, 33>& c) {
    ConfidentialAsset a;
    a.data.assign(c.begin(), c.end());
    return a;
}

std::optional<core::uint256> ConfidentialAsset::explicit_asset() const {
    if (!is_explicit()) return std::nullopt;
    return core::uint256::from_bytes(
        std::span<const uint8_t, 32>(data.data() + 1, 32));
}

ConfidentialValue ConfidentialValue::from_explicit(uint64_t value) {
    ConfidentialValue v;
    v.data.resize(9);
    v.data[0] = 0x01;
    for (int i = 0; i < 8; ++i) {
        v.data[8 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return v;
}

ConfidentialValue ConfidentialValue::from_commitment(
    const std::array<uint8_t, 33>& c) {
    ConfidentialValue v;
    v.data.assign(c.begin(), c.end());
    return v;
}

std::optional<uint64_t> ConfidentialValue::explicit_value() const {
    if (!is_explicit()) return std::nullopt;
    uint64_t value = 0;
    for (size_t i = 1; i < 9; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

ConfidentialNonce nonce_from_pubkey(const std::array<uint8_t, 33>& pubkey) {
    ConfidentialNonce n;
    n.data.assign(pubkey.begin(), pubkey.end());
    return n;
}

} // namespace primitives
