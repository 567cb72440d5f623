#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "core/error.h"

namespace crypto {

// ---------------------------------------------------------------------------
// ExtendedPubKey -- BIP32 public derivation for watch-only descriptors
// ---------------------------------------------------------------------------
//   I       = HMAC-SHA512(chain_code, serP(K) || ser32(i))
//   K_child = point(I[0..32]) + K
//   c_child = I[32..64]
// Only unhardened children (i < HARDENED_BIT) can be derived without the
// private key, so that is all this class does.
// ---------------------------------------------------------------------------
class ExtendedPubKey {
public:
    static constexpr uint32_t HARDENED_BIT = 0x80000000;

    static constexpr uint32_t XPUB_VERSION = 0x0488B21E;
    static constexpr uint32_t TPUB_VERSION = 0x043587CF;

    ExtendedPubKey() = default;

    /// Parses xpub/tpub. xprv/tprv fail with VALIDATION_ERROR: the wallet is
    /// watch-only. A bad checksum is PARSE_BAD_CHECKSUM.
    static core::Result<ExtendedPubKey> from_base58(std::string_view str);

    /// 78-byte Base58Check form, version chosen by is_testnet().
    [[nodiscard]] std::string to_base58() const;

    /// Child |index|; VALIDATION_RANGE for a hardened index.
    [[nodiscard]] core::Result<ExtendedPubKey> derive(uint32_t index) const;

    /// "/0/1" style path, unhardened steps only.
    [[nodiscard]] core::Result<ExtendedPubKey> derive_path(std::string_view path) const;

    [[nodiscard]] const std::array<uint8_t, 33>& pubkey() const { return pubkey_; }
    [[nodiscard]] uint8_t depth() const { return depth_; }
    [[nodiscard]] bool is_testnet() const { return testnet_; }

    /// First 4 bytes of Hash160(pubkey), big-endian.
    [[nodiscard]] uint32_t fingerprint() const;

private:
    std::array<uint8_t, 33> pubkey_{};
    std::array<uint8_t, 32> chain_code_{};
    uint8_t depth_ = 0;
    uint32_t parent_fingerprint_ = 0;
    uint32_t child_number_ = 0;
    bool testnet_ = false;
};

} // namespace crypto
