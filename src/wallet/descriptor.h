#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "crypto/bip32.h"
#include "crypto/secp256k1.h"
#include "primitives/script/script.h"
#include "wallet/address.h"
#include "wallet/network.h"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wallet {

// ---------------------------------------------------------------------------
// Descriptor checksum (BIP-380)
// ---------------------------------------------------------------------------

/// The 8-character checksum of @p desc (without any '#' suffix).
/// Fails on characters outside the descriptor alphabet.
[[nodiscard]] core::Result<std::string> descriptor_checksum(
    std::string_view desc);

/// @p desc with "#<checksum>" appended.
[[nodiscard]] core::Result<std::string> add_checksum(std::string_view desc);

// ---------------------------------------------------------------------------
// BlindingKey -- how per-script blinding keys are obtained
// ---------------------------------------------------------------------------
enum class BlindingKind : uint8_t {
    Slip77,     // master key; per-script key = HMAC-SHA256(master, script)
    ViewKey,    // one private key shared by every script
    Bare,       // public key only: nothing to derive from
};

struct DerivedAddress {
    uint32_t index = 0;
    primitives::script::Script script;
    Address address;          // confidential form
};

// ---------------------------------------------------------------------------
// ConfidentialDescriptor
// ---------------------------------------------------------------------------
// Accepted form:
//   ct(<blinding>,elwpkh([fingerprint/origin]<xpub>[/<path>]/*))[#checksum]
// where <blinding> is slip77(<64 hex>), a 64-hex private view key, or a
// 66-hex compressed public key. Immutable once parsed.
// ---------------------------------------------------------------------------
class ConfidentialDescriptor {
public:
    /// Parse and validate a descriptor for @p network. A present checksum
    /// must match (PARSE_BAD_CHECKSUM). Extended keys for another network
    /// fail with CRYPTO_NETWORK_MISMATCH.
    static core::Result<ConfidentialDescriptor> parse(std::string_view desc,
                                                      Network network);

    [[nodiscard]] Network network() const { return network_; }
    [[nodiscard]] BlindingKind blinding_kind() const { return blinding_kind_; }

    /// True unless the blinding key is Bare.
    [[nodiscard]] bool has_derivable_blinding() const {
        return blinding_kind_ != BlindingKind::Bare;
    }

    /// Canonical text including the checksum.
    [[nodiscard]] const std::string& to_string() const { return canonical_; }

    /// scriptPubKey at @p index (P2WPKH of the derived child key).
    [[nodiscard]] core::Result<primitives::script::Script> script_pubkey(
        uint32_t index) const;

    /// Private blinding key for @p script. WALLET_UNSUPPORTED_BLINDING
    /// for bare descriptors.
    [[nodiscard]] core::Result<crypto::ECKey> blinding_key(
        const primitives::script::Script& script) const;

    /// Script plus confidential address at @p index.
    [[nodiscard]] core::Result<DerivedAddress> derive(uint32_t index) const;

    /// Hex SHA-256 of the canonical text and the network name.
    [[nodiscard]] std::string wallet_id() const;

private:
    ConfidentialDescriptor() = default;

    Network network_ = Network::Liquid;
    BlindingKind blinding_kind_ = BlindingKind::Bare;
    std::array<uint8_t, 32> blinding_secret_{};   // Slip77 master or view key
    crypto::ExtendedPubKey xpub_;                    // already derived along path
    std::string canonical_;
};

} // namespace wallet
