#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// secp256k1 scalar and point arithmetic on top of OpenSSL's EC_POINT /
// BIGNUM API. Points cross the API as SEC1 compressed encodings (33 bytes),
// scalars as 32-byte big-endian integers.
// ---------------------------------------------------------------------------

#include <array>
#include <cstdint>
#include <span>

#include "core/types.h"
#include "core/error.h"

namespace crypto {

/// SEC1 compressed point: 0x02/0x03 || x.
using PubKey = std::array<uint8_t, 33>;

/// Big-endian scalar.
using Scalar = std::array<uint8_t, 32>;

/// A secp256k1 private key. Holds only the secret scalar; the public key
/// is recomputed on demand.
class ECKey {
public:
    ECKey() = default;
    ~ECKey();

    ECKey(const ECKey& other) = default;
    ECKey& operator=(const ECKey& other) = default;

    /// Generate a new random key via OpenSSL's RNG.
    static ECKey generate();

    /// Construct from an existing 32-byte secret scalar.
    /// Returns an error if the scalar is zero or >= curve order.
    static core::Result<ECKey> from_secret(std::span<const uint8_t, 32> secret);

    /// True when this object holds a valid private key.
    [[nodiscard]] bool is_valid() const { return has_key_; }

    /// Raw 32-byte secret scalar (big-endian).
    [[nodiscard]] const Scalar& secret() const { return secret_; }

    /// SEC1 compressed public key.
    [[nodiscard]] PubKey pubkey_compressed() const;

    /// ECDH: SHA-256 of the compressed encoding of secret * other_pubkey.
    [[nodiscard]] core::Result<core::uint256> ecdh(
        std::span<const uint8_t> other_pubkey) const;

private:
    Scalar secret_{};
    bool has_key_ = false;
};

/// True if @p secret is a valid private key (0 < secret < n).
[[nodiscard]] bool is_valid_secret(std::span<const uint8_t, 32> secret);

/// Return true if the byte sequence is a valid SEC1 public key
/// (compressed 33 bytes starting 0x02/0x03, or uncompressed 65 bytes
/// starting 0x04) that lies on the curve.
[[nodiscard]] bool is_valid_pubkey(std::span<const uint8_t> pubkey);

/// P + tweak*G. Used by BIP-32 public child derivation.
[[nodiscard]] core::Result<PubKey> pubkey_tweak_add(
    std::span<const uint8_t> pubkey, std::span<const uint8_t, 32> tweak);

/// a*P + b*G. Either scalar may be zero, but not the resulting point.
/// This is the Pedersen-style commitment primitive.
[[nodiscard]] core::Result<PubKey> point_mul_add(
    std::span<const uint8_t> point,
    std::span<const uint8_t, 32> a,
    std::span<const uint8_t, 32> b);

/// Interpret @p x as an x-coordinate and return the point with even y,
/// or an error if x is not on the curve.
[[nodiscard]] core::Result<PubKey> lift_x(std::span<const uint8_t, 32> x);

}  // namespace crypto
