#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Elements confidential outputs on libsecp256k1-zkp.
//
//   generator   secp256k1_generator_generate(asset)          (0x0a/0x0b)
//   asset       secp256k1_generator_generate_blinded(asset, abf)
//   value       secp256k1_pedersen_commit(vbf, value, asset) (0x08/0x09)
//   nonce       SHA256(ECDH(blinding key, nonce commitment))
//
// The range proof is rewound with the nonce. Its message side channel
// carries asset || abf, and the output's scriptPubKey is committed into
// the proof.
// ---------------------------------------------------------------------------

#include <array>
#include <cstdint>
#include <span>
#include <vector>

#include "core/error.h"
#include "core/types.h"
#include "crypto/secp256k1.h"

namespace crypto {

using Commitment = std::array<uint8_t, 33>;

inline constexpr uint8_t ASSET_COMMITMENT_PREFIX_EVEN = 0x0a;
inline constexpr uint8_t ASSET_COMMITMENT_PREFIX_ODD  = 0x0b;
inline constexpr uint8_t VALUE_COMMITMENT_PREFIX_EVEN = 0x08;
inline constexpr uint8_t VALUE_COMMITMENT_PREFIX_ODD  = 0x09;

/// Size of the range proof message: asset id followed by its blinder.
inline constexpr size_t SIDECHANNEL_MSG_SIZE = 64;

/// Upper bound of a decoded amount (21M coins of 10^8 units).
inline constexpr uint64_t MAX_MONEY = 2'100'000'000'000'000ULL;

/// Cleartext opening of a confidential output.
struct TxOutSecrets {
    core::uint256 asset;
    uint64_t value = 0;
    core::uint256 asset_bf;   // zero for explicit outputs
    core::uint256 value_bf;   // zero for explicit outputs

    bool operator==(const TxOutSecrets& o) const = default;
};

/// What a sender publishes for one blinded output.
struct BlindedOutput {
    Commitment asset_commitment{};
    Commitment value_commitment{};
    PubKey nonce_commitment{};             // ephemeral public key E
    std::vector<uint8_t> rangeproof;
    TxOutSecrets secrets;
};

/// Unblinded generator of an explicit asset, in commitment encoding.
[[nodiscard]] core::Result<Commitment> asset_generator(const core::uint256& asset);

/// Blinded asset generator in commitment encoding.
[[nodiscard]] core::Result<Commitment> asset_commitment(
    const core::uint256& asset, const core::uint256& abf);

/// Pedersen commitment to @p value over @p generator (an asset
/// commitment, 0x0a/0x0b).
[[nodiscard]] core::Result<Commitment> value_commitment(
    uint64_t value, const Commitment& generator, const core::uint256& vbf);

/// SHA256 of the ECDH secret, which is itself SHA256 of the compressed
/// shared point. Rewinds proofs made for the holder of @p blinding_key.
[[nodiscard]] core::Result<core::uint256> rewind_nonce(
    const ECKey& blinding_key, std::span<const uint8_t> nonce_commitment);

/// Sender side: blind (asset, value) to the receiver's blinding pubkey,
/// committing @p script_pubkey into the range proof. A fresh ephemeral
/// key and fresh blinding factors are drawn.
[[nodiscard]] core::Result<BlindedOutput> blind_output(
    const core::uint256& asset, uint64_t value,
    std::span<const uint8_t> receiver_blinding_pubkey,
    std::span<const uint8_t> script_pubkey);

/// Receiver side: rewind the range proof and recover the opening.
/// @p asset_generator_bytes is the output's asset commitment, or the
/// generator of its explicit asset. Any failure (foreign key, tampered
/// proof, other script, commitment mismatch) is WALLET_NOT_OURS.
[[nodiscard]] core::Result<TxOutSecrets> unblind_output(
    const ECKey& blinding_key,
    const Commitment& asset_generator_bytes,
    const Commitment& value_commitment_bytes,
    std::span<const uint8_t> nonce_commitment,
    std::span<const uint8_t> rangeproof,
    std::span<const uint8_t> script_pubkey);

}  // namespace crypto
