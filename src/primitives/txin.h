#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <vector>

#include "core/serialize.h"
#include "primitives/confidential.h"
#include "primitives/outpoint.h"

namespace primitives {

/// Asset issuance or reissuance attached to an input.
struct AssetIssuance {
    core::uint256 asset_blinding_nonce;
    core::uint256 asset_entropy;
    ConfidentialValue amount;
    ConfidentialValue inflation_keys;

    [[nodiscard]] bool is_null() const {
        return amount.is_null() && inflation_keys.is_null();
    }

    bool operator==(const AssetIssuance&) const = default;

    template<typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_uint256(s, asset_blinding_nonce);
        core::ser_write_uint256(s, asset_entropy);
        amount.serialize(s);
        inflation_keys.serialize(s);
    }

    template<typename Stream>
    static AssetIssuance deserialize(Stream& s) {
        AssetIssuance iss;
        iss.asset_blinding_nonce = core::ser_read_uint256(s);
        iss.asset_entropy = core::ser_read_uint256(s);
        iss.amount = ConfidentialValue::deserialize(s);
        iss.inflation_keys = ConfidentialValue::deserialize(s);
        return iss;
    }
};

/// Witness data for one input. Serialized in the transaction's witness
/// section, never hashed into the txid.
struct TxInWitness {
    std::vector<uint8_t> issuance_amount_rangeproof;
    std::vector<uint8_t> inflation_keys_rangeproof;
    std::vector<std::vector<uint8_t>> script_witness;
    std::vector<std::vector<uint8_t>> pegin_witness;

    [[nodiscard]] bool is_null() const {
        return issuance_amount_rangeproof.empty() &&
               inflation_keys_rangeproof.empty() &&
               script_witness.empty() && pegin_witness.empty();
    }

    bool operator==(const TxInWitness&) const = default;
};

/// A transaction input, referencing a previous output and providing the
/// unlocking script (and optionally witness data) to spend it.
struct TxInput {
    /// Indicates the input is final (no relative lock-time, no RBF).
    static constexpr uint32_t SEQUENCE_FINAL = 0xFFFFFFFF;

    /// Outpoint index flags used on the wire.
    static constexpr uint32_t OUTPOINT_ISSUANCE_FLAG = (1u << 31);
    static constexpr uint32_t OUTPOINT_PEGIN_FLAG    = (1u << 30);
    static constexpr uint32_t OUTPOINT_INDEX_MASK    = 0x3fffffff;

    /// The output being spent, flags stripped.
    OutPoint prevout;

    /// The unlocking script (scriptSig).
    std::vector<uint8_t> script_sig;

    uint32_t sequence = SEQUENCE_FINAL;

    bool is_pegin = false;
    AssetIssuance issuance;
    TxInWitness witness;

    TxInput() = default;
    TxInput(OutPoint prevout_in, std::vector<uint8_t> script_sig_in = {},
            uint32_t sequence_in = SEQUENCE_FINAL)
        : prevout(prevout_in), script_sig(std::move(script_sig_in)),
          sequence(sequence_in) {}

    [[nodiscard]] bool has_issuance() const { return !issuance.is_null(); }

    bool operator==(const TxInput&) const = default;

    /// Serialize the base input (without witness).
    ///
    /// Wire format:
    ///   prevout (36 bytes, flags in index) | compact_size(script_sig) |
    ///   script_sig | sequence (4 bytes) | [issuance]
    template<typename Stream>
    void serialize(Stream& s) const {
        OutPoint wire = prevout;
        if (!prevout.is_null()) {
            if (has_issuance()) wire.n |= OUTPOINT_ISSUANCE_FLAG;
            if (is_pegin) wire.n |= OUTPOINT_PEGIN_FLAG;
        }
        wire.serialize(s);
        core::ser_write_vector(s, script_sig);
        core::ser_write_u32(s, sequence);
        if (has_issuance()) {
            issuance.serialize(s);
        }
    }

    /// Deserialize the base input (without witness).
    template<typename Stream>
    static TxInput deserialize(Stream& s) {
        TxInput input;
        input.prevout = OutPoint::deserialize(s);
        bool issuance = false;
        if (!input.prevout.is_null()) {
            issuance = (input.prevout.n & OUTPOINT_ISSUANCE_FLAG) != 0;
            input.is_pegin = (input.prevout.n & OUTPOINT_PEGIN_FLAG) != 0;
            input.prevout.n &= OUTPOINT_INDEX_MASK;
        }
        input.script_sig = core::ser_read_vector(s);
        input.sequence = core::ser_read_u32(s);
        if (issuance) {
            input.issuance = AssetIssuance::deserialize(s);
        }
        return input;
    }
};

} // namespace primitives
