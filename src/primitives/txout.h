#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <vector>

#include "core/serialize.h"
#include "primitives/confidential.h"
#include "primitives/script/script.h"

namespace primitives {

/// Per-output witness: the asset surjection proof and the range proof.
struct TxOutWitness {
    std::vector<uint8_t> surjection_proof;
    std::vector<uint8_t> rangeproof;

    [[nodiscard]] bool is_null() const {
        return surjection_proof.empty() && rangeproof.empty();
    }

    bool operator==(const TxOutWitness&) const = default;
};

/// A confidential transaction output.
struct TxOutput {
    ConfidentialAsset asset;
    ConfidentialValue value;
    ConfidentialNonce nonce;

    /// The locking script (scriptPubKey). Empty for fee outputs.
    script::Script script_pubkey;

    TxOutWitness witness;

    bool operator==(const TxOutput&) const = default;

    /// True when asset and value are both in the clear.
    [[nodiscard]] bool is_explicit() const {
        return asset.is_explicit() && value.is_explicit();
    }

    /// Serialize: asset | value | nonce | compact_size(script) | script.
    template<typename Stream>
    void serialize(Stream& s) const {
        asset.serialize(s);
        value.serialize(s);
        nonce.serialize(s);
        core::ser_write_vector(s, script_pubkey.data());
    }

    template<typename Stream>
    static TxOutput deserialize(Stream& s) {
        TxOutput output;
        output.asset = ConfidentialAsset::deserialize(s);
        output.value = ConfidentialValue::deserialize(s);
        output.nonce = ConfidentialNonce::deserialize(s);
        output.script_pubkey = script::Script(core::ser_read_vector(s));
        return output;
    }
};

} // namespace primitives
