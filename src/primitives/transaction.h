#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "core/error.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "core/types.h"
#include "primitives/txin.h"
#include "primitives/txout.h"

namespace primitives {

/// An Elements transaction. Immutable once built; the txid is computed
/// at construction.
///
///   version:i32  flags:u8  vin  vout  locktime:u32  [witness section]
///
/// Flag bit 0 announces the witness section: per input the issuance
/// proofs, script witness and peg-in witness, then per output the
/// surjection and range proofs. The txid hashes the serialization with
/// flags 0 and the witness section left out.
class Transaction {
public:
    Transaction() : Transaction({}, {}) {}
    Transaction(std::vector<TxInput> vin, std::vector<TxOutput> vout,
                int32_t version = 2, uint32_t locktime = 0);

    int32_t version() const { return version_; }
    uint32_t locktime() const { return locktime_; }
    const std::vector<TxInput>& vin() const { return vin_; }
    const std::vector<TxOutput>& vout() const { return vout_; }
    const core::uint256& txid() const { return txid_; }

    bool is_coinbase() const {
        return vin_.size() == 1 && vin_[0].prevout.is_null();
    }
    bool has_witness() const;

    /// Sum of the explicit fee outputs paid in |policy_asset|.
    uint64_t fee(const core::uint256& policy_asset) const;

    std::vector<uint8_t> serialize() const;
    std::string to_hex() const;

    /// Whole-buffer parse; bytes left after the transaction are an error.
    static core::Result<Transaction> from_bytes(std::span<const uint8_t> bytes);
    static core::Result<Transaction> from_hex(std::string_view hex);

    bool operator==(const Transaction& o) const {
        return txid_ == o.txid_ && vin_ == o.vin_ && vout_ == o.vout_;
    }

    template <typename Stream>
    void serialize_to(Stream& s, bool with_witness) const;

private:
    int32_t version_;
    std::vector<TxInput> vin_;
    std::vector<TxOutput> vout_;
    uint32_t locktime_;
    core::uint256 txid_;
};

template <typename Stream>
void Transaction::serialize_to(Stream& s, bool with_witness) const {
    const bool witness = with_witness && has_witness();
    core::ser_write_i32(s, version_);
    core::ser_write_u8(s, witness ? 1 : 0);
    core::ser_write_compact_size(s, vin_.size());
    for (const auto& in : vin_) in.serialize(s);
    core::ser_write_compact_size(s, vout_.size());
    for (const auto& out : vout_) out.serialize(s);
    core::ser_write_u32(s, locktime_);
    if (!witness) return;

    for (const auto& in : vin_) {
        core::ser_write_vector(s, in.witness.issuance_amount_rangeproof);
        core::ser_write_vector(s, in.witness.inflation_keys_rangeproof);
        core::ser_write_stack(s, in.witness.script_witness);
        core::ser_write_stack(s, in.witness.pegin_witness);
    }
    for (const auto& out : vout_) {
        core::ser_write_vector(s, out.witness.surjection_proof);
        core::ser_write_vector(s, out.witness.rangeproof);
    }
}

} // namespace primitives
