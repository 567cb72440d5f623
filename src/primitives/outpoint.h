#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <string>

#include "core/serialize.h"
#include "core/types.h"

namespace primitives {

/// Output |n| of transaction |txid|. Keys the wallet's unblinded-output map
/// and the spent set built from wallet inputs.
struct OutPoint {
    static constexpr uint32_t NULL_INDEX = 0xFFFFFFFF;

    core::uint256 txid;
    uint32_t n = NULL_INDEX;

    OutPoint() = default;
    OutPoint(const core::uint256& txid_in, uint32_t n_in)
        : txid(txid_in), n(n_in) {}

    /// Coinbase inputs reference the zero hash at NULL_INDEX.
    [[nodiscard]] bool is_null() const {
        return n == NULL_INDEX && txid.is_zero();
    }

    bool operator==(const OutPoint&) const = default;
    auto operator<=>(const OutPoint&) const = default;

    /// "<txid>:<n>", the form used in store keys and log lines.
    [[nodiscard]] std::string to_string() const;

    // The index is written raw; TxInput owns the issuance/peg-in flag bits.
    template<typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_uint256(s, txid);
        core::ser_write_u32(s, n);
    }

    template<typename Stream>
    static OutPoint deserialize(Stream& s) {
        OutPoint op;
        op.txid = core::ser_read_uint256(s);
        op.n = core::ser_read_u32(s);
        return op;
    }
};

} // namespace primitives
