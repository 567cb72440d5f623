#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "crypto/confidential.h"
#include "crypto/secp256k1.h"
#include "primitives/outpoint.h"
#include "primitives/transaction.h"
#include "primitives/txout.h"
#include "wallet/descriptor.h"

#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace wallet {

/// Recover (asset, value, blinding factors) of @p output with
/// @p blinding_key. Explicit outputs open with zero blinding factors and
/// need no key. WALLET_NOT_OURS when the output does not open; this is
/// the expected result for outputs paying other parties.
[[nodiscard]] core::Result<crypto::TxOutSecrets> unblind(
    const primitives::TxOutput& output, const crypto::ECKey& blinding_key);

// ---------------------------------------------------------------------------
// Unblinder -- applies a descriptor's blinding keys to whole transactions
// ---------------------------------------------------------------------------
class Unblinder {
public:
    explicit Unblinder(const ConfidentialDescriptor& descriptor)
        : descriptor_(descriptor) {}

    /// Unblind every output of @p tx whose script is in @p owned.
    /// Outputs that do not open are skipped. Fails only when a blinding
    /// key cannot be derived.
    core::Result<std::vector<std::pair<primitives::OutPoint,
                                       crypto::TxOutSecrets>>>
    unblind_transaction(
        const primitives::Transaction& tx,
        const std::map<primitives::script::Script, uint32_t>& owned) const;

    [[nodiscard]] size_t not_ours_count() const { return not_ours_; }

private:
    const ConfidentialDescriptor& descriptor_;
    mutable size_t not_ours_ = 0;
};

} // namespace wallet
