#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "primitives/block_header.h"
#include "primitives/script/script.h"
#include "primitives/transaction.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wallet {

/// The block the wallet believes is the chain head.
struct ChainTip {
    uint32_t height = 0;
    core::uint256 hash;
    uint32_t timestamp = 0;

    bool operator==(const ChainTip&) const = default;
};

/// One entry of a script's history. No height means unconfirmed.
struct HistoryEntry {
    core::uint256 txid;
    std::optional<uint32_t> height;

    bool operator==(const HistoryEntry&) const = default;
};

/// Opaque server-side fingerprint of a script's history.
using StatusFingerprint = std::string;

// ---------------------------------------------------------------------------
// BlockchainBackend -- untrusted source of chain data
// ---------------------------------------------------------------------------
// Every call may fail with a transport error (NETWORK_*). A reply that is
// present but malformed or inconsistent is reported as NETWORK_PROTOCOL.
// Implementations are not required to be thread-safe; the syncer drives
// one backend from one thread.
// ---------------------------------------------------------------------------
class BlockchainBackend {
public:
    virtual ~BlockchainBackend() = default;

    /// Current chain head.
    virtual core::Result<ChainTip> tip() = 0;

    /// Watch @p script and return its status, or nullopt if it has no
    /// history. Repeated calls for the same script must not fail.
    virtual core::Result<std::optional<StatusFingerprint>> subscribe_or_poll(
        const primitives::script::Script& script) = 0;

    /// Histories of @p scripts, one list per script, in request order.
    virtual core::Result<std::vector<std::vector<HistoryEntry>>> histories(
        const std::vector<primitives::script::Script>& scripts) = 0;

    /// Raw transactions for @p txids, in request order. Fails as a whole
    /// if any id is unknown.
    virtual core::Result<std::vector<primitives::Transaction>> transactions(
        const std::vector<core::uint256>& txids) = 0;

    /// Block headers at @p heights, in request order.
    virtual core::Result<std::vector<primitives::BlockHeader>> headers(
        const std::vector<uint32_t>& heights) = 0;

    /// Submit @p tx to the network and return the txid the server reports.
    virtual core::Result<core::uint256> broadcast(
        const primitives::Transaction& tx) = 0;
};

// ---------------------------------------------------------------------------
// Error classification
// ---------------------------------------------------------------------------

/// Outage-type failure; the caller may retry the pass later.
[[nodiscard]] inline bool is_transport_error(const core::Error& err) {
    return core::is_transport_error(err.code());
}

/// The backend answered with inconsistent data.
[[nodiscard]] inline bool is_protocol_violation(const core::Error& err) {
    return err.code() == core::ErrorCode::NETWORK_PROTOCOL;
}

/// Shorthand for building a NETWORK_PROTOCOL error.
[[nodiscard]] inline core::Error protocol_violation(std::string msg) {
    return core::Error(core::ErrorCode::NETWORK_PROTOCOL, std::move(msg));
}

} // namespace wallet
