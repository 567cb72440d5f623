#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "wallet/backend.h"
#include "wallet/descriptor.h"
#include "wallet/store.h"
#include "wallet/unblinder.h"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string_view>
#include <vector>

namespace wallet {

enum class SyncState : uint8_t {
    Idle,
    DiscoveringScripts,
    FetchingHistories,
    FetchingBodiesAndHeaders,
    Unblinding,
    ReconcilingReorg,
    Committing,
};

[[nodiscard]] std::string_view sync_state_name(SyncState state);

/// Counters describing the last pass, for logs and tests.
struct SyncStats {
    uint32_t scripts_scanned = 0;
    uint32_t scripts_changed = 0;
    uint32_t txs_fetched = 0;
    uint32_t headers_fetched = 0;
    uint32_t outputs_unblinded = 0;
    uint32_t txs_removed = 0;
    std::optional<uint32_t> reorg_height;
    int64_t duration_ms = 0;
};

// ---------------------------------------------------------------------------
// Syncer -- one synchronization pass against a backend
// ---------------------------------------------------------------------------
// The pass holds the store's write transaction from start to finish, so
// it is the only writer while it runs; readers keep seeing the previous
// snapshot. Any failure drops the transaction uncommitted and leaves the
// store exactly as it was. There is no retry inside the pass.
// ---------------------------------------------------------------------------
class Syncer {
public:
    static constexpr uint32_t DEFAULT_GAP_LIMIT = 20;

    Syncer(const ConfidentialDescriptor& descriptor, Store& store,
           BlockchainBackend& backend,
           uint32_t gap_limit = DEFAULT_GAP_LIMIT);

    /// Run one full pass. Returns true if the committed state changed.
    core::Result<bool> run();

    /// Refresh only the chain tip. Returns true if it changed. Nothing is
    /// written, and false is returned, when the new tip does not extend
    /// the stored headers; the next run() then reconciles the reorg.
    core::Result<bool> sync_tip();

    [[nodiscard]] SyncState state() const { return state_; }
    [[nodiscard]] const SyncStats& stats() const { return stats_; }

private:
    struct Pass;

    void transition(SyncState next);

    core::Result<void> discover_scripts(Pass& pass);
    core::Result<void> fetch_histories(Pass& pass);
    core::Result<void> fetch_bodies_and_headers(Pass& pass);
    core::Result<void> unblind_outputs(Pass& pass);
    core::Result<void> reconcile_reorg(Pass& pass);

    core::Result<primitives::script::Script> script_at(WalletCache& cache,
                                                       uint32_t index);
    core::Result<void> fetch_headers(WalletCache& cache,
                                     const std::set<uint32_t>& heights);

    const ConfidentialDescriptor& descriptor_;
    Store& store_;
    BlockchainBackend& backend_;
    uint32_t gap_limit_;
    Unblinder unblinder_;

    SyncState state_ = SyncState::Idle;
    SyncStats stats_;
};

} // namespace wallet
