// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/syncer.h"

#include "core/logging.h"
#include "core/time.h"
#include "crypto/bip32.h"

#include <algorithm>
#include <iterator>
#include <string>

namespace wallet {

using primitives::script::Script;
using HeightMap = std::map<core::uint256, std::optional<uint32_t>>;

std::string_view sync_state_name(SyncState state) {
    switch (state) {
    case SyncState::Idle:                     return "Idle";
    case SyncState::DiscoveringScripts:       return "DiscoveringScripts";
    case SyncState::FetchingHistories:        return "FetchingHistories";
    case SyncState::FetchingBodiesAndHeaders: return "FetchingBodiesAndHeaders";
    case SyncState::Unblinding:               return "Unblinding";
    case SyncState::ReconcilingReorg:         return "ReconcilingReorg";
    case SyncState::Committing:               return "Committing";
    }
    return "Unknown";
}

// Working set of one pass. Everything lands in txn.cache() and only
// becomes visible if the pass reaches commit.
struct Syncer::Pass {
    Store::WriteTxn& txn;
    WalletCache& cache;
    const WalletCache& base;

    std::map<Script, uint32_t> owned;       // every scanned script
    std::vector<Script> with_history;       // scanned scripts with a status
    std::vector<Script> changed;            // status differs from stored
    ChainTip tip;
    HeightMap seen;                         // histories of changed scripts
};

namespace {

std::string height_str(const std::optional<uint32_t>& h) {
    return h ? std::to_string(*h) : std::string("mempool");
}

// Flatten per-script histories into txid -> height, checking the batch
// shape and that nothing is confirmed above @p tip.
core::Result<HeightMap> merge_histories(
    const std::vector<std::vector<HistoryEntry>>& lists, size_t expected,
    const ChainTip& tip) {
    if (lists.size() != expected) {
        return protocol_violation(
            "histories returned " + std::to_string(lists.size()) +
            " lists for " + std::to_string(expected) + " scripts");
    }

    HeightMap merged;
    for (const auto& list : lists) {
        for (const auto& entry : list) {
            if (entry.height && *entry.height > tip.height) {
                return protocol_violation(
                    "history height " + std::to_string(*entry.height) +
                    " above tip " + std::to_string(tip.height));
            }
            auto [it, inserted] = merged.emplace(entry.txid, entry.height);
            if (!inserted && it->second != entry.height) {
                return protocol_violation(
                    "conflicting heights for " + entry.txid.to_hex());
            }
        }
    }
    return merged;
}

} // anonymous namespace

Syncer::Syncer(const ConfidentialDescriptor& descriptor, Store& store,
               BlockchainBackend& backend, uint32_t gap_limit)
    : descriptor_(descriptor),
      store_(store),
      backend_(backend),
      gap_limit_(gap_limit == 0 ? 1 : gap_limit),
      unblinder_(descriptor) {}

void Syncer::transition(SyncState next) {
    LOG_DEBUG(core::LogCategory::SYNC,
              std::string(sync_state_name(state_)) + " -> " +
              std::string(sync_state_name(next)));
    state_ = next;
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------

core::Result<bool> Syncer::run() {
    stats_ = SyncStats{};
    state_ = SyncState::Idle;
    core::StopWatch timer;

    CTW_TRY_ASSIGN(txn, store_.write());
    Pass pass{txn, txn.cache(), txn.base(), {}, {}, {}, {}, {}};

    auto outcome = [&]() -> core::Result<bool> {
        CTW_TRY_VOID(discover_scripts(pass));
        CTW_TRY_VOID(fetch_histories(pass));
        CTW_TRY_VOID(fetch_bodies_and_headers(pass));
        CTW_TRY_VOID(unblind_outputs(pass));
        CTW_TRY_VOID(reconcile_reorg(pass));

        transition(SyncState::Committing);
        if (pass.cache == pass.base) return false;
        CTW_TRY_VOID(txn.commit());
        return true;
    }();

    transition(SyncState::Idle);
    stats_.duration_ms = timer.elapsed_ms();

    if (!outcome) {
        const auto& err = outcome.error();
        if (is_protocol_violation(err)) {
            LOG_WARN(core::LogCategory::SYNC,
                     "sync aborted, backend protocol violation: " +
                     err.message());
        } else {
            LOG_INFO(core::LogCategory::SYNC,
                     "sync aborted: " + err.format());
        }
        return outcome;
    }

    LOG_INFO(core::LogCategory::SYNC,
             "sync pass done: tip " + std::to_string(pass.tip.height) +
             ", scanned " + std::to_string(stats_.scripts_scanned) +
             ", changed " + std::to_string(stats_.scripts_changed) +
             ", new txs " + std::to_string(stats_.txs_fetched) +
             ", removed " + std::to_string(stats_.txs_removed) +
             (outcome.value() ? ", committed" : ", no change") + " in " +
             std::to_string(stats_.duration_ms) + "ms");
    return outcome;
}

core::Result<bool> Syncer::sync_tip() {
    CTW_TRY_ASSIGN(txn, store_.write());
    CTW_TRY_ASSIGN(tip, backend_.tip());

    auto& cache = txn.cache();
    if (cache.tip == tip) return false;

    auto refuse = [&](const std::string& why) {
        LOG_WARN(core::LogCategory::SYNC,
                 "tip " + std::to_string(tip.height) + " not applied: " +
                 why + ", a full sync is needed");
        return false;
    };

    if (cache.tip && tip.height < cache.tip->height) {
        return refuse("chain got shorter");
    }
    for (const auto& [txid, height] : cache.heights) {
        if (height && *height > tip.height) {
            return refuse("confirmed tx " + txid.to_hex() + " is above it");
        }
    }

    // Headers chain together: if the highest stored one at or below the
    // new tip is still on the active chain, so is every lower one.
    auto above = cache.headers.upper_bound(tip.height);
    if (above != cache.headers.begin()) {
        const auto& [height, info] = *std::prev(above);
        core::uint256 active = tip.hash;
        if (height != tip.height) {
            std::vector<uint32_t> one{height};
            CTW_TRY_ASSIGN(got, backend_.headers(one));
            if (got.size() != 1 || got[0].height != height) {
                return protocol_violation("header reply does not match "
                                          "requested height");
            }
            active = got[0].hash();
        }
        if (active != info.hash) {
            return refuse("block " + std::to_string(height) +
                          " was reorganized");
        }
    }

    cache.tip = tip;
    cache.headers[tip.height] = HeaderInfo{tip.hash, tip.timestamp};
    CTW_TRY_VOID(txn.commit());
    LOG_INFO(core::LogCategory::SYNC,
             "tip updated to " + std::to_string(tip.height));
    return true;
}

// ---------------------------------------------------------------------------
// Stages
// ---------------------------------------------------------------------------

core::Result<void> Syncer::discover_scripts(Pass& pass) {
    transition(SyncState::DiscoveringScripts);
    auto& cache = pass.cache;

    uint64_t scan_end = static_cast<uint64_t>(cache.next_index()) + gap_limit_;
    for (uint32_t i = 0; i < scan_end; ++i) {
        if (i >= crypto::ExtendedPubKey::HARDENED_BIT) break;

        CTW_TRY_ASSIGN(script, script_at(cache, i));
        pass.owned[script] = i;

        CTW_TRY_ASSIGN(status, backend_.subscribe_or_poll(script));
        ++stats_.scripts_scanned;

        auto stored = cache.script_status.find(script);
        if (status) {
            pass.with_history.push_back(script);
            scan_end = std::max<uint64_t>(scan_end,
                                           static_cast<uint64_t>(i) + 1 +
                                           gap_limit_);
            if (!cache.last_index || i > *cache.last_index) {
                cache.last_index = i;
            }
            if (stored == cache.script_status.end() ||
                stored->second != *status) {
                pass.changed.push_back(script);
                cache.script_status[script] = *status;
            }
        } else if (stored != cache.script_status.end()) {
            pass.changed.push_back(script);
            cache.script_status.erase(stored);
        }
    }

    stats_.scripts_changed = static_cast<uint32_t>(pass.changed.size());
    LOG_DEBUG(core::LogCategory::SYNC,
              "scanned " + std::to_string(stats_.scripts_scanned) +
              " scripts, " + std::to_string(pass.with_history.size()) +
              " with history, " + std::to_string(pass.changed.size()) +
              " changed");
    return core::make_ok();
}

core::Result<void> Syncer::fetch_histories(Pass& pass) {
    transition(SyncState::FetchingHistories);

    // Histories first, then the tip: anything confirmed in the histories
    // must then be at or below the tip.
    std::vector<std::vector<HistoryEntry>> lists;
    if (!pass.changed.empty()) {
        CTW_TRY_ASSIGN(fetched, backend_.histories(pass.changed));
        lists = std::move(fetched);
    }
    CTW_TRY_ASSIGN(tip, backend_.tip());
    pass.tip = tip;

    CTW_TRY_ASSIGN(seen, merge_histories(lists, pass.changed.size(), tip));
    pass.seen = std::move(seen);
    return core::make_ok();
}

core::Result<void> Syncer::fetch_bodies_and_headers(Pass& pass) {
    transition(SyncState::FetchingBodiesAndHeaders);
    auto& cache = pass.cache;

    std::vector<core::uint256> missing;
    std::set<uint32_t> heights;
    for (const auto& [txid, height] : pass.seen) {
        if (cache.txs.find(txid) == cache.txs.end()) missing.push_back(txid);
        if (height && cache.headers.find(*height) == cache.headers.end()) {
            heights.insert(*height);
        }
    }

    if (!missing.empty()) {
        CTW_TRY_ASSIGN(txs, backend_.transactions(missing));
        if (txs.size() != missing.size()) {
            return protocol_violation(
                "asked for " + std::to_string(missing.size()) +
                " transactions, got " + std::to_string(txs.size()));
        }
        for (size_t i = 0; i < txs.size(); ++i) {
            if (txs[i].txid() != missing[i]) {
                return protocol_violation(
                    "transaction " + missing[i].to_hex() +
                    " came back as " + txs[i].txid().to_hex());
            }
            cache.txs.emplace(missing[i], std::move(txs[i]));
        }
        stats_.txs_fetched += static_cast<uint32_t>(missing.size());
    }

    for (const auto& [txid, height] : pass.seen) {
        auto& slot = cache.heights[txid];
        if (slot != height) {
            LOG_DEBUG(core::LogCategory::SYNC,
                      "tx " + txid.to_hex() + " at " + height_str(height));
        }
        slot = height;
    }

    return fetch_headers(cache, heights);
}

core::Result<void> Syncer::unblind_outputs(Pass& pass) {
    transition(SyncState::Unblinding);
    auto& cache = pass.cache;

    for (const auto& [txid, height] : pass.seen) {
        const auto& tx = cache.txs.at(txid);
        CTW_TRY_ASSIGN(found, unblinder_.unblind_transaction(tx, pass.owned));
        for (auto& [outpoint, secrets] : found) {
            if (cache.unblinded.emplace(outpoint, std::move(secrets)).second) {
                ++stats_.outputs_unblinded;
            }
        }
    }
    return core::make_ok();
}

core::Result<void> Syncer::reconcile_reorg(Pass& pass) {
    transition(SyncState::ReconcilingReorg);
    auto& cache = pass.cache;
    const auto& base = pass.base;
    const ChainTip& tip = pass.tip;

    std::optional<uint32_t> fork;
    if (base.tip && !(*base.tip == tip)) {
        std::vector<uint32_t> shared;
        for (const auto& [height, info] : base.headers) {
            if (height > tip.height) {
                if (!fork || height < *fork) fork = height;
            } else {
                shared.push_back(height);
            }
        }
        for (const auto& [txid, height] : base.heights) {
            if (height && *height > tip.height && (!fork || *height < *fork)) {
                fork = *height;
            }
        }

        // Headers chain together, so if the highest shared height still
        // matches, every lower one does too.
        if (!shared.empty()) {
            std::vector<uint32_t> one{shared.back()};
            CTW_TRY_ASSIGN(top, backend_.headers(one));
            if (top.size() != 1 || top[0].height != one[0]) {
                return protocol_violation("header reply does not match "
                                          "requested height");
            }
            ++stats_.headers_fetched;
            if (top[0].hash() != base.headers.at(one[0]).hash) {
                CTW_TRY_ASSIGN(all, backend_.headers(shared));
                if (all.size() != shared.size()) {
                    return protocol_violation("header batch length mismatch");
                }
                stats_.headers_fetched += static_cast<uint32_t>(all.size());
                for (size_t i = 0; i < all.size(); ++i) {
                    if (all[i].height != shared[i]) {
                        return protocol_violation(
                            "header at " + std::to_string(all[i].height) +
                            " returned for height " +
                            std::to_string(shared[i]));
                    }
                    if (all[i].hash() != base.headers.at(shared[i]).hash) {
                        if (!fork || shared[i] < *fork) fork = shared[i];
                        break;
                    }
                }
            }
        }
    }

    if (fork) {
        uint32_t h = *fork;
        stats_.reorg_height = h;
        LOG_WARN(core::LogCategory::SYNC,
                 "reorg detected at height " + std::to_string(h) +
                 ", new tip " + std::to_string(tip.height));

        cache.headers.erase(cache.headers.lower_bound(h), cache.headers.end());

        // Ask again about every script with history; this is the
        // authoritative view after the fork.
        std::vector<std::vector<HistoryEntry>> lists;
        if (!pass.with_history.empty()) {
            CTW_TRY_ASSIGN(fetched, backend_.histories(pass.with_history));
            lists = std::move(fetched);
        }
        CTW_TRY_ASSIGN(current, merge_histories(lists,
                                                pass.with_history.size(), tip));

        for (auto it = cache.heights.begin(); it != cache.heights.end();) {
            const auto txid = it->first;
            if (!it->second || *it->second < h) {
                ++it;
                continue;
            }
            auto now = current.find(txid);
            if (now != current.end()) {
                LOG_DEBUG(core::LogCategory::SYNC,
                          "tx " + txid.to_hex() + " moved to " +
                          height_str(now->second));
                it->second = now->second;
                ++it;
                continue;
            }

            LOG_DEBUG(core::LogCategory::SYNC,
                      "tx " + txid.to_hex() + " vanished in reorg");
            cache.txs.erase(txid);
            auto first = cache.unblinded.lower_bound(
                primitives::OutPoint(txid, 0));
            auto last = first;
            while (last != cache.unblinded.end() && last->first.txid == txid) {
                ++last;
            }
            cache.unblinded.erase(first, last);
            it = cache.heights.erase(it);
            ++stats_.txs_removed;
        }

        // Transactions that reappeared at new heights may need bodies,
        // headers and unblinding; run them through the same stages.
        pass.seen = std::move(current);
        CTW_TRY_VOID(fetch_bodies_and_headers(pass));
        CTW_TRY_VOID(unblind_outputs(pass));
        transition(SyncState::ReconcilingReorg);
    }

    cache.tip = tip;
    cache.headers[tip.height] = HeaderInfo{tip.hash, tip.timestamp};
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

core::Result<Script> Syncer::script_at(WalletCache& cache, uint32_t index) {
    auto it = cache.scripts.find(index);
    if (it != cache.scripts.end()) return it->second;

    CTW_TRY_ASSIGN(script, descriptor_.script_pubkey(index));
    cache.scripts.emplace(index, script);
    return script;
}

core::Result<void> Syncer::fetch_headers(WalletCache& cache,
                                         const std::set<uint32_t>& heights) {
    if (heights.empty()) return core::make_ok();

    std::vector<uint32_t> wanted(heights.begin(), heights.end());
    CTW_TRY_ASSIGN(headers, backend_.headers(wanted));
    if (headers.size() != wanted.size()) {
        return protocol_violation(
            "asked for " + std::to_string(wanted.size()) +
            " headers, got " + std::to_string(headers.size()));
    }
    for (size_t i = 0; i < headers.size(); ++i) {
        if (headers[i].height != wanted[i]) {
            return protocol_violation(
                "header at " + std::to_string(headers[i].height) +
                " returned for height " + std::to_string(wanted[i]));
        }
        cache.headers[wanted[i]] =
            HeaderInfo{headers[i].hash(), headers[i].timestamp};
    }
    stats_.headers_fetched += static_cast<uint32_t>(headers.size());
    return core::make_ok();
}

} // namespace wallet
