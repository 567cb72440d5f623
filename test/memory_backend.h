#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// In-memory BlockchainBackend for the wallet tests.

#include "core/error.h"
#include "core/types.h"
#include "crypto/sha256.h"
#include "primitives/block_header.h"
#include "primitives/transaction.h"
#include "wallet/backend.h"

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace wallet {

// ---------------------------------------------------------------------------
// MemoryBackend -- a chain of headers plus a transaction table
// ---------------------------------------------------------------------------
// Blocks carry no transactions; each known transaction records the height
// it is confirmed at (or none while in the mempool). A script's history
// is every transaction that pays it or spends one of its outputs.
//
// Faults: fail_next() makes the next call of one operation fail, and
// set_offline() fails every call. lie_* switches make the replies
// inconsistent so the protocol-violation paths can be exercised.
// ---------------------------------------------------------------------------
class MemoryBackend final : public BlockchainBackend {
public:
    static constexpr uint32_t GENESIS_TIME = 1'700'000'000;
    static constexpr uint32_t BLOCK_INTERVAL = 60;

    enum class Op { Tip, Subscribe, Histories, Transactions, Headers, Broadcast };

    struct Calls {
        uint32_t tip = 0;
        uint32_t subscribe = 0;
        uint32_t histories = 0;
        uint32_t transactions = 0;
        uint32_t headers = 0;
        uint32_t broadcast = 0;

        [[nodiscard]] uint32_t total() const {
            return tip + subscribe + histories + transactions + headers + broadcast;
        }
    };

    MemoryBackend() { chain_.push_back(make_header(0, core::uint256{})); }

    // -- Chain control ------------------------------------------------------

    [[nodiscard]] uint32_t height() const {
        return static_cast<uint32_t>(chain_.size() - 1);
    }

    [[nodiscard]] const primitives::BlockHeader& header_at(uint32_t h) const {
        return chain_.at(h);
    }

    /// Extend the active chain by @p n blocks.
    void mine(uint32_t n = 1) {
        for (uint32_t i = 0; i < n; ++i) {
            chain_.push_back(make_header(height() + 1, chain_.back().hash()));
        }
    }

    /// Mine up to @p h if needed.
    void mine_to(uint32_t h) {
        if (h > height()) mine(h - height());
    }

    /// Confirm @p tx at @p h, mining up to it first.
    void confirm(const primitives::Transaction& tx, uint32_t h) {
        mine_to(h);
        txs_[tx.txid()] = Placement{tx, h};
    }

    void add_to_mempool(const primitives::Transaction& tx) {
        txs_[tx.txid()] = Placement{tx, std::nullopt};
    }

    /// Forget @p txid entirely, as if it was double spent.
    void remove(const core::uint256& txid) { txs_.erase(txid); }

    /// Replace every block from @p fork_height upwards with a new branch
    /// of @p new_length blocks. Transactions confirmed in replaced blocks
    /// return to the mempool, or vanish when @p drop_txs is set.
    void reorg(uint32_t fork_height, uint32_t new_length, bool drop_txs) {
        ++branch_;
        chain_.resize(fork_height);
        for (uint32_t i = 0; i < new_length; ++i) {
            chain_.push_back(make_header(height() + 1, chain_.back().hash()));
        }
        for (auto it = txs_.begin(); it != txs_.end();) {
            auto& placed = it->second;
            if (placed.height && *placed.height >= fork_height) {
                if (drop_txs) {
                    it = txs_.erase(it);
                    continue;
                }
                placed.height.reset();
            }
            ++it;
        }
    }

    // -- Fault injection ----------------------------------------------------

    void fail_next(Op op, core::ErrorCode code = core::ErrorCode::NETWORK_ERROR) {
        failures_[op] = code;
    }

    void set_offline(bool offline) { offline_ = offline; }

    /// Histories report every confirmation one block above the tip.
    void lie_about_heights(bool on) { lie_heights_ = on; }

    /// transactions() drops the last requested body.
    void lie_about_tx_count(bool on) { lie_tx_count_ = on; }

    /// headers() answers with the header one block below the requested one.
    void lie_about_header_heights(bool on) { lie_header_heights_ = on; }

    [[nodiscard]] const Calls& calls() const { return calls_; }
    void reset_calls() { calls_ = Calls{}; }

    [[nodiscard]] const std::vector<core::uint256>& broadcasts() const {
        return broadcasts_;
    }

    // -- BlockchainBackend --------------------------------------------------

    core::Result<ChainTip> tip() override {
        ++calls_.tip;
        CTW_TRY_VOID(check(Op::Tip));
        const auto& head = chain_.back();
        ChainTip t;
        t.height = head.height;
        t.hash = head.hash();
        t.timestamp = head.timestamp;
        return t;
    }

    core::Result<std::optional<StatusFingerprint>> subscribe_or_poll(
        const primitives::script::Script& script) override {
        ++calls_.subscribe;
        CTW_TRY_VOID(check(Op::Subscribe));
        auto history = history_of(script);
        if (history.empty()) return std::optional<StatusFingerprint>{};

        std::string text;
        for (const auto& entry : history) {
            text += entry.txid.to_hex() + ":" +
                    (entry.height ? std::to_string(*entry.height) : "0") + ":";
        }
        auto digest = crypto::sha256(text.data(), text.size());
        return std::optional<StatusFingerprint>(digest.to_hex());
    }

    core::Result<std::vector<std::vector<HistoryEntry>>> histories(
        const std::vector<primitives::script::Script>& scripts) override {
        ++calls_.histories;
        CTW_TRY_VOID(check(Op::Histories));
        std::vector<std::vector<HistoryEntry>> out;
        out.reserve(scripts.size());
        for (const auto& script : scripts) {
            auto list = history_of(script);
            if (lie_heights_) {
                for (auto& entry : list) {
                    if (entry.height) entry.height = height() + 1;
                }
            }
            out.push_back(std::move(list));
        }
        return out;
    }

    core::Result<std::vector<primitives::Transaction>> transactions(
        const std::vector<core::uint256>& txids) override {
        ++calls_.transactions;
        CTW_TRY_VOID(check(Op::Transactions));
        std::vector<primitives::Transaction> out;
        out.reserve(txids.size());
        for (const auto& txid : txids) {
            auto it = txs_.find(txid);
            if (it == txs_.end()) {
                return core::Error(core::ErrorCode::RPC_ERROR,
                                   "unknown transaction " + txid.to_hex());
            }
            out.push_back(it->second.tx);
        }
        if (lie_tx_count_ && !out.empty()) out.pop_back();
        return out;
    }

    core::Result<std::vector<primitives::BlockHeader>> headers(
        const std::vector<uint32_t>& heights) override {
        ++calls_.headers;
        CTW_TRY_VOID(check(Op::Headers));
        std::vector<primitives::BlockHeader> out;
        out.reserve(heights.size());
        for (uint32_t h : heights) {
            if (h > height()) {
                return core::Error(core::ErrorCode::RPC_ERROR,
                                   "height " + std::to_string(h) + " out of range");
            }
            uint32_t served = (lie_header_heights_ && h > 0) ? h - 1 : h;
            out.push_back(chain_[served]);
        }
        return out;
    }

    core::Result<core::uint256> broadcast(const primitives::Transaction& tx) override {
        ++calls_.broadcast;
        CTW_TRY_VOID(check(Op::Broadcast));
        add_to_mempool(tx);
        broadcasts_.push_back(tx.txid());
        return tx.txid();
    }

private:
    struct Placement {
        primitives::Transaction tx;
        std::optional<uint32_t> height;
    };

    primitives::BlockHeader make_header(uint32_t h, const core::uint256& prev) const {
        primitives::BlockHeader header;
        header.prev_hash = prev;
        header.height = h;
        header.timestamp = GENESIS_TIME + h * BLOCK_INTERVAL;
        std::string tag = "block " + std::to_string(h) + " branch " +
                          std::to_string(branch_);
        header.merkle_root = crypto::sha256(tag.data(), tag.size());
        return header;
    }

    core::Result<void> check(Op op) {
        if (offline_) {
            return core::Error(core::ErrorCode::NETWORK_REFUSED, "backend offline");
        }
        auto it = failures_.find(op);
        if (it != failures_.end()) {
            auto code = it->second;
            failures_.erase(it);
            return core::Error(code, "injected failure");
        }
        return core::make_ok();
    }

    bool touches(const primitives::Transaction& tx,
                 const primitives::script::Script& script) const {
        for (const auto& out : tx.vout()) {
            if (out.script_pubkey == script) return true;
        }
        for (const auto& in : tx.vin()) {
            auto prev = txs_.find(in.prevout.txid);
            if (prev == txs_.end()) continue;
            const auto& outs = prev->second.tx.vout();
            if (in.prevout.n < outs.size() &&
                outs[in.prevout.n].script_pubkey == script) {
                return true;
            }
        }
        return false;
    }

    /// Confirmed entries by height, then the mempool.
    std::vector<HistoryEntry> history_of(const primitives::script::Script& script) const {
        std::vector<HistoryEntry> list;
        for (const auto& [txid, placed] : txs_) {
            if (touches(placed.tx, script)) list.push_back({txid, placed.height});
        }
        std::stable_sort(list.begin(), list.end(),
                         [](const HistoryEntry& a, const HistoryEntry& b) {
                             uint32_t ha = a.height.value_or(UINT32_MAX);
                             uint32_t hb = b.height.value_or(UINT32_MAX);
                             return ha < hb;
                         });
        return list;
    }

    std::vector<primitives::BlockHeader> chain_;
    std::map<core::uint256, Placement> txs_;
    uint32_t branch_ = 0;

    std::map<Op, core::ErrorCode> failures_;
    bool offline_ = false;
    bool lie_heights_ = false;
    bool lie_tx_count_ = false;
    bool lie_header_heights_ = false;

    Calls calls_;
    std::vector<core::uint256> broadcasts_;
};

} // namespace wallet
