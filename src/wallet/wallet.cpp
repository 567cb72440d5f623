// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/wallet.h"

#include "core/logging.h"
#include "wallet/syncer.h"

#include <algorithm>
#include <set>

namespace wallet {

namespace {

/// Outpoints consumed by any known transaction.
std::set<primitives::OutPoint> spent_outpoints(const WalletCache& cache) {
    std::set<primitives::OutPoint> spent;
    for (const auto& [txid, tx] : cache.txs) {
        for (const auto& input : tx.vin()) {
            if (input.is_pegin || input.prevout.is_null()) continue;
            spent.insert(input.prevout);
        }
    }
    return spent;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

Wallet::Wallet(ConfidentialDescriptor descriptor, std::unique_ptr<Store> store,
               uint32_t gap_limit)
    : descriptor_(std::move(descriptor)),
      store_(std::move(store)),
      gap_limit_(gap_limit) {}

core::Result<std::unique_ptr<Wallet>> Wallet::open(
    const WalletOptions& options) {
    CTW_TRY_ASSIGN(descriptor, ConfidentialDescriptor::parse(
                                   options.descriptor, options.network));

    std::unique_ptr<Store> store;
    if (options.persist) {
        auto dir = options.datadir / descriptor.wallet_id();
        CTW_TRY_ASSIGN(opened, Store::open(dir, options.header_window));
        store = std::move(opened);
    } else {
        store = Store::in_memory(options.header_window);
    }

    return create(std::move(descriptor), std::move(store), options.gap_limit);
}

core::Result<std::unique_ptr<Wallet>> Wallet::create(
    ConfidentialDescriptor descriptor, std::unique_ptr<Store> store,
    uint32_t gap_limit) {
    if (!descriptor.has_derivable_blinding()) {
        return core::Error(core::ErrorCode::WALLET_UNSUPPORTED_BLINDING,
                           "descriptor blinding key cannot derive "
                           "per-address keys");
    }
    if (!store) {
        return core::Error(core::ErrorCode::INTERNAL_ERROR, "no store");
    }

    LOG_INFO(core::LogCategory::WALLET,
             "wallet " + descriptor.wallet_id() + " on " +
             std::string(network_name(descriptor.network())) + " (" +
             (store->is_persistent() ? "persistent" : "in-memory") + ")");
    return std::unique_ptr<Wallet>(
        new Wallet(std::move(descriptor), std::move(store), gap_limit));
}

// ---------------------------------------------------------------------------
// Addresses
// ---------------------------------------------------------------------------

core::Result<AddressResult> Wallet::address() {
    CTW_TRY_ASSIGN(txn, store_->write());
    auto& cache = txn.cache();

    uint32_t index = cache.next_index();
    CTW_TRY_ASSIGN(derived, descriptor_.derive(index));

    cache.last_index = index;
    cache.scripts.emplace(index, derived.script);
    CTW_TRY_VOID(txn.commit());

    LOG_DEBUG(core::LogCategory::WALLET,
              "handed out address index " + std::to_string(index));
    return AddressResult{index, std::move(derived.address),
                         std::move(derived.script)};
}

core::Result<AddressResult> Wallet::address_at(uint32_t index) const {
    CTW_TRY_ASSIGN(derived, descriptor_.derive(index));
    return AddressResult{index, std::move(derived.address),
                         std::move(derived.script)};
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

core::Result<std::vector<Utxo>> Wallet::utxos() const {
    CTW_TRY_ASSIGN(snapshot, store_->read());
    const auto& cache = *snapshot;
    auto spent = spent_outpoints(cache);

    std::vector<Utxo> result;
    for (const auto& [outpoint, secrets] : cache.unblinded) {
        if (spent.count(outpoint)) continue;

        const auto& tx = cache.txs.at(outpoint.txid);
        Utxo utxo;
        utxo.outpoint = outpoint;
        utxo.script = tx.vout()[outpoint.n].script_pubkey;
        auto h = cache.heights.find(outpoint.txid);
        if (h != cache.heights.end()) utxo.height = h->second;
        utxo.secrets = secrets;
        result.push_back(std::move(utxo));
    }

    std::sort(result.begin(), result.end(),
              [](const Utxo& a, const Utxo& b) {
                  if (a.secrets.value != b.secrets.value) {
                      return a.secrets.value > b.secrets.value;
                  }
                  return a.outpoint < b.outpoint;
              });
    return result;
}

core::Result<Balance> Wallet::balance() const {
    CTW_TRY_ASSIGN(utxo_list, utxos());

    Balance result;
    result[policy_asset()] = 0;
    for (const auto& utxo : utxo_list) {
        result[utxo.secrets.asset] += utxo.secrets.value;
    }
    return result;
}

core::Result<std::vector<WalletTx>> Wallet::transactions() const {
    CTW_TRY_ASSIGN(snapshot, store_->read());
    const auto& cache = *snapshot;
    const auto policy = policy_asset();

    std::vector<WalletTx> result;
    result.reserve(cache.txs.size());
    for (const auto& [txid, tx] : cache.txs) {
        WalletTx entry;
        entry.txid = txid;
        auto h = cache.heights.find(txid);
        if (h != cache.heights.end()) entry.height = h->second;
        if (entry.height) {
            auto header = cache.headers.find(*entry.height);
            if (header != cache.headers.end()) {
                entry.timestamp = header->second.timestamp;
            }
        }

        const auto& outputs = tx.vout();
        for (uint32_t vout = 0; vout < outputs.size(); ++vout) {
            auto it = cache.unblinded.find(primitives::OutPoint(txid, vout));
            if (it == cache.unblinded.end()) continue;
            entry.balance[it->second.asset] +=
                static_cast<int64_t>(it->second.value);
        }
        for (const auto& input : tx.vin()) {
            if (input.is_pegin) continue;
            auto it = cache.unblinded.find(input.prevout);
            if (it == cache.unblinded.end()) continue;
            entry.balance[it->second.asset] -=
                static_cast<int64_t>(it->second.value);
        }
        entry.fee = tx.fee(policy);
        entry.tx = tx;
        result.push_back(std::move(entry));
    }

    std::sort(result.begin(), result.end(),
              [](const WalletTx& a, const WalletTx& b) {
                  uint32_t ha = a.height.value_or(UINT32_MAX);
                  uint32_t hb = b.height.value_or(UINT32_MAX);
                  if (ha != hb) return ha > hb;
                  // Descending over the internal bytes, first byte first.
                  return std::lexicographical_compare(
                      b.txid.bytes().begin(), b.txid.bytes().end(),
                      a.txid.bytes().begin(), a.txid.bytes().end());
              });
    return result;
}

core::Result<std::optional<ChainTip>> Wallet::tip() const {
    CTW_TRY_ASSIGN(snapshot, store_->read());
    return snapshot->tip;
}

core::Result<std::optional<uint32_t>> Wallet::last_index() const {
    CTW_TRY_ASSIGN(snapshot, store_->read());
    return snapshot->last_index;
}

// ---------------------------------------------------------------------------
// Chain interaction
// ---------------------------------------------------------------------------

core::Result<bool> Wallet::sync(BlockchainBackend& backend) {
    Syncer syncer(descriptor_, *store_, backend, gap_limit_);
    return syncer.run();
}

core::Result<bool> Wallet::sync_tip(BlockchainBackend& backend) {
    Syncer syncer(descriptor_, *store_, backend, gap_limit_);
    return syncer.sync_tip();
}

core::Result<core::uint256> Wallet::broadcast(
    BlockchainBackend& backend, const primitives::Transaction& tx) {
    CTW_TRY_ASSIGN(txid, backend.broadcast(tx));
    if (txid != tx.txid()) {
        return protocol_violation("broadcast returned txid " + txid.to_hex() +
                                  ", expected " + tx.txid().to_hex());
    }
    LOG_INFO(core::LogCategory::WALLET, "broadcast " + txid.to_hex());
    return txid;
}

} // namespace wallet
