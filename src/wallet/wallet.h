#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "crypto/confidential.h"
#include "primitives/outpoint.h"
#include "primitives/script/script.h"
#include "primitives/transaction.h"
#include "wallet/address.h"
#include "wallet/backend.h"
#include "wallet/descriptor.h"
#include "wallet/network.h"
#include "wallet/options.h"
#include "wallet/store.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wallet {

/// A freshly handed-out receive address.
struct AddressResult {
    uint32_t index = 0;
    Address address;
    primitives::script::Script script;
};

/// An unspent wallet output with its opening.
struct Utxo {
    primitives::OutPoint outpoint;
    primitives::script::Script script;
    std::optional<uint32_t> height;
    crypto::TxOutSecrets secrets;
};

/// A wallet transaction as shown to users.
struct WalletTx {
    core::uint256 txid;
    std::optional<uint32_t> height;
    /// Block time when the confirming header is in the window.
    std::optional<uint32_t> timestamp;
    /// Net effect on the wallet per asset: received minus spent.
    std::map<core::uint256, int64_t> balance;
    /// Explicit fee in the policy asset.
    uint64_t fee = 0;
    primitives::Transaction tx;
};

using Balance = std::map<core::uint256, uint64_t>;

// ---------------------------------------------------------------------------
// Wallet -- public surface over the store
// ---------------------------------------------------------------------------
// Reads (balance, utxos, transactions, tip) are computed from one store
// snapshot and never touch the network. sync() runs one Syncer pass
// against a caller-supplied backend. All methods are thread-safe.
// ---------------------------------------------------------------------------

class Wallet {
public:
    /// Open the wallet described by @p options, creating its store under
    /// datadir/<wallet id> (or in memory when options.persist is false).
    /// WALLET_UNSUPPORTED_BLINDING if the descriptor cannot derive
    /// blinding keys.
    static core::Result<std::unique_ptr<Wallet>> open(
        const WalletOptions& options);

    /// Assemble a wallet from parts already built.
    static core::Result<std::unique_ptr<Wallet>> create(
        ConfidentialDescriptor descriptor, std::unique_ptr<Store> store,
        uint32_t gap_limit = WalletOptions::DEFAULT_GAP_LIMIT);

    Wallet(const Wallet&) = delete;
    Wallet& operator=(const Wallet&) = delete;

    // -- Addresses -----------------------------------------------------------

    /// Hand out the next unused index. No two calls return the same index.
    /// Takes the store's writer, so it waits for a running sync() or
    /// sync_tip() to finish.
    core::Result<AddressResult> address();

    /// Derive the address at @p index without marking it used.
    [[nodiscard]] core::Result<AddressResult> address_at(uint32_t index) const;

    // -- Reads ---------------------------------------------------------------

    /// Unspent owned outputs, largest value first (ties by outpoint).
    [[nodiscard]] core::Result<std::vector<Utxo>> utxos() const;

    /// Sum of utxos() per asset; always lists the policy asset.
    [[nodiscard]] core::Result<Balance> balance() const;

    /// Known transactions, unconfirmed first then by descending height,
    /// ties by descending txid in internal byte order.
    [[nodiscard]] core::Result<std::vector<WalletTx>> transactions() const;

    [[nodiscard]] core::Result<std::optional<ChainTip>> tip() const;

    /// Highest index handed out or seen with history.
    [[nodiscard]] core::Result<std::optional<uint32_t>> last_index() const;

    // -- Chain interaction ---------------------------------------------------

    /// One sync pass. Returns true if the wallet state changed. The pass
    /// holds the store's writer for its whole duration, network round
    /// trips included: address() blocks until it ends, for as long as the
    /// backend's own timeout allows. Reads are not blocked.
    core::Result<bool> sync(BlockchainBackend& backend);

    /// Update the chain tip only. A tip that does not extend the stored
    /// headers is left for the next sync() and reported as no change.
    core::Result<bool> sync_tip(BlockchainBackend& backend);

    /// Broadcast @p tx; the backend must echo the same txid.
    core::Result<core::uint256> broadcast(BlockchainBackend& backend,
                                          const primitives::Transaction& tx);

    // -- Accessors -----------------------------------------------------------

    [[nodiscard]] Network network() const { return descriptor_.network(); }
    [[nodiscard]] core::uint256 policy_asset() const {
        return wallet::policy_asset(network());
    }
    [[nodiscard]] const ConfidentialDescriptor& descriptor() const {
        return descriptor_;
    }
    [[nodiscard]] std::string wallet_id() const {
        return descriptor_.wallet_id();
    }
    [[nodiscard]] const Store& store() const { return *store_; }
    [[nodiscard]] Store& store() { return *store_; }

private:
    Wallet(ConfidentialDescriptor descriptor, std::unique_ptr<Store> store,
           uint32_t gap_limit);

    ConfidentialDescriptor descriptor_;
    std::unique_ptr<Store> store_;
    uint32_t gap_limit_;
};

} // namespace wallet
