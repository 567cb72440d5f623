#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/sync.h"
#include "core/types.h"
#include "crypto/confidential.h"
#include "primitives/outpoint.h"
#include "primitives/script/script.h"
#include "primitives/transaction.h"
#include "wallet/backend.h"
#include "wallet/walletdb.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace wallet {

/// Block hash and time remembered for reorg detection.
struct HeaderInfo {
    core::uint256 hash;
    uint32_t timestamp = 0;

    bool operator==(const HeaderInfo&) const = default;
};

// ---------------------------------------------------------------------------
// WalletCache -- everything the wallet knows, as one value
// ---------------------------------------------------------------------------
// Invariants kept by every committed cache:
//   - each key of `heights` and `unblinded` refers to a body in `txs`
//     (for `unblinded`, to an existing output index)
//   - tip->height >= every confirmed height in `heights`
// ---------------------------------------------------------------------------
struct WalletCache {
    std::optional<ChainTip> tip;

    /// Server status per watched script, keyed by scriptPubKey.
    std::map<primitives::script::Script, StatusFingerprint> script_status;

    std::map<core::uint256, primitives::Transaction> txs;
    std::map<core::uint256, std::optional<uint32_t>> heights;
    std::map<primitives::OutPoint, crypto::TxOutSecrets> unblinded;

    /// Highest derivation index handed out or seen with history.
    std::optional<uint32_t> last_index;

    /// Recent header window, height -> header.
    std::map<uint32_t, HeaderInfo> headers;

    /// Derived scripts by index, so reopening does not re-derive.
    std::map<uint32_t, primitives::script::Script> scripts;

    bool operator==(const WalletCache&) const = default;

    /// First index that has not been handed out yet.
    [[nodiscard]] uint32_t next_index() const {
        return last_index ? *last_index + 1 : 0;
    }
};

/// Verify the cross-map invariants of @p cache (STORAGE_CORRUPT if broken).
[[nodiscard]] core::Result<void> check_invariants(const WalletCache& cache);

// ---------------------------------------------------------------------------
// Store -- snapshot reads, single exclusive writer, durable commits
// ---------------------------------------------------------------------------
// Readers get an immutable shared_ptr to the last committed cache and
// never block on a writer. write() hands out the only WriteTxn; its
// working copy becomes visible to readers (and durable on disk) on
// commit(). A WriteTxn dropped by an exception poisons the store.
// ---------------------------------------------------------------------------
class Store {
public:
    static constexpr size_t DEFAULT_HEADER_WINDOW = 100;

    class WriteTxn {
    public:
        WriteTxn(WriteTxn&& other) noexcept;
        WriteTxn& operator=(WriteTxn&&) = delete;
        WriteTxn(const WriteTxn&) = delete;
        WriteTxn& operator=(const WriteTxn&) = delete;
        ~WriteTxn();

        /// Working copy; starts equal to the last committed cache.
        [[nodiscard]] WalletCache& cache() { return *working_; }
        [[nodiscard]] const WalletCache& base() const { return *base_; }

        /// Persist and publish the working copy. A WriteTxn can be
        /// committed once; dropping it uncommitted discards the changes.
        core::Result<void> commit();

    private:
        friend class Store;
        WriteTxn(Store& store, std::unique_lock<core::Mutex> lock,
                 std::shared_ptr<const WalletCache> base);

        Store* store_;
        std::unique_lock<core::Mutex> lock_;
        std::shared_ptr<const WalletCache> base_;
        std::unique_ptr<WalletCache> working_;
        int uncaught_on_entry_;
        bool done_ = false;
    };

    /// Open (or create) the store file `<dir>/wallet.dat`.
    static core::Result<std::unique_ptr<Store>> open(
        const std::filesystem::path& dir,
        size_t header_window = DEFAULT_HEADER_WINDOW);

    /// A store that keeps everything in memory only.
    static std::unique_ptr<Store> in_memory(
        size_t header_window = DEFAULT_HEADER_WINDOW);

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    /// Last committed cache. STORAGE_POISONED after an aborted writer.
    [[nodiscard]] core::Result<std::shared_ptr<const WalletCache>> read() const;

    /// Begin the exclusive write transaction, waiting for any current one.
    [[nodiscard]] core::Result<WriteTxn> write();

    [[nodiscard]] bool is_poisoned() const;
    [[nodiscard]] bool is_persistent() const { return db_ != nullptr; }
    [[nodiscard]] size_t header_window() const { return header_window_; }

private:
    explicit Store(size_t header_window);

    core::Result<void> load();
    core::Result<void> persist(const WalletCache& before,
                               const WalletCache& after);
    void publish(std::shared_ptr<const WalletCache> next);
    void poison(const std::string& why);

    const size_t header_window_;
    std::unique_ptr<WalletDB> db_;

    core::Mutex writer_mutex_{"store-writer"};
    mutable core::SharedMutex snapshot_mutex_{"store-snapshot"};
    std::shared_ptr<const WalletCache> snapshot_;
    bool poisoned_ = false;
};

} // namespace wallet
