#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/fs.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wallet {

// ---------------------------------------------------------------------------
// WalletDB -- persistent key-value storage using a flat binary file
// ---------------------------------------------------------------------------
// File format:
//   [magic: 4B "CTW!"][version: 4B LE][record_count: 4B LE]
//   Followed by N records, each:
//     [key_len: 2B LE][key: key_len bytes][value_len: 4B LE][value: value_len bytes]
//
// Record types are distinguished by key prefix:
//   "tip", "last_index"     -- singletons
//   "tx:"  "height:"        -- transaction bodies and confirmation heights
//   "unblinded:"            -- cleartext secrets of owned outputs
//   "status:" "script:"     -- per-script status and derived script cache
//   "header:"               -- recent block header window
//
// Changes are applied in batches. Each batch rewrites the whole file via
// core::fs::write_file (temp file, fsync, rename), so a crash leaves either
// the old or the new content on disk. An advisory lock on "<path>.lock"
// keeps a second process out.
// ---------------------------------------------------------------------------

class WalletDB {
public:
    /// Magic bytes identifying a ctwallet store file.
    static constexpr char MAGIC[4] = {'C', 'T', 'W', '!'};
    static constexpr uint32_t CURRENT_VERSION = 1;

    /// A set of puts and erases applied as one unit.
    class Batch {
    public:
        void put(std::string key, std::vector<uint8_t> value) {
            ops_.emplace_back(std::move(key), std::move(value));
        }
        void erase(std::string key) {
            ops_.emplace_back(std::move(key), std::nullopt);
        }
        [[nodiscard]] bool empty() const { return ops_.empty(); }
        [[nodiscard]] size_t size() const { return ops_.size(); }

    private:
        friend class WalletDB;
        std::vector<std::pair<std::string,
                              std::optional<std::vector<uint8_t>>>> ops_;
    };

    WalletDB() = default;
    ~WalletDB();

    WalletDB(const WalletDB&) = delete;
    WalletDB& operator=(const WalletDB&) = delete;

    // -- Lifecycle -----------------------------------------------------------

    /// Open (or create) a store file at the given path.
    /// Fails with STORAGE_LOCKED if another process holds the lock.
    core::Result<void> open(const std::filesystem::path& path);

    /// Release the file lock. Data is already on disk.
    void close();

    /// Returns true if the database file is currently open.
    [[nodiscard]] bool is_open() const;

    /// Returns the path of the currently open database file.
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // -- Read / write --------------------------------------------------------

    /// Apply @p batch and persist it durably. On failure neither the file
    /// nor the in-memory records change.
    core::Result<void> apply(const Batch& batch);

    /// Read the value associated with a key.
    /// Returns STORAGE_NOT_FOUND if the key does not exist.
    core::Result<std::vector<uint8_t>> read(std::string_view key) const;

    /// Check if a key exists in the database.
    [[nodiscard]] bool exists(std::string_view key) const;

    /// Return all key-value pairs whose keys begin with the given prefix,
    /// sorted by key.
    [[nodiscard]] std::vector<std::pair<std::string, std::vector<uint8_t>>>
    read_by_prefix(std::string_view prefix) const;

    /// Total number of records.
    [[nodiscard]] size_t record_count() const;

private:
    using RecordMap = std::map<std::string, std::vector<uint8_t>, std::less<>>;

    mutable std::mutex mutex_;
    std::filesystem::path path_;
    bool is_open_ = false;

    RecordMap records_;
    std::unique_ptr<core::fs::FileLock> lock_;

    /// Encode @p records and write them to disk atomically.
    core::Result<void> write_to_disk(const RecordMap& records);

    /// Read and parse the database file into records_.
    core::Result<void> read_from_disk();
};

} // namespace wallet
