// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/walletdb.h"

#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"

#include <cstring>
#include <stdexcept>

namespace wallet {

namespace {

constexpr uint32_t MAX_RECORDS = 10'000'000;
constexpr uint32_t MAX_VALUE_SIZE = 64 * 1024 * 1024;

void write_le16(core::DataStream& s, uint16_t v) {
    uint8_t buf[2] = {
        static_cast<uint8_t>(v & 0xFF),
        static_cast<uint8_t>((v >> 8) & 0xFF)
    };
    s.write(buf);
}

uint16_t read_le16(core::DataStream& s) {
    uint8_t buf[2];
    s.read(buf);
    return static_cast<uint16_t>(buf[0]) |
           static_cast<uint16_t>(static_cast<uint16_t>(buf[1]) << 8);
}

core::Error corrupt(std::string msg) {
    return core::Error(core::ErrorCode::STORAGE_CORRUPT, std::move(msg));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

WalletDB::~WalletDB() {
    if (is_open_) {
        close();
    }
}

core::Result<void> WalletDB::open(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);

    if (is_open_) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "WalletDB already open");
    }

    path_ = path;
    if (!core::fs::ensure_directory(path_.parent_path())) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "Cannot create directory: " +
                           path_.parent_path().string());
    }

    auto lock_path = path_;
    lock_path += ".lock";
    auto file_lock = std::make_unique<core::fs::FileLock>(lock_path);
    if (!file_lock->try_lock()) {
        return core::Error(core::ErrorCode::STORAGE_LOCKED,
                           "Wallet store is locked by another process. "
                           "Lock file: " + lock_path.string());
    }

    if (core::fs::file_exists(path_)) {
        CTW_TRY_VOID(read_from_disk());
    } else {
        records_.clear();
        CTW_TRY_VOID(write_to_disk(records_));
    }

    lock_ = std::move(file_lock);
    is_open_ = true;
    LOG_INFO(core::LogCategory::STORE,
             "WalletDB opened: " + path_.string() + " (" +
             std::to_string(records_.size()) + " records)");
    return core::make_ok();
}

void WalletDB::close() {
    std::lock_guard lock(mutex_);
    if (!is_open_) return;

    records_.clear();
    lock_.reset();
    is_open_ = false;

    LOG_INFO(core::LogCategory::STORE,
             "WalletDB closed: " + path_.string());
}

bool WalletDB::is_open() const {
    std::lock_guard lock(mutex_);
    return is_open_;
}

// ---------------------------------------------------------------------------
// Read / write
// ---------------------------------------------------------------------------

core::Result<void> WalletDB::apply(const Batch& batch) {
    std::lock_guard lock(mutex_);

    if (!is_open_) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "WalletDB not open");
    }
    if (batch.empty()) return core::make_ok();

    RecordMap next = records_;
    for (const auto& [key, value] : batch.ops_) {
        if (key.empty() || key.size() > 65535) {
            return core::Error(core::ErrorCode::VALIDATION_ERROR,
                               "WalletDB key length out of range");
        }
        if (value) {
            next[key] = *value;
        } else {
            next.erase(key);
        }
    }

    CTW_TRY_VOID(write_to_disk(next));
    records_.swap(next);

    LOG_DEBUG(core::LogCategory::STORE,
              "WalletDB applied " + std::to_string(batch.size()) +
              " changes, " + std::to_string(records_.size()) + " records");
    return core::make_ok();
}

core::Result<std::vector<uint8_t>> WalletDB::read(std::string_view key) const {
    std::lock_guard lock(mutex_);

    auto it = records_.find(key);
    if (it == records_.end()) {
        return core::Error(core::ErrorCode::STORAGE_NOT_FOUND,
                           "Key not found: " + std::string(key));
    }
    return it->second;
}

bool WalletDB::exists(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return records_.find(key) != records_.end();
}

std::vector<std::pair<std::string, std::vector<uint8_t>>>
WalletDB::read_by_prefix(std::string_view prefix) const {
    std::lock_guard lock(mutex_);

    std::vector<std::pair<std::string, std::vector<uint8_t>>> result;
    for (auto it = records_.lower_bound(prefix); it != records_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        result.emplace_back(it->first, it->second);
    }
    return result;
}

size_t WalletDB::record_count() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

// ---------------------------------------------------------------------------
// Internal: disk I/O
// ---------------------------------------------------------------------------

core::Result<void> WalletDB::write_to_disk(const RecordMap& records) {
    core::DataStream out;
    out.write(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(MAGIC), 4));
    core::ser_write_u32(out, CURRENT_VERSION);
    core::ser_write_u32(out, static_cast<uint32_t>(records.size()));

    // std::map iterates in key order, so the output is deterministic.
    for (const auto& [key, value] : records) {
        write_le16(out, static_cast<uint16_t>(key.size()));
        out.write(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(key.data()), key.size()));
        core::ser_write_u32(out, static_cast<uint32_t>(value.size()));
        out.write(value);
    }

    auto bytes = out.release();
    std::string_view content(reinterpret_cast<const char*>(bytes.data()),
                             bytes.size());
    if (!core::fs::write_file(path_, content)) {
        LOG_ERROR(core::LogCategory::STORE,
                  "Error writing wallet store " + path_.string());
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "Error writing wallet store " + path_.string());
    }
    return core::make_ok();
}

core::Result<void> WalletDB::read_from_disk() {
    auto content = core::fs::read_file(path_);
    if (!content) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "Cannot open wallet store: " + path_.string());
    }

    core::DataStream in(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(content->data()), content->size()));

    RecordMap records;
    try {
        uint8_t magic[4];
        in.read(magic);
        if (std::memcmp(magic, MAGIC, 4) != 0) {
            return corrupt("Invalid wallet store magic");
        }

        uint32_t version = core::ser_read_u32(in);
        if (version > CURRENT_VERSION) {
            return corrupt("Unsupported wallet store version: " +
                           std::to_string(version));
        }

        uint32_t count = core::ser_read_u32(in);
        if (count > MAX_RECORDS) {
            return corrupt("Wallet store record count too high: " +
                           std::to_string(count));
        }

        for (uint32_t i = 0; i < count; ++i) {
            uint16_t key_len = read_le16(in);
            if (key_len == 0) {
                return corrupt("Empty record key at index " +
                               std::to_string(i));
            }
            std::string key(key_len, '\0');
            in.read(std::span<uint8_t>(
                reinterpret_cast<uint8_t*>(key.data()), key_len));

            uint32_t value_len = core::ser_read_u32(in);
            if (value_len > MAX_VALUE_SIZE) {
                return corrupt("Record value too large at index " +
                               std::to_string(i));
            }
            std::vector<uint8_t> value(value_len);
            in.read(value);

            records[std::move(key)] = std::move(value);
        }
    } catch (const std::runtime_error& e) {
        return corrupt(std::string("Truncated wallet store: ") + e.what());
    }

    if (!in.eof()) {
        return corrupt("Trailing data in wallet store");
    }

    records_ = std::move(records);
    LOG_DEBUG(core::LogCategory::STORE,
              "WalletDB loaded " + std::to_string(records_.size()) +
              " records from " + path_.string());
    return core::make_ok();
}

} // namespace wallet
