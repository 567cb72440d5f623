#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace core::fs {

using path = std::filesystem::path;

/// $HOME/.ctwallet, or /tmp/.ctwallet when HOME is unset.
path get_default_data_dir();

/// mkdir -p. True if the directory exists afterwards.
bool ensure_directory(const path& dir);

bool file_exists(const path& p);

/// rename(2); replaces |dst| atomically.
bool rename_safe(const path& src, const path& dst);

/// Whole file, or nullopt if it cannot be opened or read.
std::optional<std::string> read_file(const path& p);

/// Replaces |p| with |content| through a fsync'ed temporary in the same
/// directory. On success the new content survives a crash; on failure
/// the old content is untouched.
bool write_file(const path& p, std::string_view content);

// ---------------------------------------------------------------------------
// FileLock -- advisory flock(2) on a lock file, released on destruction
// ---------------------------------------------------------------------------
// The lock belongs to the open file description, so a second FileLock on
// the same path fails even inside one process.
// ---------------------------------------------------------------------------
class FileLock {
public:
    explicit FileLock(path p) : lock_path_(std::move(p)) {}
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    /// Creates the lock file if needed. False if another holder has it.
    bool try_lock();
    void unlock();

private:
    path lock_path_;
    int fd_{-1};
};

} // namespace core::fs
