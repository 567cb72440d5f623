#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Logging system initialization for ctwallet tools.
//
// Configures the global Logger singleton from core::Config:
//   -loglevel=<trace|debug|info|warn|error|off>   threshold (default info)
//   -debug=<cat>[,<cat>...]                       categories (default all)
//   -printtoconsole                               mirror to stderr
// and writes to <datadir>/debug.log, rotating it when it grows too big.
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace wallet {

/// Maximum log file size before rotation, in bytes.
inline constexpr uint64_t MAX_LOG_FILE_SIZE = 50 * 1024 * 1024;  // 50 MB

/// Initialize the logging subsystem from @p config.
/// @returns an error if the data directory cannot be created.
[[nodiscard]] core::Result<void> init_logging(const core::Config& config);

/// Rotate the log file at the given path if it exceeds max_size bytes:
/// debug.log is renamed to debug.log.1, replacing any older copy.
/// @returns true if rotation was performed.
bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size = MAX_LOG_FILE_SIZE);

/// One-paragraph startup banner with version, network and data directory.
[[nodiscard]] std::string get_startup_banner(const core::Config& config);

} // namespace wallet
