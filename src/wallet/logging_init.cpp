// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/logging_init.h"

#include "core/fs.h"
#include "core/logging.h"
#include "core/time.h"

#include <sstream>
#include <system_error>

namespace wallet {

namespace {

constexpr const char* CLIENT_NAME = "ctwallet";
constexpr const char* CLIENT_VERSION = "0.1.0";

} // anonymous namespace

core::Result<void> init_logging(const core::Config& config) {
    auto& logger = core::Logger::instance();

    logger.set_level(core::parse_log_level(
        config.get_or(core::CONF_LOGLEVEL, "info"), core::LogLevel::INFO));

    auto categories = config.get_list(core::CONF_DEBUG);
    if (!categories.empty()) {
        core::LogCategory mask = core::LogCategory::NONE;
        for (const auto& list : categories) {
            mask |= core::parse_log_categories(list);
        }
        if (mask == core::LogCategory::NONE) mask = core::LogCategory::ALL;
        logger.disable_category(core::LogCategory::ALL);
        logger.enable_category(mask);
    }

    logger.set_print_to_console(
        config.get_bool(core::CONF_PRINTTOCONSOLE, false));

    auto datadir = config.data_dir();
    if (!core::fs::ensure_directory(datadir)) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "cannot create data directory " + datadir.string());
    }

    auto log_path = datadir / "debug.log";
    rotate_log_file(log_path, MAX_LOG_FILE_SIZE);
    logger.set_log_file(log_path);
    logger.set_print_to_file(true);

    LOG_INFO(core::LogCategory::NONE, get_startup_banner(config));
    return core::make_ok();
}

bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size) {
    std::error_code ec;
    auto size = std::filesystem::file_size(log_path, ec);
    if (ec || size < max_size) {
        return false;
    }

    std::filesystem::path rotated_path =
        log_path.parent_path() / (log_path.filename().string() + ".1");

    if (std::filesystem::exists(rotated_path, ec)) {
        std::filesystem::remove(rotated_path, ec);
        if (ec) {
            LOG_WARN(core::LogCategory::NONE,
                     "Failed to remove old rotated log: " +
                     rotated_path.string());
        }
    }

    if (!core::fs::rename_safe(log_path, rotated_path)) {
        LOG_WARN(core::LogCategory::NONE,
                 "Failed to rotate log file: " + log_path.string());
        return false;
    }
    return true;
}

std::string get_startup_banner(const core::Config& config) {
    std::ostringstream ss;
    ss << "\n"
       << "============================================================\n"
       << "  " << CLIENT_NAME << " " << CLIENT_VERSION << "\n"
       << "  Network: " << config.network() << "\n"
       << "  Data directory: " << config.data_dir().string() << "\n"
       << "  Started: " << core::format_iso8601(core::get_time()) << "\n"
       << "============================================================\n";
    return ss.str();
}

} // namespace wallet
