#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CTW_CORE_LOGGING_H
#define CTW_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace core {

enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERR   = 4,  // "ERROR" collides with a <windows.h> macro
    OFF   = 5,
};

// ---------------------------------------------------------------------------
// LogCategory -- one bit per subsystem, filtered with -debug=<list>
// ---------------------------------------------------------------------------
//   NET     sockets, TLS, Electrum framing
//   RPC     HTTP/JSON-RPC to an Elements node
//   WALLET  facade, options, descriptors
//   SYNC    sync passes, reorgs, unblinding
//   STORE   snapshot commits and persistence
//   CRYPTO  key and blinding failures
//   LOCK    lock-order inversions (debug builds)
// NONE is never filtered out.
// ---------------------------------------------------------------------------
enum class LogCategory : uint32_t {
    NONE   = 0,
    NET    = 1u << 0,
    RPC    = 1u << 1,
    WALLET = 1u << 2,
    SYNC   = 1u << 3,
    STORE  = 1u << 4,
    CRYPTO = 1u << 5,
    LOCK   = 1u << 6,
    ALL    = 0xFFFFFFFF,
};

inline constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(static_cast<uint32_t>(a) |
                                    static_cast<uint32_t>(b));
}

inline constexpr LogCategory& operator|=(LogCategory& a, LogCategory b) noexcept {
    return a = a | b;
}

[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Name of the lowest set bit, "NONE" for no bits, "ALL" for every bit.
[[nodiscard]] std::string_view log_category_string(LogCategory cat) noexcept;

/// trace, debug, info, warn (or warning), error, off; any case. Unknown
/// names yield @p fallback.
[[nodiscard]] LogLevel parse_log_level(std::string_view name,
                                       LogLevel fallback);

/// Comma-separated category names, including "all". Unknown names are
/// ignored.
[[nodiscard]] LogCategory parse_log_categories(std::string_view list);

// ---------------------------------------------------------------------------
// Logger -- process-wide, thread-safe
// ---------------------------------------------------------------------------
// Lines look like
//   2026-02-03 12:00:00.123 INFO  [SYNC] synced to 3051121 in 840ms
// The console sink is stderr; the file sink is buffered and flushed on
// WARN and above, on flush() and at exit.
// ---------------------------------------------------------------------------
class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const noexcept;

    void enable_category(LogCategory cat);
    void disable_category(LogCategory cat);

    void set_print_to_console(bool enable);
    void set_print_to_file(bool enable);

    /// Opens @p path for appending. On failure the file sink is switched
    /// off and the reason goes to stderr.
    void set_log_file(const std::filesystem::path& path);

    void flush();

    /// Lockless check made by the LOG_* macros before any formatting.
    [[nodiscard]] bool will_log(LogLevel level, LogCategory cat) const noexcept;

    void write(LogLevel level, LogCategory cat, std::string_view message);

private:
    Logger() = default;
    ~Logger();

    void flush_file_locked();

    std::atomic<int> level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> categories_{static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool> to_console_{true};
    std::atomic<bool> to_file_{false};

    std::mutex mutex_;
    std::ofstream file_;
    std::string pending_;

    static constexpr std::size_t FILE_BUFFER_BYTES = 8192;
};

} // namespace core

// LOG_INFO(core::LogCategory::SYNC, "fetched " + std::to_string(n) + " txs");
// The message expression is only evaluated when the line will be written.
#define CTW_LOG_AT(lvl, cat, msg)                                         \
    do {                                                                  \
        auto& _ctw_logger = core::Logger::instance();                     \
        if (_ctw_logger.will_log((lvl), (cat))) {                         \
            _ctw_logger.write((lvl), (cat), std::string(msg));            \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) CTW_LOG_AT(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) CTW_LOG_AT(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  CTW_LOG_AT(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  CTW_LOG_AT(core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) CTW_LOG_AT(core::LogLevel::ERR, cat, msg)

#endif // CTW_CORE_LOGGING_H
