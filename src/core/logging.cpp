// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/logging.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <utility>

namespace core {

namespace {

constexpr std::array<std::pair<std::string_view, LogCategory>, 7> CATEGORY_NAMES{{
    {"net", LogCategory::NET},
    {"rpc", LogCategory::RPC},
    {"wallet", LogCategory::WALLET},
    {"sync", LogCategory::SYNC},
    {"store", LogCategory::STORE},
    {"crypto", LogCategory::CRYPTO},
    {"lock", LogCategory::LOCK},
}};

std::string lower_trimmed(std::string_view sv) {
    std::string out;
    for (char c : sv) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

// "2026-02-03 12:00:00.123", UTC.
std::string timestamp() {
    using Clock = std::chrono::system_clock;
    auto now = Clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;
    std::time_t secs = Clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
    return buf;
}

} // anonymous namespace

std::string_view log_level_string(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::TRACE: return "TRACE";
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERR:   return "ERROR";
    case LogLevel::OFF:   return "OFF";
    }
    return "?";
}

std::string_view log_category_string(LogCategory cat) noexcept {
    uint32_t bits = static_cast<uint32_t>(cat);
    if (bits == 0) return "NONE";
    if (cat == LogCategory::ALL) return "ALL";
    static constexpr std::array<std::string_view, 7> UPPER{
        "NET", "RPC", "WALLET", "SYNC", "STORE", "CRYPTO", "LOCK"};
    for (std::size_t i = 0; i < UPPER.size(); ++i) {
        if (bits & (1u << i)) return UPPER[i];
    }
    return "?";
}

LogLevel parse_log_level(std::string_view name, LogLevel fallback) {
    static constexpr std::array<std::pair<std::string_view, LogLevel>, 7> LEVELS{{
        {"trace", LogLevel::TRACE}, {"debug", LogLevel::DEBUG},
        {"info", LogLevel::INFO},   {"warn", LogLevel::WARN},
        {"warning", LogLevel::WARN}, {"error", LogLevel::ERR},
        {"off", LogLevel::OFF},
    }};
    std::string key = lower_trimmed(name);
    for (const auto& [word, level] : LEVELS) {
        if (word == key) return level;
    }
    return fallback;
}

LogCategory parse_log_categories(std::string_view list) {
    LogCategory mask = LogCategory::NONE;
    std::size_t start = 0;
    while (start <= list.size()) {
        std::size_t comma = std::min(list.find(',', start), list.size());
        std::string token = lower_trimmed(list.substr(start, comma - start));
        if (token == "all") {
            mask |= LogCategory::ALL;
        }
        for (const auto& [word, cat] : CATEGORY_NAMES) {
            if (word == token) mask |= cat;
        }
        start = comma + 1;
    }
    return mask;
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    flush();
}

void Logger::set_level(LogLevel level) {
    level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::level() const noexcept {
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

void Logger::enable_category(LogCategory cat) {
    categories_.fetch_or(static_cast<uint32_t>(cat), std::memory_order_relaxed);
}

void Logger::disable_category(LogCategory cat) {
    categories_.fetch_and(~static_cast<uint32_t>(cat), std::memory_order_relaxed);
}

void Logger::set_print_to_console(bool enable) {
    to_console_.store(enable, std::memory_order_relaxed);
}

void Logger::set_print_to_file(bool enable) {
    to_file_.store(enable, std::memory_order_relaxed);
}

void Logger::set_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    flush_file_locked();
    file_.close();
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        to_file_.store(false, std::memory_order_relaxed);
        std::cerr << "ctwallet: cannot open log file " << path.string() << "\n";
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    flush_file_locked();
    std::cerr.flush();
}

void Logger::flush_file_locked() {
    if (file_.is_open() && !pending_.empty()) {
        file_ << pending_;
        file_.flush();
    }
    pending_.clear();
}

bool Logger::will_log(LogLevel level, LogCategory cat) const noexcept {
    if (static_cast<int>(level) < level_.load(std::memory_order_relaxed)) {
        return false;
    }
    uint32_t bits = static_cast<uint32_t>(cat);
    if (bits != 0 && (categories_.load(std::memory_order_relaxed) & bits) == 0) {
        return false;
    }
    return to_console_.load(std::memory_order_relaxed) ||
           to_file_.load(std::memory_order_relaxed);
}

void Logger::write(LogLevel level, LogCategory cat, std::string_view message) {
    std::string line = timestamp();
    line += ' ';
    line += log_level_string(level);
    line.append(6 - std::min<std::size_t>(5, log_level_string(level).size()), ' ');
    line += '[';
    line += log_category_string(cat);
    line += "] ";
    line += message;
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (to_console_.load(std::memory_order_relaxed)) {
        std::cerr << line;
    }
    if (to_file_.load(std::memory_order_relaxed) && file_.is_open()) {
        pending_ += line;
        if (level >= LogLevel::WARN || pending_.size() >= FILE_BUFFER_BYTES) {
            flush_file_locked();
        }
    }
}

} // namespace core
