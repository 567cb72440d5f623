#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <chrono>
#include <cstdint>
#include <string>

namespace core {

/// Unix time in seconds.
int64_t get_time();

/// Formats a Unix timestamp (seconds) as "2026-02-03T00:00:00Z".
std::string format_iso8601(int64_t timestamp);

// ---------------------------------------------------------------------------
// StopWatch -- elapsed time on the monotonic clock
// ---------------------------------------------------------------------------

class StopWatch {
public:
    StopWatch() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] int64_t elapsed_ms() const;

    void reset() { start_ = std::chrono::steady_clock::now(); }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace core
