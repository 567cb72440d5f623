// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/sync.h"

#ifndef NDEBUG

#include "core/logging.h"

#include <algorithm>
#include <atomic>
#include <vector>

namespace core {

namespace {

struct HeldLock {
    const void* id;
    std::string name;
    uint64_t order;
};

std::atomic<uint64_t> g_lock_order{1};

// Exclusive locks held by this thread, oldest first.
thread_local std::vector<HeldLock> t_held;

} // anonymous namespace

uint64_t next_lock_order() {
    return g_lock_order.fetch_add(1, std::memory_order_relaxed);
}

void note_lock_acquired(const void* id, const std::string& name, uint64_t order) {
    auto inverted = std::find_if(t_held.begin(), t_held.end(),
                                 [&](const HeldLock& h) { return h.order >= order; });
    if (inverted != t_held.end()) {
        LOG_ERROR(LogCategory::LOCK,
                  "lock order inversion: taking '" + name + "' (" +
                  std::to_string(order) + ") while holding '" +
                  inverted->name + "' (" + std::to_string(inverted->order) + ")");
    }
    t_held.push_back(HeldLock{id, name, order});
}

void note_lock_released(const void* id) {
    // Guards may be released out of acquisition order.
    auto it = std::find_if(t_held.rbegin(), t_held.rend(),
                           [&](const HeldLock& h) { return h.id == id; });
    if (it != t_held.rend()) t_held.erase(std::next(it).base());
}

}  // namespace core

#endif  // !NDEBUG
