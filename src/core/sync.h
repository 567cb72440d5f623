#pragma once

// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// Lock-order checking (debug builds only)
// ---------------------------------------------------------------------------
// Every named mutex draws an order id at construction. A thread must take
// exclusive locks in increasing id order; the checker logs (category LOCK)
// the first time a thread breaks that rule. Shared locks are not tracked.

#ifndef NDEBUG
uint64_t next_lock_order();
void note_lock_acquired(const void* id, const std::string& name, uint64_t order);
void note_lock_released(const void* id);
#endif

template <typename Base>
class OrderedMutex {
public:
    explicit OrderedMutex(std::string_view name = "")
        : name_(name)
#ifndef NDEBUG
        , order_(next_lock_order())
#endif
    {
    }

    OrderedMutex(const OrderedMutex&) = delete;
    OrderedMutex& operator=(const OrderedMutex&) = delete;

    void lock() {
#ifndef NDEBUG
        note_lock_acquired(this, name_, order_);
#endif
        mutex_.lock();
    }

    bool try_lock() {
        if (!mutex_.try_lock()) return false;
#ifndef NDEBUG
        note_lock_acquired(this, name_, order_);
#endif
        return true;
    }

    void unlock() {
        mutex_.unlock();
#ifndef NDEBUG
        note_lock_released(this);
#endif
    }

    // Only instantiated for shared_mutex.
    void lock_shared() { mutex_.lock_shared(); }
    bool try_lock_shared() { return mutex_.try_lock_shared(); }
    void unlock_shared() { mutex_.unlock_shared(); }

    const std::string& name() const noexcept { return name_; }

private:
    Base mutex_;
    std::string name_;
#ifndef NDEBUG
    uint64_t order_;
#endif
};

using Mutex = OrderedMutex<std::mutex>;
using SharedMutex = OrderedMutex<std::shared_mutex>;

/// Writer and reader guards for SharedMutex.
using ExclusiveLock = std::unique_lock<SharedMutex>;
using SharedLock = std::shared_lock<SharedMutex>;

}  // namespace core
