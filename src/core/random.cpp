// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/random.h"

#include <array>
#include <stdexcept>

#include <openssl/rand.h>

namespace core {

void get_random_bytes(std::span<uint8_t> buf) {
    if (buf.empty()) {
        return;
    }
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("get_random_bytes: RAND_bytes failed");
    }
}

uint64_t get_random_uint64() {
    std::array<uint8_t, 8> bytes{};
    get_random_bytes(bytes);
    uint64_t value = 0;
    for (uint8_t b : bytes) {
        value = (value << 8) | b;
    }
    return value;
}

}  // namespace core
