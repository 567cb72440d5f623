#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <span>

namespace core {

// Fill |buf| from the OpenSSL CSPRNG (private keys, temporary file
// names). Throws std::runtime_error if RAND_bytes fails.
void get_random_bytes(std::span<uint8_t> buf);

// One random 64-bit integer from get_random_bytes().
uint64_t get_random_uint64();

}  // namespace core
