// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/hash.h"

namespace crypto {

core::uint256 tagged_hash(std::string_view tag,
                          std::span<const uint8_t> msg) {
    const core::uint256 prefix = sha256(tag.data(), tag.size());
    Sha256Hasher hasher;
    hasher.write(prefix.bytes()).write(prefix.bytes()).write(msg);
    return hasher.finalize();
}

}  // namespace crypto
