#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "core/types.h"
#include "crypto/sha256.h"

namespace crypto {

/// Write-only stream for the serializers: a transaction or header
/// serializes into it and hash() yields the double SHA-256 id.
class HashWriter {
public:
    void write(std::span<const uint8_t> data) {
        hasher_.write(data);
        written_ += data.size();
    }

    [[nodiscard]] core::uint256 hash() {
        core::uint256 once = hasher_.finalize();
        return sha256(once.data(), once.size());
    }

    [[nodiscard]] size_t size() const noexcept { return written_; }

private:
    Sha256Hasher hasher_;
    size_t written_ = 0;
};

/// SHA256(SHA256(tag) || SHA256(tag) || msg), the BIP340 construction.
[[nodiscard]] core::uint256 tagged_hash(std::string_view tag,
                                        std::span<const uint8_t> msg);

}  // namespace crypto
