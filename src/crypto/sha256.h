#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// SHA-256, RIPEMD-160 and HMAC over the OpenSSL EVP interface.
//
// Digests come back as core::uint256 with the raw digest in wire order,
// so sha256d(tx).to_hex() prints the conventional reversed txid while
// core::to_hex(d.bytes()) prints the digest as the RFC test vectors do.

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "core/types.h"

struct evp_md_ctx_st;
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace crypto {

[[nodiscard]] core::uint256 sha256(std::span<const uint8_t> data);
[[nodiscard]] core::uint256 sha256(const void* data, size_t len);

/// SHA256(SHA256(data))
[[nodiscard]] core::uint256 sha256d(std::span<const uint8_t> data);

/// RIPEMD160(SHA256(data)), the witness program of a P2WPKH output.
[[nodiscard]] core::uint160 hash160(std::span<const uint8_t> data);

/// Streaming SHA-256. finalize() ends the stream; reset() starts a new one.
class Sha256Hasher {
public:
    Sha256Hasher();

    Sha256Hasher& write(std::span<const uint8_t> data);
    Sha256Hasher& write(const void* data, size_t len);

    [[nodiscard]] core::uint256 finalize();
    void reset();

private:
    struct CtxFree {
        void operator()(EVP_MD_CTX* ctx) const noexcept;
    };
    std::unique_ptr<EVP_MD_CTX, CtxFree> ctx_;
    bool open_ = false;
};

/// Keyed with the wallet master blinding key for SLIP-77 derivation.
[[nodiscard]] std::array<uint8_t, 32> hmac_sha256(
    std::span<const uint8_t> key, std::span<const uint8_t> data);

/// BIP32 child key derivation.
[[nodiscard]] std::array<uint8_t, 64> hmac_sha512(
    std::span<const uint8_t> key, std::span<const uint8_t> data);

}  // namespace crypto
