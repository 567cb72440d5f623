// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/sha256.h"

#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace crypto {

namespace {

// |out| must hold EVP_MD_size(md) bytes.
void digest_into(const EVP_MD* md, const void* data, size_t len,
                 uint8_t* out) {
    unsigned int written = 0;
    if (EVP_Digest(data, len, out, &written, md, nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed");
    }
}

template <size_t N>
std::array<uint8_t, N> hmac(const EVP_MD* md, std::span<const uint8_t> key,
                            std::span<const uint8_t> data) {
    std::array<uint8_t, N> mac{};
    unsigned int written = 0;
    if (HMAC(md, key.data(), static_cast<int>(key.size()), data.data(),
             data.size(), mac.data(), &written) == nullptr ||
        written != N) {
        throw std::runtime_error("HMAC failed");
    }
    return mac;
}

}  // namespace

core::uint256 sha256(std::span<const uint8_t> data) {
    return sha256(data.data(), data.size());
}

core::uint256 sha256(const void* data, size_t len) {
    std::array<uint8_t, 32> out{};
    digest_into(EVP_sha256(), data, len, out.data());
    return core::uint256::from_bytes(out);
}

core::uint256 sha256d(std::span<const uint8_t> data) {
    core::uint256 once = sha256(data);
    return sha256(once.data(), once.size());
}

core::uint160 hash160(std::span<const uint8_t> data) {
    core::uint256 once = sha256(data);
    std::array<uint8_t, 20> out{};
    digest_into(EVP_ripemd160(), once.data(), once.size(), out.data());
    return core::uint160::from_bytes(out);
}

// ---------------------------------------------------------------------------
// Sha256Hasher
// ---------------------------------------------------------------------------

void Sha256Hasher::CtxFree::operator()(EVP_MD_CTX* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    reset();
}

void Sha256Hasher::reset() {
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    open_ = true;
}

Sha256Hasher& Sha256Hasher::write(std::span<const uint8_t> data) {
    if (!open_) throw std::logic_error("Sha256Hasher: write after finalize");
    if (!data.empty() &&
        EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

Sha256Hasher& Sha256Hasher::write(const void* data, size_t len) {
    return write({static_cast<const uint8_t*>(data), len});
}

core::uint256 Sha256Hasher::finalize() {
    if (!open_) throw std::logic_error("Sha256Hasher: finalized twice");
    std::array<uint8_t, 32> out{};
    unsigned int written = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &written) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    open_ = false;
    return core::uint256::from_bytes(out);
}

// ---------------------------------------------------------------------------
// HMAC
// ---------------------------------------------------------------------------

std::array<uint8_t, 32> hmac_sha256(std::span<const uint8_t> key,
                                    std::span<const uint8_t> data) {
    return hmac<32>(EVP_sha256(), key, data);
}

std::array<uint8_t, 64> hmac_sha512(std::span<const uint8_t> key,
                                    std::span<const uint8_t> data) {
    return hmac<64>(EVP_sha512(), key, data);
}

}  // namespace crypto
