// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/secp256k1.h"

#include "core/random.h"
#include "crypto/sha256.h"

#include <cstring>
#include <memory>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

namespace crypto {

// ---------------------------------------------------------------------------
// secp256k1 curve order (big-endian).
// n = FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141
// ---------------------------------------------------------------------------
static const uint8_t SECP256K1_ORDER[] = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
};

// ---------------------------------------------------------------------------
// RAII helpers for OpenSSL objects
// ---------------------------------------------------------------------------
struct BN_Deleter  { void operator()(BIGNUM* p)   const { BN_clear_free(p); } };
struct BN_CTX_Del  { void operator()(BN_CTX* p)   const { BN_CTX_free(p); } };
struct EC_GRP_Del  { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };
struct EC_PT_Del   { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };

using BN_ptr      = std::unique_ptr<BIGNUM, BN_Deleter>;
using BN_CTX_ptr  = std::unique_ptr<BN_CTX, BN_CTX_Del>;
using EC_GRP_ptr  = std::unique_ptr<EC_GROUP, EC_GRP_Del>;
using EC_PT_ptr   = std::unique_ptr<EC_POINT, EC_PT_Del>;

// ---------------------------------------------------------------------------
// Internal: obtain a reusable EC_GROUP for secp256k1.
// ---------------------------------------------------------------------------
static const EC_GROUP* secp256k1_group() {
    static EC_GRP_ptr group{
        EC_GROUP_new_by_curve_name(NID_secp256k1)};
    return group.get();
}

static const BIGNUM* secp256k1_order_bn() {
    static BN_ptr order{BN_bin2bn(SECP256K1_ORDER,
                                   sizeof(SECP256K1_ORDER),
                                   nullptr)};
    return order.get();
}

static core::Error ec_error(std::string msg) {
    return core::Error(core::ErrorCode::CRYPTO_KEY_FAIL, std::move(msg));
}

// ---------------------------------------------------------------------------
// Internal: point / scalar conversion
// ---------------------------------------------------------------------------

/// Parse 32 big-endian bytes as a scalar strictly below the order.
static BN_ptr scalar_from_bytes(std::span<const uint8_t, 32> bytes) {
    BN_ptr bn{BN_bin2bn(bytes.data(), 32, nullptr)};
    if (!bn || BN_cmp(bn.get(), secp256k1_order_bn()) >= 0) {
        return nullptr;
    }
    return bn;
}

static EC_PT_ptr point_from_bytes(std::span<const uint8_t> bytes,
                                  BN_CTX* ctx) {
    const EC_GROUP* grp = secp256k1_group();
    EC_PT_ptr pt{EC_POINT_new(grp)};
    if (!pt) return nullptr;
    if (!EC_POINT_oct2point(grp, pt.get(), bytes.data(), bytes.size(),
                            ctx)) {
        return nullptr;
    }
    return pt;
}

static bool point_to_bytes(const EC_POINT* pt, PubKey& out, BN_CTX* ctx) {
    const EC_GROUP* grp = secp256k1_group();
    if (EC_POINT_is_at_infinity(grp, pt)) return false;
    size_t len = EC_POINT_point2oct(grp, pt, POINT_CONVERSION_COMPRESSED,
                                    out.data(), out.size(), ctx);
    return len == out.size();
}

// ---------------------------------------------------------------------------
// ECKey
// ---------------------------------------------------------------------------

ECKey::~ECKey() {
    OPENSSL_cleanse(secret_.data(), secret_.size());
}

ECKey ECKey::generate() {
    ECKey key;
    do {
        core::get_random_bytes(key.secret_);
    } while (!is_valid_secret(key.secret_));
    key.has_key_ = true;
    return key;
}

core::Result<ECKey> ECKey::from_secret(std::span<const uint8_t, 32> secret) {
    if (!is_valid_secret(secret)) {
        return ec_error("secret key is zero or not below the curve order");
    }
    ECKey key;
    std::memcpy(key.secret_.data(), secret.data(), 32);
    key.has_key_ = true;
    return key;
}

PubKey ECKey::pubkey_compressed() const {
    PubKey out{};
    if (!has_key_) return out;

    BN_CTX_ptr ctx{BN_CTX_new()};
    BN_ptr priv{BN_bin2bn(secret_.data(), 32, nullptr)};
    const EC_GROUP* grp = secp256k1_group();
    EC_PT_ptr pub{EC_POINT_new(grp)};
    if (!ctx || !priv || !pub ||
        !EC_POINT_mul(grp, pub.get(), priv.get(), nullptr, nullptr,
                      ctx.get()) ||
        !point_to_bytes(pub.get(), out, ctx.get())) {
        out.fill(0);
    }
    return out;
}

core::Result<core::uint256> ECKey::ecdh(
    std::span<const uint8_t> other_pubkey) const {
    if (!has_key_) {
        return ec_error("ECKey has no private key for ECDH");
    }

    BN_CTX_ptr ctx{BN_CTX_new()};
    EC_PT_ptr peer = point_from_bytes(other_pubkey, ctx.get());
    if (!peer) {
        return ec_error("invalid peer public key for ECDH");
    }

    const EC_GROUP* grp = secp256k1_group();
    BN_ptr priv{BN_bin2bn(secret_.data(), 32, nullptr)};
    EC_PT_ptr shared{EC_POINT_new(grp)};
    if (!EC_POINT_mul(grp, shared.get(), nullptr, peer.get(), priv.get(),
                      ctx.get())) {
        return ec_error("ECDH point multiplication failed");
    }

    PubKey encoded{};
    if (!point_to_bytes(shared.get(), encoded, ctx.get())) {
        return ec_error("ECDH produced the point at infinity");
    }
    core::uint256 result = sha256(encoded.data(), encoded.size());
    OPENSSL_cleanse(encoded.data(), encoded.size());
    return result;
}

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

bool is_valid_secret(std::span<const uint8_t, 32> secret) {
    BN_ptr bn = scalar_from_bytes(secret);
    return bn && !BN_is_zero(bn.get());
}

bool is_valid_pubkey(std::span<const uint8_t> pubkey) {
    if (pubkey.size() == 33) {
        if (pubkey[0] != 0x02 && pubkey[0] != 0x03) return false;
    } else if (pubkey.size() == 65) {
        if (pubkey[0] != 0x04) return false;
    } else {
        return false;
    }

    BN_CTX_ptr ctx{BN_CTX_new()};
    EC_PT_ptr pt = point_from_bytes(pubkey, ctx.get());
    if (!pt) return false;
    return EC_POINT_is_on_curve(secp256k1_group(), pt.get(), ctx.get()) == 1;
}

core::Result<PubKey> pubkey_tweak_add(
    std::span<const uint8_t> pubkey, std::span<const uint8_t, 32> tweak) {
    Scalar one{};
    one[31] = 1;
    return point_mul_add(pubkey, one, tweak);
}

core::Result<PubKey> point_mul_add(
    std::span<const uint8_t> point,
    std::span<const uint8_t, 32> a,
    std::span<const uint8_t, 32> b) {
    BN_CTX_ptr ctx{BN_CTX_new()};
    EC_PT_ptr p = point_from_bytes(point, ctx.get());
    if (!p) {
        return ec_error("invalid curve point");
    }
    BN_ptr a_bn = scalar_from_bytes(a);
    BN_ptr b_bn = scalar_from_bytes(b);
    if (!a_bn || !b_bn) {
        return ec_error("scalar is not below the curve order");
    }

    // EC_POINT_mul computes b*G + a*P in one call.
    const EC_GROUP* grp = secp256k1_group();
    EC_PT_ptr r{EC_POINT_new(grp)};
    if (!EC_POINT_mul(grp, r.get(), b_bn.get(), p.get(), a_bn.get(),
                      ctx.get())) {
        return ec_error("EC_POINT_mul failed");
    }

    PubKey out{};
    if (!point_to_bytes(r.get(), out, ctx.get())) {
        return ec_error("result is the point at infinity");
    }
    return out;
}

core::Result<PubKey> lift_x(std::span<const uint8_t, 32> x) {
    PubKey candidate{};
    candidate[0] = 0x02;
    std::memcpy(candidate.data() + 1, x.data(), 32);

    BN_CTX_ptr ctx{BN_CTX_new()};
    EC_PT_ptr pt = point_from_bytes(candidate, ctx.get());
    if (!pt) {
        return core::Error(core::ErrorCode::CRYPTO_ERROR,
                           "x-coordinate is not on the curve");
    }
    return candidate;
}

}  // namespace crypto
