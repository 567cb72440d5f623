// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/bip32.h"

#include <algorithm>
#include <charconv>

#include "core/base58.h"
#include "crypto/secp256k1.h"
#include "crypto/sha256.h"

namespace crypto {

namespace {

constexpr size_t PAYLOAD_SIZE = 78;

void put_be32(uint8_t* out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out[i] = static_cast<uint8_t>(v >> (24 - 8 * i));
}

uint32_t get_be32(const uint8_t* in) {
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) v = (v << 8) | in[i];
    return v;
}

} // anonymous namespace

core::Result<ExtendedPubKey> ExtendedPubKey::from_base58(std::string_view str) {
    auto decoded = core::base58check_decode(str);
    if (!decoded) {
        return core::Error(core::ErrorCode::PARSE_BAD_CHECKSUM,
                           "extended key: bad base58check encoding");
    }
    const auto& raw = *decoded;
    if (raw.size() != PAYLOAD_SIZE) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "extended key: expected 78 bytes, got " +
                           std::to_string(raw.size()));
    }

    // Layout: version | depth | parent fingerprint | child | chain | key
    ExtendedPubKey key;
    switch (get_be32(raw.data())) {
    case XPUB_VERSION: key.testnet_ = false; break;
    case TPUB_VERSION: key.testnet_ = true; break;
    default:
        // Includes xprv/tprv, whose key field starts with 0x00.
        if (raw[45] == 0x00) {
            return core::Error(core::ErrorCode::VALIDATION_ERROR,
                               "extended private keys are not accepted");
        }
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "extended key: unknown version");
    }
    key.depth_ = raw[4];
    key.parent_fingerprint_ = get_be32(raw.data() + 5);
    key.child_number_ = get_be32(raw.data() + 9);
    std::copy_n(raw.begin() + 13, 32, key.chain_code_.begin());
    std::copy_n(raw.begin() + 45, 33, key.pubkey_.begin());

    if (key.pubkey_[0] != 0x02 && key.pubkey_[0] != 0x03) {
        return core::Error(core::ErrorCode::CRYPTO_KEY_FAIL,
                           "extended key: public key is not compressed");
    }
    if (!is_valid_pubkey(key.pubkey_)) {
        return core::Error(core::ErrorCode::CRYPTO_KEY_FAIL,
                           "extended key: public key is not on the curve");
    }
    return key;
}

std::string ExtendedPubKey::to_base58() const {
    std::array<uint8_t, PAYLOAD_SIZE> raw{};
    put_be32(raw.data(), testnet_ ? TPUB_VERSION : XPUB_VERSION);
    raw[4] = depth_;
    put_be32(raw.data() + 5, parent_fingerprint_);
    put_be32(raw.data() + 9, child_number_);
    std::copy(chain_code_.begin(), chain_code_.end(), raw.begin() + 13);
    std::copy(pubkey_.begin(), pubkey_.end(), raw.begin() + 45);
    return core::base58check_encode(raw);
}

core::Result<ExtendedPubKey> ExtendedPubKey::derive(uint32_t index) const {
    if (index >= HARDENED_BIT) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "hardened index " + std::to_string(index) +
                           " needs the private key");
    }

    std::array<uint8_t, 37> data{};
    std::copy(pubkey_.begin(), pubkey_.end(), data.begin());
    put_be32(data.data() + 33, index);
    auto i = hmac_sha512(chain_code_, data);

    // IL >= n or a point at infinity: BIP32 says skip to the next index.
    auto child_pub = pubkey_tweak_add(pubkey_, std::span<const uint8_t, 32>(i.data(), 32));
    if (!child_pub) {
        return core::Error(core::ErrorCode::CRYPTO_KEY_FAIL,
                           "no valid child at index " + std::to_string(index));
    }

    ExtendedPubKey child;
    child.pubkey_ = child_pub.value();
    std::copy(i.begin() + 32, i.end(), child.chain_code_.begin());
    child.depth_ = static_cast<uint8_t>(depth_ + 1);
    child.parent_fingerprint_ = fingerprint();
    child.child_number_ = index;
    child.testnet_ = testnet_;
    return child;
}

core::Result<ExtendedPubKey> ExtendedPubKey::derive_path(std::string_view path) const {
    ExtendedPubKey current = *this;
    while (!path.empty()) {
        if (path.front() != '/') {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                               "derivation path: expected '/'");
        }
        path.remove_prefix(1);
        uint32_t index = 0;
        auto [end, ec] = std::from_chars(path.data(), path.data() + path.size(), index);
        if (ec != std::errc() || end == path.data()) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                               "derivation path: expected an index");
        }
        path.remove_prefix(static_cast<size_t>(end - path.data()));
        CTW_TRY_ASSIGN(next, current.derive(index));
        current = next;
    }
    return current;
}

uint32_t ExtendedPubKey::fingerprint() const {
    return get_be32(hash160(pubkey_).data());
}

} // namespace crypto
