// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/descriptor.h"

#include "core/hex.h"
#include "core/logging.h"
#include "crypto/sha256.h"

#include <algorithm>
#include <cstring>
#include <optional>
#include <utility>

namespace wallet {

// ---------------------------------------------------------------------------
// BIP-380 checksum
// ---------------------------------------------------------------------------

namespace {

constexpr std::string_view INPUT_CHARSET =
    "0123456789()[],'/*abcdefgh@:$%{}"
    "IJKLMNOPQRSTUVWXYZ&+-.;<=>?!^_|~"
    "ijklmnopqrstuvwxyzABCDEFGH`#\"\\ ";

constexpr std::string_view CHECKSUM_CHARSET =
    "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

uint64_t desc_polymod(uint64_t c, int val) {
    uint8_t c0 = static_cast<uint8_t>(c >> 35);
    c = ((c & 0x7ffffffffULL) << 5) ^ static_cast<uint64_t>(val);
    if (c0 & 1)  c ^= 0xf5dee51989ULL;
    if (c0 & 2)  c ^= 0xa9fdca3312ULL;
    if (c0 & 4)  c ^= 0x1bab10e32dULL;
    if (c0 & 8)  c ^= 0x3706b1677aULL;
    if (c0 & 16) c ^= 0x644d626ffdULL;
    return c;
}

core::Error parse_error(std::string msg) {
    return core::Error(core::ErrorCode::PARSE_BAD_FORMAT, std::move(msg));
}

// Split "a,b" at the first comma that is not nested in parentheses.
std::optional<std::pair<std::string_view, std::string_view>>
split_top_level(std::string_view s) {
    int depth = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        char ch = s[i];
        if (ch == '(' || ch == '[') ++depth;
        else if (ch == ')' || ch == ']') --depth;
        else if (ch == ',' && depth == 0) {
            return std::make_pair(s.substr(0, i), s.substr(i + 1));
        }
    }
    return std::nullopt;
}

// Strip "name(" ... ")" and return the inside.
std::optional<std::string_view> unwrap(std::string_view s,
                                       std::string_view name) {
    if (s.size() < name.size() + 2) return std::nullopt;
    if (s.substr(0, name.size()) != name) return std::nullopt;
    if (s[name.size()] != '(' || s.back() != ')') return std::nullopt;
    return s.substr(name.size() + 1, s.size() - name.size() - 2);
}

} // anonymous namespace

core::Result<std::string> descriptor_checksum(std::string_view desc) {
    uint64_t c = 1;
    int cls = 0;
    int clscount = 0;
    for (char ch : desc) {
        auto pos = INPUT_CHARSET.find(ch);
        if (pos == std::string_view::npos) {
            return parse_error(std::string("invalid descriptor character '") +
                               ch + "'");
        }
        c = desc_polymod(c, static_cast<int>(pos & 31));
        cls = cls * 3 + static_cast<int>(pos >> 5);
        if (++clscount == 3) {
            c = desc_polymod(c, cls);
            cls = 0;
            clscount = 0;
        }
    }
    if (clscount > 0) c = desc_polymod(c, cls);
    for (int j = 0; j < 8; ++j) c = desc_polymod(c, 0);
    c ^= 1;

    std::string ret(8, ' ');
    for (int j = 0; j < 8; ++j) {
        ret[j] = CHECKSUM_CHARSET[(c >> (5 * (7 - j))) & 31];
    }
    return ret;
}

core::Result<std::string> add_checksum(std::string_view desc) {
    auto sum = descriptor_checksum(desc);
    if (!sum) return sum.error();
    return std::string(desc) + "#" + sum.value();
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

core::Result<ConfidentialDescriptor> ConfidentialDescriptor::parse(
    std::string_view desc, Network network) {
    // Checksum.
    std::string_view body = desc;
    auto hash_pos = desc.find('#');
    if (hash_pos != std::string_view::npos) {
        body = desc.substr(0, hash_pos);
        std::string_view given = desc.substr(hash_pos + 1);
        auto expected = descriptor_checksum(body);
        if (!expected) return expected.error();
        if (given != expected.value()) {
            return core::Error(core::ErrorCode::PARSE_BAD_CHECKSUM,
                               "descriptor checksum mismatch: expected " +
                               expected.value());
        }
    }

    auto ct = unwrap(body, "ct");
    if (!ct) return parse_error("descriptor must be ct(<blinding>,<desc>)");
    auto parts = split_top_level(*ct);
    if (!parts) return parse_error("ct() needs two arguments");
    auto [blinding, inner] = *parts;

    ConfidentialDescriptor d;
    d.network_ = network;

    // Blinding key specifier.
    if (auto slip77 = unwrap(blinding, "slip77")) {
        auto bytes = core::from_hex(*slip77);
        if (!bytes || bytes->size() != 32) {
            return parse_error("slip77() needs a 64-hex master key");
        }
        d.blinding_kind_ = BlindingKind::Slip77;
        std::copy(bytes->begin(), bytes->end(), d.blinding_secret_.begin());
    } else if (blinding.size() == 64) {
        auto bytes = core::from_hex(blinding);
        if (!bytes || !crypto::is_valid_secret(
                std::span<const uint8_t, 32>(bytes->data(), 32))) {
            return parse_error("invalid private view key");
        }
        d.blinding_kind_ = BlindingKind::ViewKey;
        std::copy(bytes->begin(), bytes->end(), d.blinding_secret_.begin());
    } else if (blinding.size() == 66) {
        auto bytes = core::from_hex(blinding);
        if (!bytes || !crypto::is_valid_pubkey(*bytes)) {
            return parse_error("invalid blinding public key");
        }
        d.blinding_kind_ = BlindingKind::Bare;
    } else {
        return parse_error("unsupported blinding key specifier");
    }

    // elwpkh([origin]xpub/path/*)
    auto key_expr = unwrap(inner, "elwpkh");
    if (!key_expr) return parse_error("only elwpkh() descriptors are supported");
    std::string_view key = *key_expr;

    if (!key.empty() && key[0] == '[') {
        auto close = key.find(']');
        if (close == std::string_view::npos) {
            return parse_error("unterminated key origin");
        }
        key.remove_prefix(close + 1);
    }

    if (key.size() < 2 || key.substr(key.size() - 2) != "/*") {
        return parse_error("key expression must end with /*");
    }
    key.remove_suffix(2);

    std::string_view xpub_str = key;
    std::string_view path;
    auto slash = key.find('/');
    if (slash != std::string_view::npos) {
        xpub_str = key.substr(0, slash);
        path = key.substr(slash);
    }
    if (path.find_first_of("'h<;>*") != std::string_view::npos) {
        return parse_error("only unhardened single-path derivation is supported");
    }

    auto xkey = crypto::ExtendedPubKey::from_base58(xpub_str);
    if (!xkey) {
        if (xkey.error().code() == core::ErrorCode::VALIDATION_ERROR) {
            return parse_error("descriptor must use an extended public key");
        }
        return xkey.error();
    }
    if (xkey.value().is_testnet() != params(network).testnet_keys) {
        return core::Error(core::ErrorCode::CRYPTO_NETWORK_MISMATCH,
                           "extended key version does not match network " +
                           std::string(network_name(network)));
    }

    auto derived = xkey.value().derive_path(path);
    if (!derived) return derived.error();
    d.xpub_ = derived.value();

    auto canonical = add_checksum(body);
    if (!canonical) return canonical.error();
    d.canonical_ = canonical.value();

    LOG_DEBUG(core::LogCategory::WALLET,
              "parsed descriptor for " + std::string(network_name(network)));
    return d;
}

// ---------------------------------------------------------------------------
// Derivation
// ---------------------------------------------------------------------------

core::Result<primitives::script::Script>
ConfidentialDescriptor::script_pubkey(uint32_t index) const {
    if (index >= crypto::ExtendedPubKey::HARDENED_BIT) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "derivation index out of range");
    }
    auto child = xpub_.derive(index);
    if (!child) return child.error();
    auto pk = child.value().pubkey();
    return primitives::script::Script::p2wpkh(crypto::hash160(pk));
}

core::Result<crypto::ECKey> ConfidentialDescriptor::blinding_key(
    const primitives::script::Script& script) const {
    switch (blinding_kind_) {
    case BlindingKind::Slip77: {
        auto secret = crypto::hmac_sha256(
            blinding_secret_, std::span<const uint8_t>(script.data()));
        return crypto::ECKey::from_secret(secret);
    }
    case BlindingKind::ViewKey:
        return crypto::ECKey::from_secret(blinding_secret_);
    case BlindingKind::Bare:
        break;
    }
    return core::Error(core::ErrorCode::WALLET_UNSUPPORTED_BLINDING,
                       "descriptor has only a blinding public key");
}

core::Result<DerivedAddress> ConfidentialDescriptor::derive(
    uint32_t index) const {
    auto script = script_pubkey(index);
    if (!script) return script.error();
    auto key = blinding_key(script.value());
    if (!key) return key.error();

    auto addr = Address::from_script(script.value(), network_,
                                     key.value().pubkey_compressed());
    if (!addr) return addr.error();

    DerivedAddress out;
    out.index = index;
    out.script = std::move(script).value();
    out.address = std::move(addr).value();
    return out;
}

std::string ConfidentialDescriptor::wallet_id() const {
    crypto::Sha256Hasher hasher;
    hasher.write(canonical_.data(), canonical_.size());
    auto name = network_name(network_);
    hasher.write(name.data(), name.size());
    auto digest = hasher.finalize();
    return core::to_hex(std::span<const uint8_t>(digest.data(), 32));
}

} // namespace wallet
