// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/address.h"

#include "core/bech32.h"

#include <algorithm>

namespace wallet {

namespace {

constexpr Network ALL_NETWORKS[] = {
    Network::Liquid, Network::LiquidTestnet, Network::ElementsRegtest,
};

// Decode @p str as an address of @p net, confidential or not.
std::optional<Address> try_decode(std::string_view str, Network net) {
    const auto& p = params(net);

    if (auto seg = core::decode_segwit(p.bech32_hrp, str)) {
        Address addr;
        addr.network = net;
        addr.witness_version = seg->first;
        addr.program = std::move(seg->second);
        return addr;
    }

    if (auto conf = core::decode_confidential_segwit(p.blech32_hrp, str)) {
        if (conf->blinding_pubkey.size() != 33 ||
            !crypto::is_valid_pubkey(conf->blinding_pubkey)) {
            return std::nullopt;
        }
        Address addr;
        addr.network = net;
        addr.witness_version = conf->witness_version;
        addr.program = std::move(conf->program);
        crypto::PubKey pk{};
        std::copy(conf->blinding_pubkey.begin(), conf->blinding_pubkey.end(),
                  pk.begin());
        addr.blinding_pubkey = pk;
        return addr;
    }

    return std::nullopt;
}

} // anonymous namespace

primitives::script::Script Address::script_pubkey() const {
    return primitives::script::Script::witness(witness_version, program);
}

std::string Address::to_string() const {
    const auto& p = params(network);
    if (blinding_pubkey) {
        return core::encode_confidential_segwit(
            p.blech32_hrp, witness_version, *blinding_pubkey, program);
    }
    return core::encode_segwit(p.bech32_hrp, witness_version, program);
}

Address Address::to_unconfidential() const {
    Address out = *this;
    out.blinding_pubkey.reset();
    return out;
}

core::Result<Address> Address::from_script(
    const primitives::script::Script& script, Network network,
    std::optional<crypto::PubKey> blinding_pubkey) {
    auto wp = script.witness_program();
    if (!wp) {
        return core::Error(core::ErrorCode::VALIDATION_SCRIPT,
                           "script is not a witness program");
    }
    Address addr;
    addr.network = network;
    addr.witness_version = static_cast<uint8_t>(wp->first);
    addr.program = std::move(wp->second);
    addr.blinding_pubkey = blinding_pubkey;
    return addr;
}

core::Result<Address> Address::parse(std::string_view str, Network expected) {
    if (auto addr = try_decode(str, expected)) {
        return std::move(*addr);
    }
    for (Network other : ALL_NETWORKS) {
        if (other == expected) continue;
        if (try_decode(str, other)) {
            return core::Error(core::ErrorCode::CRYPTO_NETWORK_MISMATCH,
                               "address belongs to " +
                               std::string(network_name(other)));
        }
    }
    return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                       "invalid address: " + std::string(str));
}

} // namespace wallet
