#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Descriptors and transaction builders shared by the wallet tests.

#include "core/types.h"
#include "crypto/confidential.h"
#include "crypto/sha256.h"
#include "primitives/confidential.h"
#include "primitives/transaction.h"
#include "wallet/descriptor.h"
#include "wallet/network.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace fixtures {

/// BIP-32 test vector 1, master public key.
inline const std::string XPUB =
    "xpub661MyMwAqRbcFtXgS5sYJABqqG9YLmC4Q1Rdap9gSE8NqtwybGhePY2gZ29ESFjqJoCu1Rupje8YtGqsefD265TMg7usUDFdp6W1EGMcet8";

inline const std::string SLIP77_KEY =
    "9c8e4f05c7711a98c838be228bcb84924d4570ca53f35fa1c793e58841d47023";

inline const std::string VIEW_KEY =
    "1111111111111111111111111111111111111111111111111111111111111111";

/// A second, unrelated master blinding key.
inline const std::string OTHER_SLIP77_KEY =
    "2222222222222222222222222222222222222222222222222222222222222222";

inline std::string slip77_descriptor(const std::string& key = SLIP77_KEY) {
    return "ct(slip77(" + key + "),elwpkh(" + XPUB + "/0/*))";
}

inline std::string view_key_descriptor() {
    return "ct(" + VIEW_KEY + ",elwpkh(" + XPUB + "/0/*))";
}

inline wallet::ConfidentialDescriptor descriptor(
    const std::string& text = slip77_descriptor()) {
    auto parsed = wallet::ConfidentialDescriptor::parse(text,
                                                        wallet::Network::Liquid);
    if (!parsed) throw std::runtime_error(parsed.error().message());
    return std::move(parsed).value();
}

inline core::uint256 policy() {
    return wallet::policy_asset(wallet::Network::Liquid);
}

/// A made-up asset id distinct from the policy asset.
inline core::uint256 other_asset() {
    return core::uint256::from_hex(
        "0000000000000000000000000000000000000000000000000000000000abcdef");
}

/// Deterministic previous outpoint for funding transactions.
inline primitives::OutPoint funding_outpoint(const std::string& seed) {
    return primitives::OutPoint(crypto::sha256(seed.data(), seed.size()), 0);
}

/// Output blinded to @p address's blinding key.
inline primitives::TxOutput blinded_output(const wallet::Address& address,
                                           const core::uint256& asset,
                                           uint64_t value) {
    if (!address.blinding_pubkey) {
        throw std::runtime_error("address is not confidential");
    }
    auto blinded = crypto::blind_output(asset, value, *address.blinding_pubkey,
                                        address.script_pubkey().data());
    if (!blinded) throw std::runtime_error(blinded.error().message());

    primitives::TxOutput out;
    out.asset = primitives::ConfidentialAsset::from_commitment(
        blinded.value().asset_commitment);
    out.value = primitives::ConfidentialValue::from_commitment(
        blinded.value().value_commitment);
    out.nonce = primitives::nonce_from_pubkey(blinded.value().nonce_commitment);
    out.script_pubkey = address.script_pubkey();
    out.witness.rangeproof = blinded.value().rangeproof;
    return out;
}

inline primitives::TxOutput explicit_output(const primitives::script::Script& script,
                                            const core::uint256& asset,
                                            uint64_t value) {
    primitives::TxOutput out;
    out.asset = primitives::ConfidentialAsset::from_explicit(asset);
    out.value = primitives::ConfidentialValue::from_explicit(value);
    out.script_pubkey = script;
    return out;
}

inline primitives::TxOutput fee_output(uint64_t value) {
    return explicit_output(primitives::script::Script(), policy(), value);
}

/// Spends @p inputs into @p outputs plus an explicit fee.
inline primitives::Transaction make_tx(std::vector<primitives::OutPoint> inputs,
                                       std::vector<primitives::TxOutput> outputs,
                                       uint64_t fee = 100) {
    std::vector<primitives::TxInput> vin;
    for (const auto& op : inputs) vin.emplace_back(op);
    outputs.push_back(fee_output(fee));
    return primitives::Transaction(std::move(vin), std::move(outputs));
}

/// External funding of @p address with one blinded output.
inline primitives::Transaction pay_to(const wallet::Address& address,
                                      const core::uint256& asset,
                                      uint64_t value,
                                      const std::string& seed) {
    return make_tx({funding_outpoint(seed)},
                   {blinded_output(address, asset, value)});
}

} // namespace fixtures
