// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/network.h"

#include <string>

namespace wallet {

namespace {

constexpr NetworkParams LIQUID_PARAMS{
    Network::Liquid, "liquid",
    "6f0279e9ed041c3d710a9f57d0c02928416460c4b722ae3457a11eec381c526d",
    "ex", "lq", false};

constexpr NetworkParams LIQUID_TESTNET_PARAMS{
    Network::LiquidTestnet, "liquidtestnet",
    "144c654344aa716d6f3abcc1ca90e5641e4e2a7f633bc09fe3baf64585819a49",
    "tex", "tlq", true};

constexpr NetworkParams ELEMENTS_REGTEST_PARAMS{
    Network::ElementsRegtest, "elementsregtest",
    "5ac9f65c0efcc4775e0baec4ec03abdde22473cd3cf33c0419ca290e0751b225",
    "ert", "el", true};

} // anonymous namespace

const NetworkParams& params(Network net) noexcept {
    switch (net) {
    case Network::Liquid:          return LIQUID_PARAMS;
    case Network::LiquidTestnet:   return LIQUID_TESTNET_PARAMS;
    case Network::ElementsRegtest: return ELEMENTS_REGTEST_PARAMS;
    }
    return LIQUID_PARAMS;
}

std::string_view network_name(Network net) noexcept {
    return params(net).name;
}

core::uint256 policy_asset(Network net) {
    return core::uint256::from_hex(params(net).policy_asset_hex);
}

core::Result<Network> parse_network(std::string_view name) {
    if (name == "liquid") return Network::Liquid;
    if (name == "liquidtestnet" || name == "testnet") {
        return Network::LiquidTestnet;
    }
    if (name == "elementsregtest" || name == "regtest") {
        return Network::ElementsRegtest;
    }
    return core::Error(core::ErrorCode::VALIDATION_ERROR,
                       "unknown network: " + std::string(name));
}

core::Result<void> check_network(Network expected, Network got) {
    if (expected != got) {
        return core::Error(core::ErrorCode::CRYPTO_NETWORK_MISMATCH,
                           "network mismatch: wallet is " +
                           std::string(network_name(expected)) +
                           ", got " + std::string(network_name(got)));
    }
    return core::make_ok();
}

} // namespace wallet
