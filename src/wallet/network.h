#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"

#include <cstdint>
#include <string_view>

namespace wallet {

// ---------------------------------------------------------------------------
// Network -- the chains a wallet can be bound to
// ---------------------------------------------------------------------------
enum class Network : uint8_t {
    Liquid,
    LiquidTestnet,
    ElementsRegtest,
};

struct NetworkParams {
    Network          network;
    std::string_view name;
    /// Policy (fee) asset id in display hex order.
    std::string_view policy_asset_hex;
    std::string_view bech32_hrp;
    std::string_view blech32_hrp;
    /// xpub/xprv (mainnet) vs tpub/tprv (test networks).
    bool             testnet_keys;
};

[[nodiscard]] const NetworkParams& params(Network net) noexcept;

[[nodiscard]] std::string_view network_name(Network net) noexcept;

/// Policy asset id of @p net.
[[nodiscard]] core::uint256 policy_asset(Network net);

/// Parse "liquid", "liquidtestnet" or "elementsregtest" (also accepts
/// "testnet" and "regtest").
[[nodiscard]] core::Result<Network> parse_network(std::string_view name);

/// CRYPTO_NETWORK_MISMATCH unless @p got equals @p expected.
[[nodiscard]] core::Result<void> check_network(Network expected,
                                               Network got);

} // namespace wallet
