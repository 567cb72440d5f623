#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/config.h"
#include "core/error.h"
#include "wallet/network.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace wallet {

// ---------------------------------------------------------------------------
// WalletOptions -- validated wallet settings
// ---------------------------------------------------------------------------
// Built from core::Config (command line over ctwallet.conf). Only the
// descriptor is mandatory; backends read their own fields when used.
// ---------------------------------------------------------------------------
struct WalletOptions {
    static constexpr uint32_t DEFAULT_GAP_LIMIT = 20;
    static constexpr uint32_t DEFAULT_HEADER_WINDOW = 100;
    static constexpr uint32_t DEFAULT_TIMEOUT_MS = 10'000;

    Network network = Network::Liquid;
    std::string descriptor;

    /// Root data directory; the store lives in datadir/<wallet id>.
    std::filesystem::path datadir;
    /// When false the store is kept in memory only.
    bool persist = true;

    uint32_t gap_limit = DEFAULT_GAP_LIMIT;
    uint32_t header_window = DEFAULT_HEADER_WINDOW;

    // Electrum backend.
    std::string electrum_url;
    bool tls = false;
    bool validate_domain = true;
    uint32_t timeout_ms = DEFAULT_TIMEOUT_MS;

    // Elements node RPC backend.
    std::string rpc_host = "127.0.0.1";
    uint16_t rpc_port = 0;          // 0 = network default
    std::string rpc_user;
    std::string rpc_password;

    /// Validate and convert the configuration. Errors name the bad key.
    /// Node-only commands pass require_descriptor = false.
    static core::Result<WalletOptions> from_config(const core::Config& config,
                                                   bool require_descriptor = true);

    /// Default elementsd RPC port of @p network.
    [[nodiscard]] static uint16_t default_rpc_port(Network network);
};

} // namespace wallet
