// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/options.h"

#include "core/logging.h"

#include <charconv>

namespace wallet {

namespace {

/// Parse an unsigned option in [min, max]. Absent keys keep @p out.
template <typename T>
core::Result<void> read_uint(const core::Config& config, const char* key,
                             uint64_t min, uint64_t max, T& out) {
    auto text = config.get(key);
    if (!text) return core::make_ok();

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text->data(),
                                     text->data() + text->size(), value);
    if (ec != std::errc() || ptr != text->data() + text->size() ||
        value < min || value > max) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           std::string("invalid value '") + *text +
                           "' for -" + key + " (expected " +
                           std::to_string(min) + ".." +
                           std::to_string(max) + ")");
    }
    out = static_cast<T>(value);
    return core::make_ok();
}

} // anonymous namespace

uint16_t WalletOptions::default_rpc_port(Network network) {
    switch (network) {
    case Network::Liquid:          return 7041;
    case Network::LiquidTestnet:   return 7039;
    case Network::ElementsRegtest: return 7040;
    }
    return 7041;
}

core::Result<WalletOptions> WalletOptions::from_config(
    const core::Config& config, bool require_descriptor) {
    WalletOptions opts;

    CTW_TRY_ASSIGN(network, parse_network(config.network()));
    opts.network = network;

    opts.descriptor = config.get_or(core::CONF_DESCRIPTOR, "");
    if (require_descriptor && opts.descriptor.empty()) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "missing -descriptor");
    }
    opts.datadir = config.data_dir();

    CTW_TRY_VOID(read_uint(config, core::CONF_GAPLIMIT, 1, 10'000,
                           opts.gap_limit));
    CTW_TRY_VOID(read_uint(config, core::CONF_HEADERWINDOW, 1, 100'000,
                           opts.header_window));
    CTW_TRY_VOID(read_uint(config, core::CONF_TIMEOUT, 1, 3'600'000,
                           opts.timeout_ms));

    opts.electrum_url = config.get_or(core::CONF_ELECTRUM, "");
    opts.tls = config.get_bool(core::CONF_TLS, false);
    opts.validate_domain = config.get_bool(core::CONF_VALIDATEDOMAIN, true);

    opts.rpc_host = config.get_or(core::CONF_RPCCONNECT, "127.0.0.1");
    opts.rpc_port = default_rpc_port(opts.network);
    CTW_TRY_VOID(read_uint(config, core::CONF_RPCPORT, 1, 65535,
                           opts.rpc_port));
    opts.rpc_user = config.get_or(core::CONF_RPCUSER, "");
    opts.rpc_password = config.get_or(core::CONF_RPCPASSWORD, "");

    LOG_DEBUG(core::LogCategory::WALLET,
              "options: network " + std::string(network_name(opts.network)) +
              ", gap limit " + std::to_string(opts.gap_limit) +
              ", header window " + std::to_string(opts.header_window));
    return opts;
}

} // namespace wallet
