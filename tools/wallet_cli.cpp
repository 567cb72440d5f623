// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// ctwallet-cli -- watch-only confidential wallet
//
// Keeps a local cache of the wallet's transactions and unblinded outputs,
// synchronised from an Electrum server; an elementsd node can serve the
// chain tip and broadcasts.
//
// Usage:
//   ctwallet-cli [options] <command> [args...]
//
// Commands:
//   address                     Hand out the next receive address
//   sync                        Run one sync pass against the Electrum server
//   balance                     Balance per asset
//   utxos                       Unspent outputs
//   transactions                Wallet transactions
//   tip                         Refresh and show the chain tip
//   broadcast <hex>             Submit a signed transaction
//   height                      Block count of the elementsd node
//   descriptor-checksum <desc>  Descriptor with its checksum
//
// Options (also accepted in <datadir>/ctwallet.conf):
//   -descriptor=<ct(...)>       Wallet descriptor
//   -network=<name>             liquid | liquidtestnet | elementsregtest
//   -datadir=<dir>              Data directory
//   -electrum=<url>             ssl://host:port or tcp://host:port
//   -rpcconnect, -rpcport, -rpcuser, -rpcpassword   elementsd RPC
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/error.h"
#include "core/fs.h"
#include "core/logging.h"
#include "core/time.h"
#include "rpc/json.h"
#include "wallet/descriptor.h"
#include "wallet/electrum.h"
#include "wallet/elements_rpc.h"
#include "wallet/logging_init.h"
#include "wallet/options.h"
#include "wallet/wallet.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

void print_usage() {
    std::cout << "ctwallet-cli v0.1.0\n\n"
              << "Usage: ctwallet-cli [options] <command> [args...]\n\n"
              << "Commands:\n"
              << "  address                     Hand out the next receive address\n"
              << "  sync                        Sync with the Electrum server\n"
              << "  balance                     Balance per asset\n"
              << "  utxos                       Unspent outputs\n"
              << "  transactions                Wallet transactions\n"
              << "  tip                         Refresh and show the chain tip\n"
              << "  broadcast <hex>             Submit a signed transaction\n"
              << "  height                      Block count of the elementsd node\n"
              << "  descriptor-checksum <desc>  Descriptor with its checksum\n\n"
              << "Options:\n"
              << "  -descriptor=<desc>          ct(...) wallet descriptor\n"
              << "  -network=<name>             liquid, liquidtestnet, elementsregtest\n"
              << "  -datadir=<dir>              Data directory\n"
              << "  -conf=<file>                Configuration file\n"
              << "  -electrum=<url>             ssl://host:port or tcp://host:port\n"
              << "  -tls -validatedomain=0      Flags for a bare host:port URL\n"
              << "  -rpcconnect=<host> -rpcport=<port> -rpcuser=<u> -rpcpassword=<p>\n"
              << "  -gaplimit=<n> -timeout=<ms> -loglevel=<level> -printtoconsole\n";
}

int fail(const core::Error& err) {
    std::cerr << "error: " << err.message() << std::endl;
    LOG_ERROR(core::LogCategory::WALLET, err.format());
    return 1;
}

void print_json(const rpc::JsonValue& value) {
    std::cout << rpc::json_serialize_pretty(value);
}

// ---------------------------------------------------------------------------
// JSON views
// ---------------------------------------------------------------------------

rpc::JsonValue height_json(const std::optional<uint32_t>& height) {
    return height ? rpc::JsonValue(*height) : rpc::JsonValue(nullptr);
}

rpc::JsonValue tip_json(const std::optional<wallet::ChainTip>& tip) {
    if (!tip) return rpc::JsonValue(nullptr);
    rpc::JsonValue out(rpc::JsonValue::Object{});
    out["height"] = tip->height;
    out["hash"] = tip->hash.to_hex();
    out["timestamp"] = tip->timestamp;
    out["time"] = core::format_iso8601(tip->timestamp);
    return out;
}

rpc::JsonValue utxo_json(const wallet::Utxo& utxo) {
    rpc::JsonValue out(rpc::JsonValue::Object{});
    out["txid"] = utxo.outpoint.txid.to_hex();
    out["vout"] = utxo.outpoint.n;
    out["script_pubkey"] = utxo.script.to_hex();
    out["height"] = height_json(utxo.height);
    out["asset"] = utxo.secrets.asset.to_hex();
    out["value"] = utxo.secrets.value;
    out["asset_blinder"] = utxo.secrets.asset_bf.to_hex();
    out["value_blinder"] = utxo.secrets.value_bf.to_hex();
    return out;
}

rpc::JsonValue tx_json(const wallet::WalletTx& wtx) {
    rpc::JsonValue out(rpc::JsonValue::Object{});
    out["txid"] = wtx.txid.to_hex();
    out["height"] = height_json(wtx.height);
    out["timestamp"] = height_json(wtx.timestamp);
    out["time"] = wtx.timestamp ? rpc::JsonValue(core::format_iso8601(*wtx.timestamp))
                                : rpc::JsonValue(nullptr);
    out["fee"] = wtx.fee;
    rpc::JsonValue balance(rpc::JsonValue::Object{});
    for (const auto& [asset, delta] : wtx.balance) {
        balance[asset.to_hex()] = delta;
    }
    out["balance"] = std::move(balance);
    return out;
}

// ---------------------------------------------------------------------------
// Backends
// ---------------------------------------------------------------------------

core::Result<wallet::ElectrumUrl> electrum_url(const wallet::WalletOptions& opts) {
    if (opts.electrum_url.empty()) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "no Electrum server configured (-electrum=<url>)");
    }
    if (opts.electrum_url.find("://") != std::string::npos) {
        return wallet::ElectrumUrl::parse(opts.electrum_url);
    }
    return wallet::ElectrumUrl::make(opts.electrum_url, opts.tls,
                                     opts.tls && opts.validate_domain);
}

wallet::ElementsRpcConfig rpc_config(const wallet::WalletOptions& opts) {
    wallet::ElementsRpcConfig cfg;
    cfg.host = opts.rpc_host;
    cfg.port = opts.rpc_port != 0
        ? opts.rpc_port
        : wallet::WalletOptions::default_rpc_port(opts.network);
    cfg.user = opts.rpc_user;
    cfg.password = opts.rpc_password;
    cfg.timeout_ms = static_cast<int>(opts.timeout_ms);
    return cfg;
}

/// Electrum when configured; otherwise the node, unless script queries
/// are needed.
core::Result<std::unique_ptr<wallet::BlockchainBackend>> make_backend(
    const wallet::WalletOptions& opts, bool needs_script_index) {
    if (!opts.electrum_url.empty() || needs_script_index) {
        CTW_TRY_ASSIGN(url, electrum_url(opts));
        CTW_TRY_ASSIGN(client, wallet::ElectrumClient::connect(
                                   url, static_cast<int>(opts.timeout_ms)));
        return std::unique_ptr<wallet::BlockchainBackend>(std::move(client));
    }
    return std::unique_ptr<wallet::BlockchainBackend>(
        new wallet::ElementsRpcClient(rpc_config(opts)));
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int cmd_descriptor_checksum(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Usage: ctwallet-cli descriptor-checksum <descriptor>" << std::endl;
        return 1;
    }
    auto with_checksum = wallet::add_checksum(args[1]);
    if (!with_checksum.ok()) return fail(with_checksum.error());
    std::cout << with_checksum.value() << std::endl;
    return 0;
}

int cmd_height(const wallet::WalletOptions& opts) {
    wallet::ElementsRpcClient node(rpc_config(opts));
    auto height = node.height();
    if (!height.ok()) return fail(height.error());
    std::cout << height.value() << std::endl;
    return 0;
}

int run_wallet_command(const std::string& command,
                       const std::vector<std::string>& args,
                       const wallet::WalletOptions& opts) {
    auto opened = wallet::Wallet::open(opts);
    if (!opened.ok()) return fail(opened.error());
    wallet::Wallet& w = *opened.value();

    if (command == "address") {
        auto addr = w.address();
        if (!addr.ok()) return fail(addr.error());
        rpc::JsonValue out(rpc::JsonValue::Object{});
        out["index"] = addr.value().index;
        out["address"] = addr.value().address.to_string();
        out["unconfidential"] = addr.value().address.to_unconfidential().to_string();
        out["script_pubkey"] = addr.value().script.to_hex();
        print_json(out);
        return 0;
    }

    if (command == "balance") {
        auto balance = w.balance();
        if (!balance.ok()) return fail(balance.error());
        rpc::JsonValue out(rpc::JsonValue::Object{});
        for (const auto& [asset, amount] : balance.value()) {
            out[asset.to_hex()] = amount;
        }
        print_json(out);
        return 0;
    }

    if (command == "utxos") {
        auto utxos = w.utxos();
        if (!utxos.ok()) return fail(utxos.error());
        rpc::JsonValue out(rpc::JsonValue::Array{});
        for (const auto& u : utxos.value()) out.push_back(utxo_json(u));
        print_json(out);
        return 0;
    }

    if (command == "transactions") {
        auto txs = w.transactions();
        if (!txs.ok()) return fail(txs.error());
        rpc::JsonValue out(rpc::JsonValue::Array{});
        for (const auto& t : txs.value()) out.push_back(tx_json(t));
        print_json(out);
        return 0;
    }

    if (command == "sync") {
        auto backend = make_backend(opts, true);
        if (!backend.ok()) return fail(backend.error());
        auto changed = w.sync(*backend.value());
        if (!changed.ok()) return fail(changed.error());
        auto tip = w.tip();
        if (!tip.ok()) return fail(tip.error());
        rpc::JsonValue out(rpc::JsonValue::Object{});
        out["changed"] = changed.value();
        out["tip"] = tip_json(tip.value());
        print_json(out);
        return 0;
    }

    if (command == "tip") {
        auto backend = make_backend(opts, false);
        if (!backend.ok()) return fail(backend.error());
        auto changed = w.sync_tip(*backend.value());
        if (!changed.ok()) return fail(changed.error());
        auto tip = w.tip();
        if (!tip.ok()) return fail(tip.error());
        print_json(tip_json(tip.value()));
        return 0;
    }

    if (command == "broadcast") {
        if (args.size() < 2) {
            std::cerr << "Usage: ctwallet-cli broadcast <hex>" << std::endl;
            return 1;
        }
        auto tx = primitives::Transaction::from_hex(args[1]);
        if (!tx.ok()) return fail(tx.error());
        auto backend = make_backend(opts, false);
        if (!backend.ok()) return fail(backend.error());
        auto txid = w.broadcast(*backend.value(), tx.value());
        if (!txid.ok()) return fail(txid.error());
        std::cout << txid.value().to_hex() << std::endl;
        return 0;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    std::cerr << "Run 'ctwallet-cli' without arguments for help." << std::endl;
    return 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    core::Config config;
    config.parse_args(argc, argv);

    const auto& args = config.positionals();
    if (args.empty() || config.has("help")) {
        print_usage();
        return 0;
    }
    const std::string& command = args[0];

    if (command == "descriptor-checksum") {
        return cmd_descriptor_checksum(args);
    }

    std::filesystem::path conf_path = config.has(core::CONF_CONF)
        ? std::filesystem::path(config.get_or(core::CONF_CONF, ""))
        : config.data_dir() / "ctwallet.conf";
    if (core::fs::file_exists(conf_path)) {
        auto loaded = config.parse_file(conf_path);
        if (!loaded.ok()) {
            std::cerr << "error: " << loaded.error().message() << std::endl;
            return 1;
        }
    }

    auto logging = wallet::init_logging(config);
    if (!logging.ok()) {
        std::cerr << "error: " << logging.error().message() << std::endl;
        return 1;
    }

    const bool node_only = command == "height";
    auto opts = wallet::WalletOptions::from_config(config, !node_only);
    if (!opts.ok()) return fail(opts.error());

    if (node_only) {
        return cmd_height(opts.value());
    }
    return run_wallet_command(command, args, opts.value());
}
