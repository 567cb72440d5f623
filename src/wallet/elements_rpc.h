#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "net/stream.h"
#include "rpc/json.h"
#include "wallet/backend.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace wallet {

/// Where and how to reach an elementsd JSON-RPC endpoint.
struct ElementsRpcConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 0;
    std::string user;
    std::string password;
    int timeout_ms = 10000;
};

// ---------------------------------------------------------------------------
// ElementsRpcClient -- chain queries against an Elements full node
// ---------------------------------------------------------------------------
// JSON-RPC 1.0 over HTTP with Basic auth.  A node keeps no index from
// scripts to transactions, so the script operations report
// NOT_IMPLEMENTED; tip, headers, transactions and broadcast are served.
// Fetching arbitrary transactions needs the node's -txindex.
// ---------------------------------------------------------------------------
class ElementsRpcClient final : public BlockchainBackend {
public:
    explicit ElementsRpcClient(ElementsRpcConfig config,
                               net::StreamOpener opener = {});

    /// getblockcount
    core::Result<uint32_t> height();

    core::Result<ChainTip> tip() override;
    core::Result<std::optional<StatusFingerprint>> subscribe_or_poll(
        const primitives::script::Script& script) override;
    core::Result<std::vector<std::vector<HistoryEntry>>> histories(
        const std::vector<primitives::script::Script>& scripts) override;
    core::Result<std::vector<primitives::Transaction>> transactions(
        const std::vector<core::uint256>& txids) override;
    core::Result<std::vector<primitives::BlockHeader>> headers(
        const std::vector<uint32_t>& heights) override;
    core::Result<core::uint256> broadcast(
        const primitives::Transaction& tx) override;

    [[nodiscard]] const ElementsRpcConfig& config() const { return config_; }

private:
    using Request = std::pair<std::string, rpc::JsonValue>;

    core::Result<rpc::JsonValue> call(const std::string& method,
                                      rpc::JsonValue params);
    core::Result<std::vector<rpc::JsonValue>> batch(
        const std::vector<Request>& requests);
    core::Result<rpc::JsonValue> post(const rpc::JsonValue& payload);

    core::Result<primitives::BlockHeader> header_by_hash(const std::string& hash);

    ElementsRpcConfig config_;
    net::StreamOpener opener_;
    int64_t next_id_ = 1;
};

} // namespace wallet
