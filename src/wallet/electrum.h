#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "net/stream.h"
#include "rpc/json.h"
#include "wallet/backend.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wallet {

// ---------------------------------------------------------------------------
// ElectrumUrl -- server endpoint and transport security
// ---------------------------------------------------------------------------
// `ssl://host:port` selects TLS with certificate and domain validation,
// `tcp://host:port` plaintext.  TLS toward a bare IP address cannot be
// validated and is rejected.
// ---------------------------------------------------------------------------
class ElectrumUrl {
public:
    /// Parse a `scheme://host:port` URL.  Errors are PARSE_BAD_FORMAT with
    /// a message naming the offending part.
    static core::Result<ElectrumUrl> parse(std::string_view url);

    /// Build from a bare `host:port` and explicit flags.  Domain
    /// validation requires TLS.
    static core::Result<ElectrumUrl> make(std::string_view host_port,
                                          bool tls, bool validate_domain);

    [[nodiscard]] const std::string& host() const { return host_; }
    [[nodiscard]] uint16_t port() const { return port_; }
    [[nodiscard]] bool tls() const { return tls_; }
    [[nodiscard]] bool validate_domain() const { return validate_domain_; }

    /// `host:port`, without the scheme.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const ElectrumUrl&) const = default;

private:
    std::string host_;
    uint16_t port_ = 0;
    bool tls_ = false;
    bool validate_domain_ = false;
};

// ---------------------------------------------------------------------------
// Protocol helpers
// ---------------------------------------------------------------------------

/// Key under which Electrum servers index a script: sha256(script) in
/// reversed byte order, hex encoded.
[[nodiscard]] std::string electrum_script_hash(
    const primitives::script::Script& script);

/// One raw `get_history` entry: txid (display hex) and server height
/// (<= 0 for mempool entries).
struct RawHistoryEntry {
    std::string tx_hash;
    int64_t height = 0;
};

/// Status the server would report for @p history: hex sha256 over the
/// concatenation of "tx_hash:height:".  nullopt for an empty history.
[[nodiscard]] std::optional<StatusFingerprint> electrum_status(
    const std::vector<RawHistoryEntry>& history);

/// Decode one `get_history` reply.  Malformed entries are NETWORK_PROTOCOL.
core::Result<std::vector<RawHistoryEntry>> parse_history_reply(
    const rpc::JsonValue& reply);

// ---------------------------------------------------------------------------
// ElectrumClient -- BlockchainBackend over the Electrum protocol
// ---------------------------------------------------------------------------
// Newline-delimited JSON-RPC 2.0.  Notifications the server pushes between
// replies (new headers, script status changes) are absorbed while waiting
// for a reply.  A broken connection is re-established on the next call;
// script subscriptions are re-issued lazily.
// ---------------------------------------------------------------------------
class ElectrumClient final : public BlockchainBackend {
public:
    static constexpr size_t MAX_BATCH = 200;
    static constexpr const char* PROTOCOL_VERSION = "1.4";

    /// Connect, negotiate the protocol version and subscribe to headers.
    static core::Result<std::unique_ptr<ElectrumClient>> connect(
        const ElectrumUrl& url, int timeout_ms, net::StreamOpener opener = {});

    ~ElectrumClient() override;

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

    [[nodiscard]] const ElectrumUrl& url() const { return url_; }

private:
    using Request = std::pair<std::string, rpc::JsonValue>;

    ElectrumClient(ElectrumUrl url, int timeout_ms, net::StreamOpener opener);

    core::Result<void> ensure_connected();
    void disconnect();

    /// Send one request and wait for its reply.
    core::Result<rpc::JsonValue> call(const std::string& method,
                                      rpc::JsonValue params);

    /// Send requests as JSON arrays of at most MAX_BATCH entries and
    /// return the results in request order.
    core::Result<std::vector<rpc::JsonValue>> batch(
        const std::vector<Request>& requests);

    core::Result<std::vector<rpc::JsonValue>> exchange(
        const std::vector<Request>& requests);

    /// Handle one decoded message; replies land in @p replies.
    void dispatch(const rpc::JsonValue& msg,
                  std::map<int64_t, rpc::JsonValue>& replies);

    /// Consume notifications already waiting on the connection.
    core::Result<void> drain_notifications();

    core::Result<ChainTip> tip_from_header(const rpc::JsonValue& header);

    ElectrumUrl url_;
    int timeout_ms_;
    net::StreamOpener opener_;
    std::unique_ptr<net::Stream> stream_;
    std::unique_ptr<net::LineReader> reader_;
    int64_t next_id_ = 1;

    std::optional<rpc::JsonValue> pending_header_;
    std::set<std::string> subscribed_;
    std::map<std::string, std::optional<StatusFingerprint>> statuses_;
};

} // namespace wallet
