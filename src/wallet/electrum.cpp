// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/electrum.h"

#include "core/hex.h"
#include "core/logging.h"
#include "crypto/sha256.h"
#include "net/socket.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <span>

namespace wallet {

namespace {

constexpr const char* CLIENT_NAME = "ctwallet 0.1.0";

core::Error url_error(std::string msg) {
    return core::Error(core::ErrorCode::PARSE_BAD_FORMAT, std::move(msg));
}

/// Split `host:port` (host may be a bracketed IPv6 literal).  An absent
/// port leaves @p port empty.
void split_host_port(std::string_view authority, std::string& host,
                     std::string& port) {
    host.clear();
    port.clear();
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            host = std::string(authority);
            return;
        }
        host = std::string(authority.substr(0, close + 1));
        std::string_view rest = authority.substr(close + 1);
        if (!rest.empty() && rest.front() == ':') port = std::string(rest.substr(1));
        return;
    }
    size_t colon = authority.rfind(':');
    if (colon == std::string_view::npos) {
        host = std::string(authority);
        return;
    }
    host = std::string(authority.substr(0, colon));
    port = std::string(authority.substr(colon + 1));
}

bool valid_scheme(std::string_view scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) ||
               c == '+' || c == '-' || c == '.';
    });
}

std::optional<uint16_t> parse_port(const std::string& text) {
    if (text.empty()) return std::nullopt;
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

std::string strip_brackets(const std::string& host) {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

/// Text of a JSON-RPC error member, which servers send as an object or
/// a bare string.
std::string error_text(const rpc::JsonValue& err) {
    if (err.is_string()) return err.get_string();
    const auto& msg = err["message"];
    if (msg.is_string()) return msg.get_string();
    return rpc::json_serialize(err);
}

bool is_already_subscribed(const core::Error& err) {
    if (err.code() != core::ErrorCode::RPC_ERROR) return false;
    std::string lower = err.message();
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("already subscribed") != std::string::npos;
}

core::Result<core::uint256> parse_txid(const rpc::JsonValue& value) {
    if (!value.is_string() || value.get_string().size() != 64 ||
        !core::is_hex(value.get_string())) {
        return protocol_violation("malformed txid in server reply");
    }
    return core::uint256::from_hex(value.get_string());
}

core::Result<std::string> expect_hex(const rpc::JsonValue& value,
                                     const char* what) {
    if (!value.is_string() || !core::is_hex(value.get_string())) {
        return protocol_violation(std::string("expected hex ") + what +
                                  " in server reply");
    }
    return value.get_string();
}

} // anonymous namespace

// ===================================================================
// ElectrumUrl
// ===================================================================

core::Result<ElectrumUrl> ElectrumUrl::parse(std::string_view url) {
    size_t colon = url.find(':');
    if (colon == std::string_view::npos || !valid_scheme(url.substr(0, colon))) {
        return url_error("relative URL without a base");
    }

    std::string scheme(url.substr(0, colon));
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    bool ssl = scheme == "ssl";
    if (!ssl && scheme != "tcp") {
        return url_error("Invalid schema `" + scheme +
                         "` supported ones are `ssl` or `tcp`");
    }

    std::string_view rest = url.substr(colon + 1);
    std::string host;
    std::string port_text;
    if (rest.substr(0, 2) == "//") {
        rest.remove_prefix(2);
        std::string_view authority = rest.substr(0, rest.find_first_of("/?#"));
        size_t at = authority.rfind('@');
        if (at != std::string_view::npos) authority.remove_prefix(at + 1);
        split_host_port(authority, host, port_text);
    }

    if (port_text.empty()) {
        return url_error("Port is missing");
    }
    auto port = parse_port(port_text);
    if (!port) {
        return url_error("invalid port number");
    }
    if (host.empty()) {
        return url_error("Domain is missing");
    }

    ElectrumUrl out;
    out.host_ = host;
    out.port_ = *port;
    if (net::is_ip_literal(host)) {
        if (ssl) {
            return url_error("Cannot specify `ssl` scheme without a domain");
        }
        return out;
    }
    std::transform(out.host_.begin(), out.host_.end(), out.host_.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    out.tls_ = ssl;
    out.validate_domain_ = ssl;
    return out;
}

core::Result<ElectrumUrl> ElectrumUrl::make(std::string_view host_port,
                                            bool tls, bool validate_domain) {
    if (validate_domain && !tls) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "Cannot validate domain without tls");
    }
    std::string host;
    std::string port_text;
    split_host_port(host_port, host, port_text);
    if (port_text.empty()) {
        return url_error("Port is missing");
    }
    auto port = parse_port(port_text);
    if (!port) {
        return url_error("invalid port number");
    }
    if (host.empty()) {
        return url_error("Domain is missing");
    }

    ElectrumUrl out;
    out.host_ = std::move(host);
    out.port_ = *port;
    out.tls_ = tls;
    out.validate_domain_ = validate_domain;
    return out;
}

std::string ElectrumUrl::to_string() const {
    return host_ + ":" + std::to_string(port_);
}

// ===================================================================
// Protocol helpers
// ===================================================================

std::string electrum_script_hash(const primitives::script::Script& script) {
    // uint256 hex is most-significant byte first, i.e. the digest reversed.
    return crypto::sha256(script.data().data(), script.data().size()).to_hex();
}

std::optional<StatusFingerprint> electrum_status(
    const std::vector<RawHistoryEntry>& history) {
    if (history.empty()) return std::nullopt;
    std::string preimage;
    for (const auto& entry : history) {
        preimage += entry.tx_hash;
        preimage += ':';
        preimage += std::to_string(entry.height);
        preimage += ':';
    }
    core::uint256 digest = crypto::sha256(preimage.data(), preimage.size());
    return core::to_hex(std::span<const uint8_t>(digest.data(), digest.size()));
}

core::Result<std::vector<RawHistoryEntry>> parse_history_reply(
    const rpc::JsonValue& reply) {
    if (!reply.is_array()) {
        return protocol_violation("get_history reply is not an array");
    }
    std::vector<RawHistoryEntry> out;
    out.reserve(reply.size());
    for (const auto& item : reply.get_array()) {
        const auto& hash = item["tx_hash"];
        const auto& height = item["height"];
        if (!hash.is_string() || hash.get_string().size() != 64 ||
            !core::is_hex(hash.get_string()) || !height.is_int()) {
            return protocol_violation("malformed get_history entry");
        }
        out.push_back(RawHistoryEntry{hash.get_string(), height.get_int()});
    }
    return out;
}

// ===================================================================
// ElectrumClient -- connection
// ===================================================================

ElectrumClient::ElectrumClient(ElectrumUrl url, int timeout_ms,
                               net::StreamOpener opener)
    : url_(std::move(url)), timeout_ms_(timeout_ms), opener_(std::move(opener)) {}

ElectrumClient::~ElectrumClient() {
    disconnect();
}

core::Result<std::unique_ptr<ElectrumClient>> ElectrumClient::connect(
    const ElectrumUrl& url, int timeout_ms, net::StreamOpener opener) {
    std::unique_ptr<ElectrumClient> client(
        new ElectrumClient(url, timeout_ms, std::move(opener)));
    CTW_TRY_VOID(client->ensure_connected());
    return client;
}

core::Result<void> ElectrumClient::ensure_connected() {
    if (stream_) return core::make_ok();

    net::StreamOptions opts;
    opts.tls = url_.tls();
    opts.validate_domain = url_.validate_domain();
    opts.timeout_ms = timeout_ms_;

    std::string host = url_.host();
    if (host.size() >= 2 && host.front() == '[') host = strip_brackets(host);

    CTW_TRY_ASSIGN(stream, opener_ ? opener_(host, url_.port(), opts)
                                   : net::open_stream(host, url_.port(), opts));
    stream_ = std::move(stream);
    reader_ = std::make_unique<net::LineReader>(*stream_);
    subscribed_.clear();

    LOG_INFO(core::LogCategory::NET,
             "electrum: connected to " + url_.to_string() +
             (url_.tls() ? " (tls)" : ""));

    rpc::JsonValue version_params(rpc::JsonValue::Array{});
    version_params.push_back(CLIENT_NAME);
    version_params.push_back(PROTOCOL_VERSION);
    auto version = call("server.version", std::move(version_params));
    if (!version.ok()) {
        disconnect();
        return version.error();
    }

    auto header = call("blockchain.headers.subscribe",
                       rpc::JsonValue(rpc::JsonValue::Array{}));
    if (!header.ok()) {
        disconnect();
        return header.error();
    }
    pending_header_ = std::move(header).value();
    return core::make_ok();
}

void ElectrumClient::disconnect() {
    reader_.reset();
    if (stream_) {
        stream_->close();
        stream_.reset();
        LOG_DEBUG(core::LogCategory::NET,
                  "electrum: disconnected from " + url_.to_string());
    }
}

// ===================================================================
// ElectrumClient -- JSON-RPC exchange
// ===================================================================

core::Result<rpc::JsonValue> ElectrumClient::call(const std::string& method,
                                                  rpc::JsonValue params) {
    std::vector<Request> one;
    one.emplace_back(method, std::move(params));
    CTW_TRY_ASSIGN(results, exchange(one));
    return std::move(results.front());
}

core::Result<std::vector<rpc::JsonValue>> ElectrumClient::batch(
    const std::vector<Request>& requests) {
    std::vector<rpc::JsonValue> out;
    out.reserve(requests.size());
    for (size_t start = 0; start < requests.size(); start += MAX_BATCH) {
        size_t end = std::min(requests.size(), start + MAX_BATCH);
        std::vector<Request> chunk(requests.begin() + static_cast<std::ptrdiff_t>(start),
                                   requests.begin() + static_cast<std::ptrdiff_t>(end));
        CTW_TRY_ASSIGN(results, exchange(chunk));
        for (auto& r : results) out.push_back(std::move(r));
    }
    return out;
}

core::Result<std::vector<rpc::JsonValue>> ElectrumClient::exchange(
    const std::vector<Request>& requests) {
    CTW_TRY_VOID(ensure_connected());

    std::vector<int64_t> ids;
    rpc::JsonValue payload(rpc::JsonValue::Array{});
    for (const auto& [method, params] : requests) {
        rpc::JsonValue req(rpc::JsonValue::Object{});
        req["jsonrpc"] = "2.0";
        req["id"] = next_id_;
        req["method"] = method;
        req["params"] = params;
        ids.push_back(next_id_++);
        payload.push_back(std::move(req));
    }

    std::string line = requests.size() == 1
        ? rpc::json_serialize(payload.at(0))
        : rpc::json_serialize(payload);
    line += '\n';

    LOG_TRACE(core::LogCategory::RPC,
              "electrum: -> " + requests.front().first +
              (requests.size() > 1 ? " (batch of " + std::to_string(requests.size()) + ")" : ""));

    auto sent = stream_->write_all(line);
    if (!sent.ok()) {
        disconnect();
        return sent.error();
    }

    std::map<int64_t, rpc::JsonValue> replies;
    auto all_answered = [&] {
        return std::all_of(ids.begin(), ids.end(),
                           [&](int64_t id) { return replies.count(id) > 0; });
    };
    while (!all_answered()) {
        auto received = reader_->read_line(timeout_ms_);
        if (!received.ok()) {
            disconnect();
            return received.error();
        }
        auto msg = rpc::try_parse_json(received.value());
        if (!msg.ok()) {
            disconnect();
            return protocol_violation("electrum: undecodable message: " +
                                      msg.error().message());
        }
        dispatch(msg.value(), replies);

        // A batch is answered by one array holding every reply.
        if (msg.value().is_array() && requests.size() > 1 && !all_answered()) {
            disconnect();
            return protocol_violation("electrum: batch reply misses entries");
        }
    }

    std::vector<rpc::JsonValue> results;
    results.reserve(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        rpc::JsonValue& reply = replies[ids[i]];
        const auto& err = reply["error"];
        if (!err.is_null()) {
            return core::Error(core::ErrorCode::RPC_ERROR,
                               requests[i].first + ": " + error_text(err));
        }
        if (!reply.has_key("result")) {
            return protocol_violation("electrum: reply without result to " +
                                      requests[i].first);
        }
        results.push_back(reply["result"]);
    }
    return results;
}

void ElectrumClient::dispatch(const rpc::JsonValue& msg,
                              std::map<int64_t, rpc::JsonValue>& replies) {
    if (msg.is_array()) {
        for (const auto& item : msg.get_array()) dispatch(item, replies);
        return;
    }
    if (!msg.is_object()) {
        LOG_DEBUG(core::LogCategory::NET, "electrum: ignoring non-object message");
        return;
    }

    const auto& id = msg["id"];
    if (id.is_int()) {
        replies[id.get_int()] = msg;
        return;
    }

    const auto& method = msg["method"];
    const auto& params = msg["params"];
    if (!method.is_string() || !params.is_array()) return;

    if (method.get_string() == "blockchain.headers.subscribe" && params.size() >= 1) {
        pending_header_ = params.at(0);
    } else if (method.get_string() == "blockchain.scripthash.subscribe" &&
               params.size() >= 2 && params.at(0).is_string()) {
        const auto& status = params.at(1);
        statuses_[params.at(0).get_string()] =
            status.is_string() ? std::optional<StatusFingerprint>(status.get_string())
                               : std::nullopt;
    }
}

core::Result<void> ElectrumClient::drain_notifications() {
    CTW_TRY_VOID(ensure_connected());
    std::map<int64_t, rpc::JsonValue> stray;
    while (true) {
        auto received = reader_->read_line(0);
        if (!received.ok()) {
            if (received.error().code() == core::ErrorCode::NETWORK_TIMEOUT) break;
            disconnect();
            return received.error();
        }
        auto msg = rpc::try_parse_json(received.value());
        if (!msg.ok()) {
            disconnect();
            return protocol_violation("electrum: undecodable notification");
        }
        dispatch(msg.value(), stray);
    }
    return core::make_ok();
}

// ===================================================================
// ElectrumClient -- BlockchainBackend
// ===================================================================

core::Result<ChainTip> ElectrumClient::tip_from_header(const rpc::JsonValue& header) {
    CTW_TRY_ASSIGN(hex, expect_hex(header["hex"], "header"));
    auto parsed = primitives::BlockHeader::from_hex(hex);
    if (!parsed.ok()) {
        return protocol_violation("electrum: undecodable header: " +
                                  parsed.error().message());
    }
    const auto& height = header["height"];
    if (height.is_int() &&
        height.get_int() != static_cast<int64_t>(parsed.value().height)) {
        return protocol_violation("electrum: header height mismatch");
    }
    ChainTip tip;
    tip.height = parsed.value().height;
    tip.hash = parsed.value().hash();
    tip.timestamp = parsed.value().timestamp;
    return tip;
}

core::Result<ChainTip> ElectrumClient::tip() {
    CTW_TRY_VOID(drain_notifications());
    if (!pending_header_) {
        CTW_TRY_ASSIGN(header, call("blockchain.headers.subscribe",
                                    rpc::JsonValue(rpc::JsonValue::Array{})));
        pending_header_ = std::move(header);
    }
    CTW_TRY_ASSIGN(tip, tip_from_header(*pending_header_));
    pending_header_.reset();
    return tip;
}

core::Result<std::optional<StatusFingerprint>> ElectrumClient::subscribe_or_poll(
    const primitives::script::Script& script) {
    std::string sh = electrum_script_hash(script);

    auto recompute = [&]() -> core::Result<std::optional<StatusFingerprint>> {
        rpc::JsonValue params(rpc::JsonValue::Array{});
        params.push_back(sh);
        CTW_TRY_ASSIGN(reply, call("blockchain.scripthash.get_history", std::move(params)));
        CTW_TRY_ASSIGN(history, parse_history_reply(reply));
        auto status = electrum_status(history);
        statuses_[sh] = status;
        return status;
    };

    CTW_TRY_VOID(ensure_connected());
    if (subscribed_.count(sh) > 0) {
        return recompute();
    }

    rpc::JsonValue params(rpc::JsonValue::Array{});
    params.push_back(sh);
    auto reply = call("blockchain.scripthash.subscribe", std::move(params));
    if (!reply.ok()) {
        if (!is_already_subscribed(reply.error())) return reply.error();
        LOG_DEBUG(core::LogCategory::NET, "electrum: " + sh + " already subscribed");
        subscribed_.insert(sh);
        return recompute();
    }

    subscribed_.insert(sh);
    const auto& status = reply.value();
    if (status.is_null()) {
        statuses_[sh] = std::nullopt;
    } else if (status.is_string()) {
        statuses_[sh] = status.get_string();
    } else {
        return protocol_violation("electrum: malformed script status");
    }
    return statuses_[sh];
}

core::Result<std::vector<std::vector<HistoryEntry>>> ElectrumClient::histories(
    const std::vector<primitives::script::Script>& scripts) {
    std::vector<std::vector<HistoryEntry>> out;
    if (scripts.empty()) return out;

    std::vector<Request> requests;
    requests.reserve(scripts.size());
    for (const auto& script : scripts) {
        rpc::JsonValue params(rpc::JsonValue::Array{});
        params.push_back(electrum_script_hash(script));
        requests.emplace_back("blockchain.scripthash.get_history", std::move(params));
    }
    CTW_TRY_ASSIGN(replies, batch(requests));

    out.reserve(replies.size());
    for (const auto& reply : replies) {
        CTW_TRY_ASSIGN(raw, parse_history_reply(reply));
        std::vector<HistoryEntry> entries;
        entries.reserve(raw.size());
        for (const auto& r : raw) {
            if (r.height > static_cast<int64_t>(UINT32_MAX)) {
                return protocol_violation("electrum: history height out of range");
            }
            HistoryEntry e;
            e.txid = core::uint256::from_hex(r.tx_hash);
            if (r.height > 0) e.height = static_cast<uint32_t>(r.height);
            entries.push_back(e);
        }
        out.push_back(std::move(entries));
    }
    return out;
}

core::Result<std::vector<primitives::Transaction>> ElectrumClient::transactions(
    const std::vector<core::uint256>& txids) {
    std::vector<primitives::Transaction> out;
    if (txids.empty()) return out;

    std::vector<Request> requests;
    requests.reserve(txids.size());
    for (const auto& txid : txids) {
        rpc::JsonValue params(rpc::JsonValue::Array{});
        params.push_back(txid.to_hex());
        requests.emplace_back("blockchain.transaction.get", std::move(params));
    }
    CTW_TRY_ASSIGN(replies, batch(requests));

    out.reserve(replies.size());
    for (const auto& reply : replies) {
        CTW_TRY_ASSIGN(hex, expect_hex(reply, "transaction"));
        auto tx = primitives::Transaction::from_hex(hex);
        if (!tx.ok()) {
            return protocol_violation("electrum: undecodable transaction: " +
                                      tx.error().message());
        }
        out.push_back(std::move(tx).value());
    }
    return out;
}

core::Result<std::vector<primitives::BlockHeader>> ElectrumClient::headers(
    const std::vector<uint32_t>& heights) {
    std::vector<primitives::BlockHeader> out;
    if (heights.empty()) return out;

    std::vector<Request> requests;
    requests.reserve(heights.size());
    for (uint32_t h : heights) {
        rpc::JsonValue params(rpc::JsonValue::Array{});
        params.push_back(h);
        requests.emplace_back("blockchain.block.header", std::move(params));
    }
    CTW_TRY_ASSIGN(replies, batch(requests));

    out.reserve(replies.size());
    for (size_t i = 0; i < replies.size(); ++i) {
        CTW_TRY_ASSIGN(hex, expect_hex(replies[i], "header"));
        auto header = primitives::BlockHeader::from_hex(hex);
        if (!header.ok()) {
            return protocol_violation("electrum: undecodable header: " +
                                      header.error().message());
        }
        if (header.value().height != heights[i]) {
            return protocol_violation("electrum: header for height " +
                                      std::to_string(header.value().height) +
                                      " returned for " + std::to_string(heights[i]));
        }
        out.push_back(std::move(header).value());
    }
    return out;
}

core::Result<core::uint256> ElectrumClient::broadcast(const primitives::Transaction& tx) {
    rpc::JsonValue params(rpc::JsonValue::Array{});
    params.push_back(tx.to_hex());
    CTW_TRY_ASSIGN(reply, call("blockchain.transaction.broadcast", std::move(params)));
    LOG_INFO(core::LogCategory::NET, "electrum: broadcast " + tx.txid().to_hex());
    return parse_txid(reply);
}

} // namespace wallet
