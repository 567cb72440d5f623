// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/elements_rpc.h"

#include "core/hex.h"
#include "core/logging.h"
#include "rpc/http.h"

#include <map>

namespace wallet {

namespace {

/// JSON-RPC "method not found".
constexpr int64_t RPC_METHOD_NOT_FOUND = -32601;

rpc::JsonValue params_of(std::initializer_list<rpc::JsonValue> items) {
    return rpc::JsonValue(rpc::JsonValue::Array(items));
}

/// Turn one reply object into its result or an RPC_* error.
core::Result<rpc::JsonValue> unwrap_reply(const std::string& method,
                                          const rpc::JsonValue& reply) {
    if (!reply.is_object()) {
        return protocol_violation("elements: reply to " + method + " is not an object");
    }
    const auto& err = reply["error"];
    if (!err.is_null()) {
        const auto& code = err["code"];
        const auto& msg = err["message"];
        std::string text = msg.is_string() ? msg.get_string() : rpc::json_serialize(err);
        auto ec = (code.is_int() && code.get_int() == RPC_METHOD_NOT_FOUND)
            ? core::ErrorCode::RPC_METHOD_MISS
            : core::ErrorCode::RPC_ERROR;
        return core::Error(ec, method + ": " + text);
    }
    return reply["result"];
}

core::Result<std::string> hex_result(const rpc::JsonValue& value, const char* what) {
    if (!value.is_string() || !core::is_hex(value.get_string())) {
        return protocol_violation(std::string("elements: expected hex ") + what);
    }
    return value.get_string();
}

} // anonymous namespace

ElementsRpcClient::ElementsRpcClient(ElementsRpcConfig config,
                                     net::StreamOpener opener)
    : config_(std::move(config)), opener_(std::move(opener)) {}

// ===================================================================
// Transport
// ===================================================================

core::Result<rpc::JsonValue> ElementsRpcClient::post(const rpc::JsonValue& payload) {
    CTW_TRY_ASSIGN(resp, rpc::http_post(config_.host, config_.port, "/",
                                        rpc::json_serialize(payload),
                                        config_.user, config_.password,
                                        config_.timeout_ms, opener_));
    if (resp.status == 401 || resp.status == 403) {
        return core::Error(core::ErrorCode::RPC_ERROR,
                           "elements: authentication rejected (HTTP " +
                           std::to_string(resp.status) + ")");
    }
    // elementsd reports RPC errors with 404/500 and a JSON body.
    if (resp.status != 200 && resp.status != 404 && resp.status != 500) {
        return core::Error(core::ErrorCode::RPC_ERROR,
                           "elements: HTTP " + std::to_string(resp.status) +
                           " " + resp.reason);
    }
    auto body = rpc::try_parse_json(resp.body);
    if (!body.ok()) {
        return protocol_violation("elements: undecodable reply: " +
                                  body.error().message());
    }
    return std::move(body).value();
}

core::Result<rpc::JsonValue> ElementsRpcClient::call(const std::string& method,
                                                     rpc::JsonValue params) {
    rpc::JsonValue req(rpc::JsonValue::Object{});
    req["jsonrpc"] = "1.0";
    req["id"] = next_id_++;
    req["method"] = method;
    req["params"] = std::move(params);

    LOG_TRACE(core::LogCategory::RPC, "elements: -> " + method);
    CTW_TRY_ASSIGN(reply, post(req));
    return unwrap_reply(method, reply);
}

core::Result<std::vector<rpc::JsonValue>> ElementsRpcClient::batch(
    const std::vector<Request>& requests) {
    std::vector<rpc::JsonValue> out;
    if (requests.empty()) return out;

    rpc::JsonValue payload(rpc::JsonValue::Array{});
    std::vector<int64_t> ids;
    for (const auto& [method, params] : requests) {
        rpc::JsonValue req(rpc::JsonValue::Object{});
        req["jsonrpc"] = "1.0";
        req["id"] = next_id_;
        req["method"] = method;
        req["params"] = params;
        ids.push_back(next_id_++);
        payload.push_back(std::move(req));
    }

    LOG_TRACE(core::LogCategory::RPC,
              "elements: -> batch of " + std::to_string(requests.size()) +
              " " + requests.front().first);
    CTW_TRY_ASSIGN(reply, post(payload));
    if (!reply.is_array()) {
        // A batch that fails as a whole comes back as a single error object.
        CTW_TRY_VOID(unwrap_reply(requests.front().first, reply));
        return protocol_violation("elements: batch reply is not an array");
    }

    std::map<int64_t, const rpc::JsonValue*> by_id;
    for (const auto& item : reply.get_array()) {
        const auto& id = item["id"];
        if (id.is_int()) by_id[id.get_int()] = &item;
    }

    out.reserve(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        auto it = by_id.find(ids[i]);
        if (it == by_id.end()) {
            return protocol_violation("elements: batch reply misses id " +
                                      std::to_string(ids[i]));
        }
        CTW_TRY_ASSIGN(result, unwrap_reply(requests[i].first, *it->second));
        out.push_back(std::move(result));
    }
    return out;
}

// ===================================================================
// Chain queries
// ===================================================================

core::Result<uint32_t> ElementsRpcClient::height() {
    CTW_TRY_ASSIGN(count, call("getblockcount", params_of({})));
    if (!count.is_int() || count.get_int() < 0 ||
        count.get_int() > static_cast<int64_t>(UINT32_MAX)) {
        return protocol_violation("elements: malformed block count");
    }
    return static_cast<uint32_t>(count.get_int());
}

core::Result<primitives::BlockHeader> ElementsRpcClient::header_by_hash(
    const std::string& hash) {
    CTW_TRY_ASSIGN(reply, call("getblockheader", params_of({hash, false})));
    CTW_TRY_ASSIGN(hex, hex_result(reply, "header"));
    auto header = primitives::BlockHeader::from_hex(hex);
    if (!header.ok()) {
        return protocol_violation("elements: undecodable header: " +
                                  header.error().message());
    }
    return std::move(header).value();
}

core::Result<ChainTip> ElementsRpcClient::tip() {
    CTW_TRY_ASSIGN(best, call("getbestblockhash", params_of({})));
    CTW_TRY_ASSIGN(hash, hex_result(best, "block hash"));
    CTW_TRY_ASSIGN(header, header_by_hash(hash));
    if (header.hash().to_hex() != hash) {
        return protocol_violation("elements: header does not hash to " + hash);
    }
    ChainTip tip;
    tip.height = header.height;
    tip.hash = header.hash();
    tip.timestamp = header.timestamp;
    return tip;
}

core::Result<std::optional<StatusFingerprint>> ElementsRpcClient::subscribe_or_poll(
    const primitives::script::Script& /*script*/) {
    return core::Error(core::ErrorCode::NOT_IMPLEMENTED,
                       "elements node has no script index");
}

core::Result<std::vector<std::vector<HistoryEntry>>> ElementsRpcClient::histories(
    const std::vector<primitives::script::Script>& /*scripts*/) {
    return core::Error(core::ErrorCode::NOT_IMPLEMENTED,
                       "elements node has no script index");
}

core::Result<std::vector<primitives::Transaction>> ElementsRpcClient::transactions(
    const std::vector<core::uint256>& txids) {
    std::vector<Request> requests;
    requests.reserve(txids.size());
    for (const auto& txid : txids) {
        requests.emplace_back("getrawtransaction", params_of({txid.to_hex(), false}));
    }
    CTW_TRY_ASSIGN(replies, batch(requests));

    std::vector<primitives::Transaction> out;
    out.reserve(replies.size());
    for (const auto& reply : replies) {
        CTW_TRY_ASSIGN(hex, hex_result(reply, "transaction"));
        auto tx = primitives::Transaction::from_hex(hex);
        if (!tx.ok()) {
            return protocol_violation("elements: undecodable transaction: " +
                                      tx.error().message());
        }
        out.push_back(std::move(tx).value());
    }
    return out;
}

core::Result<std::vector<primitives::BlockHeader>> ElementsRpcClient::headers(
    const std::vector<uint32_t>& heights) {
    std::vector<Request> hash_requests;
    hash_requests.reserve(heights.size());
    for (uint32_t h : heights) {
        hash_requests.emplace_back("getblockhash", params_of({h}));
    }
    CTW_TRY_ASSIGN(hashes, batch(hash_requests));

    std::vector<Request> header_requests;
    header_requests.reserve(hashes.size());
    for (const auto& hash : hashes) {
        CTW_TRY_ASSIGN(hex, hex_result(hash, "block hash"));
        header_requests.emplace_back("getblockheader", params_of({hex, false}));
    }
    CTW_TRY_ASSIGN(replies, batch(header_requests));

    std::vector<primitives::BlockHeader> out;
    out.reserve(replies.size());
    for (size_t i = 0; i < replies.size(); ++i) {
        CTW_TRY_ASSIGN(hex, hex_result(replies[i], "header"));
        auto header = primitives::BlockHeader::from_hex(hex);
        if (!header.ok()) {
            return protocol_violation("elements: undecodable header: " +
                                      header.error().message());
        }
        if (header.value().height != heights[i]) {
            return protocol_violation("elements: header for height " +
                                      std::to_string(header.value().height) +
                                      " returned for " + std::to_string(heights[i]));
        }
        out.push_back(std::move(header).value());
    }
    return out;
}

core::Result<core::uint256> ElementsRpcClient::broadcast(const primitives::Transaction& tx) {
    CTW_TRY_ASSIGN(reply, call("sendrawtransaction", params_of({tx.to_hex()})));
    if (!reply.is_string() || reply.get_string().size() != 64 ||
        !core::is_hex(reply.get_string())) {
        return protocol_violation("elements: malformed txid from sendrawtransaction");
    }
    LOG_INFO(core::LogCategory::RPC, "elements: broadcast " + tx.txid().to_hex());
    return core::uint256::from_hex(reply.get_string());
}

} // namespace wallet
