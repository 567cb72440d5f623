// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/hex.h"
#include "crypto/sha256.h"
#include "net/stream.h"
#include "primitives/block_header.h"
#include "primitives/transaction.h"
#include "rpc/http.h"
#include "rpc/json.h"
#include "wallet/electrum.h"
#include "wallet/elements_rpc.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

/// Stream that replays fixed chunks, then reports the peer closing.
class ScriptedStream final : public net::Stream {
public:
    explicit ScriptedStream(std::vector<std::string> chunks)
        : chunks_(std::move(chunks)) {}

    core::Result<void> write_all(std::string_view data) override {
        written_ += data;
        return core::make_ok();
    }

    core::Result<size_t> read_some(std::span<uint8_t> buf, int) override {
        if (next_ >= chunks_.size()) {
            return core::Error(core::ErrorCode::NETWORK_CLOSED, "eof");
        }
        const std::string& chunk = chunks_[next_++];
        size_t n = std::min(buf.size(), chunk.size());
        std::memcpy(buf.data(), chunk.data(), n);
        return n;
    }

    void close() override {}

    [[nodiscard]] const std::string& written() const { return written_; }

private:
    std::vector<std::string> chunks_;
    size_t next_ = 0;
    std::string written_;
};

rpc::JsonValue history_entry(const std::string& hash, int64_t height) {
    rpc::JsonValue::Object obj;
    obj["tx_hash"] = rpc::JsonValue(hash);
    obj["height"] = rpc::JsonValue(height);
    return rpc::JsonValue(std::move(obj));
}

} // anonymous namespace

// ===================================================================
// JsonValue
// ===================================================================

TEST_CASE(JsonValue, TypeConstruction) {
    rpc::JsonValue null_val;
    CHECK(null_val.is_null());

    rpc::JsonValue bool_val(true);
    CHECK(bool_val.is_bool());
    CHECK_EQ(bool_val.get_bool(), true);

    rpc::JsonValue int_val(42);
    CHECK(int_val.is_int());
    CHECK_EQ(int_val.get_int(), static_cast<int64_t>(42));

    rpc::JsonValue str_val("hello");
    CHECK(str_val.is_string());
    CHECK_EQ(str_val.get_string(), std::string("hello"));

    CHECK(rpc::JsonValue(7) == rpc::JsonValue(7));
    CHECK(rpc::JsonValue("a") != rpc::JsonValue("b"));
}

TEST_CASE(JsonValue, ArrayAndObject) {
    rpc::JsonValue params(rpc::JsonValue::Array{});
    params.push_back("ctwallet 0.1.0");
    params.push_back("1.4");
    CHECK(params.is_array());
    CHECK_EQ(params.size(), static_cast<size_t>(2));

    rpc::JsonValue::Object obj;
    obj["method"] = rpc::JsonValue("server.version");
    obj["params"] = params;
    rpc::JsonValue request(obj);
    CHECK(request.has_key("method"));
    CHECK(!request.has_key("missing"));
    CHECK_EQ(request["params"].size(), static_cast<size_t>(2));
}

TEST_CASE(JsonParsing, ElectrumReply) {
    auto reply = rpc::try_parse_json(
        R"({"jsonrpc":"2.0","id":3,"result":{"height":120,"hex":"00ff"}})");
    CHECK_OK(reply);
    const auto& v = reply.value();
    CHECK_EQ(v["id"].get_int(), static_cast<int64_t>(3));
    CHECK_EQ(v["result"]["height"].get_int(), static_cast<int64_t>(120));
    CHECK_EQ(v["result"]["hex"].get_string(), std::string("00ff"));
    CHECK(v["error"].is_null());
}

TEST_CASE(JsonParsing, MalformedInputRejected) {
    CHECK_ERR(rpc::try_parse_json("{\"a\":"));
    CHECK_ERR(rpc::try_parse_json("[1,2"));
    CHECK_ERR(rpc::try_parse_json("nul"));
    CHECK_ERR(rpc::try_parse_json("{} trailing"));
}

TEST_CASE(JsonParsing, SerializeRoundTrip) {
    rpc::JsonValue::Object obj;
    obj["key"] = rpc::JsonValue("va\"lue");
    obj["num"] = rpc::JsonValue(123);
    rpc::JsonValue original(obj);

    auto parsed = rpc::try_parse_json(rpc::json_serialize(original));
    CHECK_OK(parsed);
    CHECK(parsed.value() == original);
}

// ===================================================================
// HTTP
// ===================================================================

TEST_CASE(Http, Base64) {
    CHECK_EQ(rpc::base64_encode("user:pass"), std::string("dXNlcjpwYXNz"));
    CHECK_EQ(rpc::base64_encode(""), std::string(""));
    CHECK_EQ(rpc::base64_encode("a"), std::string("YQ=="));
    CHECK_EQ(rpc::base64_encode("ab"), std::string("YWI="));
}

TEST_CASE(Http, StatusLine) {
    rpc::HttpResponse resp;
    CHECK_OK(rpc::parse_status_line("HTTP/1.1 401 Unauthorized", resp));
    CHECK_EQ(resp.status, 401);
    CHECK_EQ(resp.reason, std::string("Unauthorized"));

    CHECK_ERR(rpc::parse_status_line("SMTP 220 ready", resp));
    CHECK_ERR(rpc::parse_status_line("HTTP/1.1 abc", resp));
}

TEST_CASE(Http, HeaderLine) {
    rpc::HttpResponse resp;
    rpc::parse_header_line("Content-Length:  12 ", resp);
    rpc::parse_header_line("no colon here", resp);
    CHECK_EQ(resp.headers.size(), static_cast<size_t>(1));
    CHECK_EQ(resp.headers.at("content-length"), std::string("12"));
}

TEST_CASE(Http, ResponseWithContentLength) {
    ScriptedStream stream({"HTTP/1.1 200 OK\r\nContent-Len",
                           "gth: 11\r\nServer: x\r\n\r\n{\"result\"",
                           ":1}extra"});
    net::LineReader reader(stream);
    auto resp = rpc::read_http_response(reader, 1000);
    CHECK_OK(resp);
    CHECK_EQ(resp.value().status, 200);
    CHECK_EQ(resp.value().body, std::string("{\"result\":1"));
    CHECK_EQ(resp.value().headers.at("server"), std::string("x"));
}

TEST_CASE(Http, ResponseBodyUntilClose) {
    ScriptedStream stream({"HTTP/1.0 500 Internal Server Error\r\n\r\n",
                           "{\"error\":", "\"boom\"}"});
    net::LineReader reader(stream);
    auto resp = rpc::read_http_response(reader, 1000);
    CHECK_OK(resp);
    CHECK_EQ(resp.value().status, 500);
    CHECK_EQ(resp.value().body, std::string("{\"error\":\"boom\"}"));
}

TEST_CASE(Http, GarbageStatusIsProtocolError) {
    ScriptedStream stream({"hello\r\n\r\n"});
    net::LineReader reader(stream);
    auto resp = rpc::read_http_response(reader, 1000);
    CHECK_ERR_CODE(resp, core::ErrorCode::NETWORK_PROTOCOL);
}

TEST_CASE(LineReader, SplitsRecords) {
    ScriptedStream stream({"{\"id\":1}\n{\"id\"", ":2}\r\n"});
    net::LineReader reader(stream);
    CHECK_EQ(reader.read_line(1000).value(), std::string("{\"id\":1}"));
    CHECK_EQ(reader.read_line(1000).value(), std::string("{\"id\":2}"));
    auto eof = reader.read_line(1000);
    CHECK_ERR_CODE(eof, core::ErrorCode::NETWORK_CLOSED);
}

TEST_CASE(LineReader, OverlongLineRejected) {
    ScriptedStream stream({std::string(64, 'x'), std::string(64, 'y')});
    net::LineReader reader(stream, 100);
    auto line = reader.read_line(1000);
    CHECK_ERR_CODE(line, core::ErrorCode::NETWORK_PROTOCOL);
}

// ===================================================================
// Electrum URL
// ===================================================================

TEST_CASE(ElectrumUrl, ParsesSchemes) {
    auto ssl = wallet::ElectrumUrl::parse("ssl://Blockstream.info:995");
    CHECK_OK(ssl);
    CHECK_EQ(ssl.value().host(), std::string("blockstream.info"));
    CHECK_EQ(ssl.value().port(), uint16_t{995});
    CHECK(ssl.value().tls());
    CHECK(ssl.value().validate_domain());
    CHECK_EQ(ssl.value().to_string(), std::string("blockstream.info:995"));

    auto tcp = wallet::ElectrumUrl::parse("tcp://localhost:50001");
    CHECK_OK(tcp);
    CHECK(!tcp.value().tls());
    CHECK(!tcp.value().validate_domain());

    auto ip = wallet::ElectrumUrl::parse("tcp://127.0.0.1:50001");
    CHECK_OK(ip);
    CHECK_EQ(ip.value().host(), std::string("127.0.0.1"));

    auto v6 = wallet::ElectrumUrl::parse("tcp://[::1]:50001");
    CHECK_OK(v6);
    CHECK_EQ(v6.value().host(), std::string("[::1]"));
}

TEST_CASE(ElectrumUrl, RejectsBadUrls) {
    struct Case {
        const char* url;
        const char* message;
    };
    const Case cases[] = {
        {"blockstream.info", "relative URL without a base"},
        {"http://blockstream.info:995", "Invalid schema `http` supported ones are `ssl` or `tcp`"},
        {"ssl://blockstream.info", "Port is missing"},
        {"ssl://blockstream.info:99999", "invalid port number"},
        {"ssl://:995", "Domain is missing"},
        {"ssl://127.0.0.1:995", "Cannot specify `ssl` scheme without a domain"},
        {"ssl://[::1]:995", "Cannot specify `ssl` scheme without a domain"},
    };
    for (const auto& c : cases) {
        auto url = wallet::ElectrumUrl::parse(c.url);
        CHECK_ERR(url);
        if (!url) {
            CHECK_EQ(url.error().code(), core::ErrorCode::PARSE_BAD_FORMAT);
            CHECK_EQ(url.error().message(), std::string(c.message));
        }
    }
}

TEST_CASE(ElectrumUrl, MakeFromHostPort) {
    auto url = wallet::ElectrumUrl::make("electrum.example:50002", true, true);
    CHECK_OK(url);
    CHECK(url.value().tls());
    CHECK_EQ(url.value().port(), uint16_t{50002});

    auto plain_validated = wallet::ElectrumUrl::make("electrum.example:50001",
                                                     false, true);
    CHECK_ERR(plain_validated);
    CHECK_EQ(plain_validated.error().message(),
             std::string("Cannot validate domain without tls"));

    CHECK_ERR(wallet::ElectrumUrl::make("electrum.example", false, false));
}

// ===================================================================
// Electrum protocol helpers
// ===================================================================

TEST_CASE(Electrum, ScriptHashIsReversedSha256) {
    // P2PKH of 1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa.
    std::vector<uint8_t> bytes = {
        0x76, 0xa9, 0x14, 0x62, 0xe9, 0x07, 0xb1, 0x5c, 0xbf, 0x27, 0xd5, 0x42,
        0x53, 0x99, 0xeb, 0xf6, 0xf0, 0xfb, 0x50, 0xeb, 0xb8, 0x8f, 0x18, 0x88,
        0xac};
    primitives::script::Script script(bytes);
    CHECK_EQ(wallet::electrum_script_hash(script),
             std::string("8b01df4e368ea28f8dc0423bcf7a4923e3a12d307c875e47a0cfbf90b5c39161"));
}

TEST_CASE(Electrum, StatusOfHistory) {
    CHECK(!wallet::electrum_status({}).has_value());

    std::vector<wallet::RawHistoryEntry> history = {
        {std::string(64, 'a'), 5},
        {std::string(64, 'b'), 0},
    };
    auto status = wallet::electrum_status(history);
    CHECK(status.has_value());
    CHECK_EQ(*status,
             std::string("79a127da650a5d2524323656cf496efeb49ecf05f6f338e2c64b8e27789ac553"));
}

TEST_CASE(Electrum, ParseHistoryReply) {
    rpc::JsonValue reply(rpc::JsonValue::Array{});
    reply.push_back(history_entry(std::string(64, 'c'), 101));
    reply.push_back(history_entry(std::string(64, 'd'), -1));
    auto parsed = wallet::parse_history_reply(reply);
    CHECK_OK(parsed);
    CHECK_EQ(parsed.value().size(), static_cast<size_t>(2));
    CHECK_EQ(parsed.value()[0].height, int64_t{101});
    CHECK_EQ(parsed.value()[1].height, int64_t{-1});

    rpc::JsonValue bad(rpc::JsonValue::Array{});
    bad.push_back(history_entry("not-a-txid", 5));
    auto rejected = wallet::parse_history_reply(bad);
    CHECK_ERR_CODE(rejected, core::ErrorCode::NETWORK_PROTOCOL);

    CHECK_ERR(wallet::parse_history_reply(rpc::JsonValue("oops")));
}

// ===================================================================
// Client exchanges against scripted servers
// ===================================================================

namespace {

using rpc::JsonValue;

/// Bytes the peer has queued for the client, handed out by read_some.
/// An empty queue reads as a timeout, or as end of stream once the
/// peer hung up.
class QueuedStream : public net::Stream {
public:
    core::Result<size_t> read_some(std::span<uint8_t> buf, int) override {
        if (inbound_.empty()) {
            if (hung_up_) return core::Error(core::ErrorCode::NETWORK_CLOSED, "eof");
            return core::Error(core::ErrorCode::NETWORK_TIMEOUT, "idle");
        }
        size_t n = std::min(buf.size(), inbound_.size());
        std::memcpy(buf.data(), inbound_.data(), n);
        inbound_.erase(0, n);
        return n;
    }

    void close() override {}

protected:
    std::string inbound_;
    bool hung_up_ = false;
};

JsonValue reply_to(const JsonValue& req, JsonValue result) {
    JsonValue reply(JsonValue::Object{});
    reply["jsonrpc"] = req["jsonrpc"];
    reply["id"] = req["id"];
    reply["result"] = std::move(result);
    reply["error"] = nullptr;
    return reply;
}

JsonValue error_to(const JsonValue& req, int64_t code, const std::string& msg) {
    JsonValue err(JsonValue::Object{});
    err["code"] = code;
    err["message"] = msg;
    JsonValue reply(JsonValue::Object{});
    reply["id"] = req["id"];
    reply["result"] = nullptr;
    reply["error"] = std::move(err);
    return reply;
}

/// Chain of legacy headers, heights 0..n-1.
std::vector<primitives::BlockHeader> make_chain(uint32_t n) {
    std::vector<primitives::BlockHeader> chain;
    for (uint32_t h = 0; h < n; ++h) {
        primitives::BlockHeader header;
        if (!chain.empty()) header.prev_hash = chain.back().hash();
        header.timestamp = 1'700'000'000 + 60 * h;
        header.height = h;
        header.challenge = {0x51};
        chain.push_back(header);
    }
    return chain;
}

std::string header_hex(const primitives::BlockHeader& header) {
    return core::to_hex(header.serialize());
}

primitives::Transaction explicit_tx(uint64_t value) {
    primitives::TxOutput out;
    out.asset = primitives::ConfidentialAsset::from_explicit(core::uint256::from_hex(
        "6f0279e9ed041c3d710a9f57d0c02928416460c4b722ae3457a11eec381c526d"));
    out.value = primitives::ConfidentialValue::from_explicit(value);
    primitives::TxInput in(primitives::OutPoint(
        crypto::sha256(&value, sizeof(value)), 0));
    return primitives::Transaction({in}, {out});
}

primitives::script::Script script_of(uint8_t tag) {
    return primitives::script::Script::p2wpkh(
        core::uint160::from_bytes(std::array<uint8_t, 20>{tag}));
}

// -------------------------------------------------------------------
// Electrum
// -------------------------------------------------------------------

/// What an Electrum server knows, shared by every connection to it.
struct ElectrumServerState {
    std::vector<primitives::BlockHeader> chain = make_chain(10);
    std::map<std::string, std::vector<wallet::RawHistoryEntry>> histories;
    std::set<std::string> already_subscribed;
    std::map<std::string, primitives::Transaction> txs;

    bool reverse_batches = false;
    bool drop_last_in_batch = false;
    /// blockchain.block.header answers with the block below.
    bool shift_headers = false;

    std::vector<std::string> methods;
    int connections = 0;

    [[nodiscard]] size_t count(const std::string& method) const {
        return static_cast<size_t>(std::count(methods.begin(), methods.end(), method));
    }

    JsonValue answer(const JsonValue& req) {
        const std::string& method = req["method"].get_string();
        const auto& params = req["params"];
        methods.push_back(method);

        if (method == "server.version") {
            return reply_to(req, JsonValue(JsonValue::Array{"fake 1.0", "1.4"}));
        }
        if (method == "blockchain.headers.subscribe") {
            JsonValue tip(JsonValue::Object{});
            tip["hex"] = header_hex(chain.back());
            tip["height"] = chain.back().height;
            return reply_to(req, std::move(tip));
        }
        if (method == "blockchain.scripthash.subscribe") {
            const std::string& sh = params.at(0).get_string();
            if (already_subscribed.count(sh) > 0) {
                return error_to(req, -32600, "Already subscribed to " + sh);
            }
            auto status = wallet::electrum_status(histories[sh]);
            return reply_to(req, status ? JsonValue(*status) : JsonValue());
        }
        if (method == "blockchain.scripthash.get_history") {
            JsonValue list(JsonValue::Array{});
            for (const auto& e : histories[params.at(0).get_string()]) {
                JsonValue item(JsonValue::Object{});
                item["tx_hash"] = e.tx_hash;
                item["height"] = e.height;
                list.push_back(std::move(item));
            }
            return reply_to(req, std::move(list));
        }
        if (method == "blockchain.transaction.get") {
            auto it = txs.find(params.at(0).get_string());
            if (it == txs.end()) return error_to(req, 2, "missing transaction");
            return reply_to(req, it->second.to_hex());
        }
        if (method == "blockchain.block.header") {
            auto h = static_cast<size_t>(params.at(0).get_int());
            if (shift_headers && h > 0) --h;
            return reply_to(req, header_hex(chain.at(h)));
        }
        return error_to(req, -32601, "unknown method " + method);
    }

    std::string respond(const std::string& line) {
        JsonValue msg = rpc::parse_json(line);
        if (!msg.is_array()) return rpc::json_serialize(answer(msg)) + "\n";

        std::vector<JsonValue> replies;
        for (const auto& req : msg.get_array()) replies.push_back(answer(req));
        if (reverse_batches) std::reverse(replies.begin(), replies.end());
        if (drop_last_in_batch) replies.pop_back();
        return rpc::json_serialize(JsonValue(JsonValue::Array(replies))) + "\n";
    }
};

class ElectrumPeer final : public QueuedStream {
public:
    explicit ElectrumPeer(std::shared_ptr<ElectrumServerState> state)
        : state_(std::move(state)) {}

    core::Result<void> write_all(std::string_view data) override {
        pending_ += data;
        size_t nl;
        while ((nl = pending_.find('\n')) != std::string::npos) {
            inbound_ += state_->respond(pending_.substr(0, nl));
            pending_.erase(0, nl + 1);
        }
        return core::make_ok();
    }

private:
    std::shared_ptr<ElectrumServerState> state_;
    std::string pending_;
};

std::unique_ptr<wallet::ElectrumClient> connect_to(
    const std::shared_ptr<ElectrumServerState>& state) {
    auto url = wallet::ElectrumUrl::parse("tcp://electrum.test:50001").value();
    auto client = wallet::ElectrumClient::connect(
        url, 1000,
        [state](const std::string&, uint16_t, const net::StreamOptions&)
            -> core::Result<std::unique_ptr<net::Stream>> {
            ++state->connections;
            return std::unique_ptr<net::Stream>(new ElectrumPeer(state));
        });
    if (!client) throw std::runtime_error(client.error().format());
    return std::move(client).value();
}

// -------------------------------------------------------------------
// Elements node over HTTP
// -------------------------------------------------------------------

struct NodeState {
    std::vector<primitives::BlockHeader> chain = make_chain(10);
    std::map<std::string, primitives::Transaction> txs;
    /// getblockhash answers with the hash of the block below.
    bool shift_hashes = false;

    std::vector<std::string> methods;
    std::string last_request;

    JsonValue answer(const JsonValue& req) {
        const std::string& method = req["method"].get_string();
        const auto& params = req["params"];
        methods.push_back(method);

        if (method == "getblockcount") {
            return reply_to(req, static_cast<int64_t>(chain.size() - 1));
        }
        if (method == "getbestblockhash") {
            return reply_to(req, chain.back().hash().to_hex());
        }
        if (method == "getblockhash") {
            auto h = static_cast<size_t>(params.at(0).get_int());
            if (shift_hashes && h > 0) --h;
            if (h >= chain.size()) return error_to(req, -8, "Block height out of range");
            return reply_to(req, chain[h].hash().to_hex());
        }
        if (method == "getblockheader") {
            for (const auto& header : chain) {
                if (header.hash().to_hex() == params.at(0).get_string()) {
                    return reply_to(req, header_hex(header));
                }
            }
            return error_to(req, -5, "Block not found");
        }
        if (method == "getrawtransaction") {
            auto it = txs.find(params.at(0).get_string());
            if (it == txs.end()) {
                return error_to(req, -5, "No such mempool or blockchain transaction");
            }
            return reply_to(req, it->second.to_hex());
        }
        return error_to(req, -32601, "Method not found");
    }
};

class NodePeer final : public QueuedStream {
public:
    explicit NodePeer(std::shared_ptr<NodeState> state) : state_(std::move(state)) {}

    core::Result<void> write_all(std::string_view data) override {
        request_ += data;
        size_t end = request_.find("\r\n\r\n");
        if (end == std::string::npos) return core::make_ok();
        state_->last_request = request_;

        JsonValue msg = rpc::parse_json(request_.substr(end + 4));
        JsonValue reply;
        if (msg.is_array()) {
            reply = JsonValue(JsonValue::Array{});
            for (const auto& req : msg.get_array()) reply.push_back(state_->answer(req));
        } else {
            reply = state_->answer(msg);
        }
        std::string body = rpc::json_serialize(reply);
        inbound_ = "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n"
                   "Content-Length: " + std::to_string(body.size()) +
                   "\r\n\r\n" + body;
        hung_up_ = true;
        return core::make_ok();
    }

private:
    std::shared_ptr<NodeState> state_;
    std::string request_;
};

wallet::ElementsRpcClient node_client(const std::shared_ptr<NodeState>& state) {
    wallet::ElementsRpcConfig config;
    config.port = 7041;
    config.user = "user";
    config.password = "pass";
    return wallet::ElementsRpcClient(
        config,
        [state](const std::string&, uint16_t, const net::StreamOptions&)
            -> core::Result<std::unique_ptr<net::Stream>> {
            return std::unique_ptr<net::Stream>(new NodePeer(state));
        });
}

} // anonymous namespace

TEST_CASE(ElectrumClient, HandshakeAndTip) {
    auto server = std::make_shared<ElectrumServerState>();
    auto client = connect_to(server);
    CHECK_EQ(server->connections, 1);
    CHECK_EQ(server->methods.size(), static_cast<size_t>(2));
    CHECK_EQ(server->methods[0], std::string("server.version"));
    CHECK_EQ(server->methods[1], std::string("blockchain.headers.subscribe"));

    // The header from the handshake answers the first tip() call.
    auto tip = client->tip();
    CHECK_OK(tip);
    CHECK_EQ(tip.value().height, 9u);
    CHECK(tip.value().hash == server->chain.back().hash());
    CHECK_EQ(server->methods.size(), static_cast<size_t>(2));

    server->chain = make_chain(12);
    auto next = client->tip();
    CHECK_OK(next);
    CHECK_EQ(next.value().height, 11u);
    CHECK_EQ(server->count("blockchain.headers.subscribe"), static_cast<size_t>(2));
}

TEST_CASE(ElectrumClient, SubscribeReportsStatus) {
    auto server = std::make_shared<ElectrumServerState>();
    auto used = script_of(1);
    auto fresh = script_of(2);
    std::vector<wallet::RawHistoryEntry> history = {{std::string(64, 'a'), 5}};
    server->histories[wallet::electrum_script_hash(used)] = history;
    auto client = connect_to(server);

    auto status = client->subscribe_or_poll(used);
    CHECK_OK(status);
    CHECK(status.value() == wallet::electrum_status(history));

    auto none = client->subscribe_or_poll(fresh);
    CHECK_OK(none);
    CHECK(!none.value().has_value());
    CHECK_EQ(server->count("blockchain.scripthash.get_history"), static_cast<size_t>(0));
}

TEST_CASE(ElectrumClient, AlreadySubscribedFallsBackToHistory) {
    auto server = std::make_shared<ElectrumServerState>();
    auto script = script_of(3);
    std::string sh = wallet::electrum_script_hash(script);
    std::vector<wallet::RawHistoryEntry> history = {
        {std::string(64, 'b'), 7},
        {std::string(64, 'c'), 0},
    };
    server->histories[sh] = history;
    server->already_subscribed.insert(sh);
    auto client = connect_to(server);

    auto status = client->subscribe_or_poll(script);
    CHECK_OK(status);
    CHECK(status.value() == wallet::electrum_status(history));
    CHECK_EQ(server->count("blockchain.scripthash.subscribe"), static_cast<size_t>(1));
    CHECK_EQ(server->count("blockchain.scripthash.get_history"), static_cast<size_t>(1));

    // Later polls go straight to the history.
    server->histories[sh].push_back({std::string(64, 'd'), 9});
    auto again = client->subscribe_or_poll(script);
    CHECK_OK(again);
    CHECK(again.value() == wallet::electrum_status(server->histories[sh]));
    CHECK_EQ(server->count("blockchain.scripthash.subscribe"), static_cast<size_t>(1));
}

TEST_CASE(ElectrumClient, UnknownTransactionIsRpcError) {
    auto server = std::make_shared<ElectrumServerState>();
    auto client = connect_to(server);
    auto missing = client->transactions({core::uint256::from_hex(std::string(64, 'e'))});
    CHECK_ERR_CODE(missing, core::ErrorCode::RPC_ERROR);
}

TEST_CASE(ElectrumClient, BatchRepliesMatchedById) {
    auto server = std::make_shared<ElectrumServerState>();
    server->reverse_batches = true;
    std::vector<primitives::script::Script> scripts = {script_of(4), script_of(5), script_of(6)};
    server->histories[wallet::electrum_script_hash(scripts[0])] = {{std::string(64, '1'), 3}};
    server->histories[wallet::electrum_script_hash(scripts[2])] = {
        {std::string(64, '3'), 0}, {std::string(64, '4'), 8}};
    auto client = connect_to(server);

    auto lists = client->histories(scripts);
    CHECK_OK(lists);
    CHECK_EQ(lists.value().size(), static_cast<size_t>(3));
    CHECK_EQ(lists.value()[0].size(), static_cast<size_t>(1));
    CHECK(lists.value()[0][0].txid == core::uint256::from_hex(std::string(64, '1')));
    CHECK(lists.value()[0][0].height == std::optional<uint32_t>(3));
    CHECK(lists.value()[1].empty());
    CHECK_EQ(lists.value()[2].size(), static_cast<size_t>(2));
    CHECK(!lists.value()[2][0].height.has_value());
    CHECK(lists.value()[2][1].height == std::optional<uint32_t>(8));

    auto tx_a = explicit_tx(11);
    auto tx_b = explicit_tx(22);
    server->txs.emplace(tx_a.txid().to_hex(), tx_a);
    server->txs.emplace(tx_b.txid().to_hex(), tx_b);
    auto txs = client->transactions({tx_b.txid(), tx_a.txid()});
    CHECK_OK(txs);
    CHECK(txs.value()[0].txid() == tx_b.txid());
    CHECK(txs.value()[1].txid() == tx_a.txid());
}

TEST_CASE(ElectrumClient, ShortBatchIsProtocolViolation) {
    auto server = std::make_shared<ElectrumServerState>();
    auto client = connect_to(server);
    server->drop_last_in_batch = true;

    auto lists = client->histories({script_of(7), script_of(8)});
    CHECK_ERR(lists);
    CHECK(wallet::is_protocol_violation(lists.error()));

    // The broken connection is replaced on the next call.
    server->drop_last_in_batch = false;
    CHECK_OK(client->histories({script_of(7), script_of(8)}));
    CHECK_EQ(server->connections, 2);
}

TEST_CASE(ElectrumClient, HeadersCheckedAgainstRequestedHeight) {
    auto server = std::make_shared<ElectrumServerState>();
    auto client = connect_to(server);

    auto headers = client->headers({2, 6});
    CHECK_OK(headers);
    CHECK_EQ(headers.value()[0].height, 2u);
    CHECK(headers.value()[1].hash() == server->chain[6].hash());

    server->shift_headers = true;
    auto shifted = client->headers({6});
    CHECK_ERR(shifted);
    CHECK(wallet::is_protocol_violation(shifted.error()));
}

TEST_CASE(ElementsRpcClient, HeightAndTip) {
    auto node = std::make_shared<NodeState>();
    auto client = node_client(node);

    CHECK_EQ(client.height().value(), 9u);
    CHECK_NE(node->last_request.find("POST / HTTP/1.1\r\n"), std::string::npos);
    CHECK_NE(node->last_request.find("Authorization: Basic dXNlcjpwYXNz\r\n"),
             std::string::npos);

    auto tip = client.tip();
    CHECK_OK(tip);
    CHECK_EQ(tip.value().height, 9u);
    CHECK(tip.value().hash == node->chain.back().hash());
    CHECK_EQ(tip.value().timestamp, node->chain.back().timestamp);
}

TEST_CASE(ElementsRpcClient, HeadersGoThroughBlockHashes) {
    auto node = std::make_shared<NodeState>();
    auto client = node_client(node);

    auto headers = client.headers({3, 7});
    CHECK_OK(headers);
    CHECK_EQ(headers.value().size(), static_cast<size_t>(2));
    CHECK(headers.value()[0].hash() == node->chain[3].hash());
    CHECK(headers.value()[1].hash() == node->chain[7].hash());
    const std::vector<std::string> expected = {
        "getblockhash", "getblockhash", "getblockheader", "getblockheader"};
    CHECK(node->methods == expected);

    node->shift_hashes = true;
    auto shifted = client.headers({5});
    CHECK_ERR(shifted);
    CHECK(wallet::is_protocol_violation(shifted.error()));

    auto beyond = client.headers({50});
    CHECK_ERR_CODE(beyond, core::ErrorCode::RPC_ERROR);
}

TEST_CASE(ElementsRpcClient, RawTransactionsInRequestOrder) {
    auto node = std::make_shared<NodeState>();
    auto tx_a = explicit_tx(5);
    auto tx_b = explicit_tx(6);
    node->txs.emplace(tx_a.txid().to_hex(), tx_a);
    node->txs.emplace(tx_b.txid().to_hex(), tx_b);
    auto client = node_client(node);

    auto txs = client.transactions({tx_b.txid(), tx_a.txid()});
    CHECK_OK(txs);
    CHECK(txs.value()[0].txid() == tx_b.txid());
    CHECK(txs.value()[1].txid() == tx_a.txid());

    auto missing = client.transactions({core::uint256::from_hex(std::string(64, 'f'))});
    CHECK_ERR_CODE(missing, core::ErrorCode::RPC_ERROR);
}

TEST_CASE(ElementsRpcClient, NoScriptIndex) {
    auto node = std::make_shared<NodeState>();
    auto client = node_client(node);
    auto status = client.subscribe_or_poll(script_of(9));
    CHECK_ERR_CODE(status, core::ErrorCode::NOT_IMPLEMENTED);
    CHECK(node->methods.empty());
}
