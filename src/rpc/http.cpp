// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/http.h"

#include "core/logging.h"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace rpc {

namespace {

constexpr size_t MAX_HEADER_LINES = 100;
constexpr size_t MAX_BODY_SIZE = 256 * 1024 * 1024;

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string_view::npos) return {};
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

} // anonymous namespace

// ===========================================================================
// Base64
// ===========================================================================

static constexpr char B64_TABLE[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(std::string_view input) {
    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i < input.size()) {
        size_t remaining = input.size() - i;
        uint32_t triple = static_cast<uint32_t>(static_cast<uint8_t>(input[i])) << 16;
        if (remaining > 1) triple |= static_cast<uint32_t>(static_cast<uint8_t>(input[i + 1])) << 8;
        if (remaining > 2) triple |= static_cast<uint32_t>(static_cast<uint8_t>(input[i + 2]));
        i += std::min<size_t>(remaining, 3);

        out += B64_TABLE[(triple >> 18) & 0x3F];
        out += B64_TABLE[(triple >> 12) & 0x3F];
        out += remaining > 1 ? B64_TABLE[(triple >> 6) & 0x3F] : '=';
        out += remaining > 2 ? B64_TABLE[triple & 0x3F] : '=';
    }
    return out;
}

// ===========================================================================
// Response parsing
// ===========================================================================

core::Result<void> parse_status_line(std::string_view line, HttpResponse& out) {
    if (line.substr(0, 7) != "HTTP/1.") {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "malformed HTTP status line");
    }
    size_t space1 = line.find(' ');
    if (space1 == std::string_view::npos || line.size() < space1 + 4) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "malformed HTTP status line");
    }
    std::string_view code = line.substr(space1 + 1, 3);
    int status = 0;
    auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), status);
    if (ec != std::errc{} || ptr != code.data() + code.size() || status < 100) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "malformed HTTP status code");
    }
    out.status = status;
    out.reason = std::string(trim(line.substr(space1 + 4)));
    return core::make_ok();
}

void parse_header_line(std::string_view line, HttpResponse& out) {
    size_t colon = line.find(':');
    if (colon == std::string_view::npos) return;
    out.headers[to_lower(trim(line.substr(0, colon)))] =
        std::string(trim(line.substr(colon + 1)));
}

core::Result<HttpResponse> read_http_response(net::LineReader& reader,
                                              int timeout_ms) {
    HttpResponse resp;
    CTW_TRY_ASSIGN(status_line, reader.read_line(timeout_ms));
    auto status = parse_status_line(status_line, resp);
    if (!status.ok()) {
        return core::Error(core::ErrorCode::NETWORK_PROTOCOL, status.error().message());
    }

    size_t lines = 0;
    while (true) {
        CTW_TRY_ASSIGN(line, reader.read_line(timeout_ms));
        if (line.empty()) break;
        if (++lines > MAX_HEADER_LINES) {
            return core::Error(core::ErrorCode::NETWORK_PROTOCOL,
                               "too many HTTP header lines");
        }
        parse_header_line(line, resp);
    }

    auto it = resp.headers.find("content-length");
    if (it != resp.headers.end()) {
        size_t length = 0;
        const std::string& text = it->second;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), length);
        if (ec != std::errc{} || ptr != text.data() + text.size() ||
            length > MAX_BODY_SIZE) {
            return core::Error(core::ErrorCode::NETWORK_PROTOCOL,
                               "invalid Content-Length: " + text);
        }
        CTW_TRY_ASSIGN(body, reader.read_exact(length, timeout_ms));
        resp.body = std::move(body);
    } else {
        CTW_TRY_ASSIGN(body, reader.read_to_end(timeout_ms));
        resp.body = std::move(body);
    }
    return resp;
}

// ===========================================================================
// http_post
// ===========================================================================

core::Result<HttpResponse> http_post(const std::string& host, uint16_t port,
                                     const std::string& path,
                                     const std::string& body,
                                     const std::string& user,
                                     const std::string& password,
                                     int timeout_ms,
                                     const net::StreamOpener& opener) {
    net::StreamOptions opts;
    opts.timeout_ms = timeout_ms;
    CTW_TRY_ASSIGN(stream, opener ? opener(host, port, opts)
                                  : net::open_stream(host, port, opts));

    std::string request;
    request.reserve(body.size() + 256);
    request += "POST " + path + " HTTP/1.1\r\n";
    request += "Host: " + host + ":" + std::to_string(port) + "\r\n";
    request += "Content-Type: application/json\r\n";
    request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    if (!user.empty()) {
        request += "Authorization: Basic " + base64_encode(user + ":" + password) + "\r\n";
    }
    request += "Connection: close\r\n";
    request += "\r\n";
    request += body;

    CTW_TRY_VOID(stream->write_all(request));

    net::LineReader reader(*stream, MAX_BODY_SIZE);
    auto resp = read_http_response(reader, timeout_ms);
    stream->close();
    if (resp.ok()) {
        LOG_TRACE(core::LogCategory::RPC,
                  "http: " + host + " -> " + std::to_string(resp.value().status));
    }
    return resp;
}

} // namespace rpc
