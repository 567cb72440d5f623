#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CTW_RPC_HTTP_H
#define CTW_RPC_HTTP_H

#include "core/error.h"
#include "net/stream.h"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace rpc {

// ---------------------------------------------------------------------------
// Minimal HTTP/1.1 client for JSON-RPC over HTTP (one request per
// connection, `Connection: close`).
// ---------------------------------------------------------------------------

struct HttpResponse {
    int status = 0;
    std::string reason;
    /// Header names are lower-cased.
    std::map<std::string, std::string> headers;
    std::string body;
};

/// Standard Base64 with padding, as used by HTTP Basic auth.
std::string base64_encode(std::string_view input);

/// Parse "HTTP/1.x <code> <reason>".  PARSE_BAD_FORMAT otherwise.
core::Result<void> parse_status_line(std::string_view line, HttpResponse& out);

/// Parse one "Name: value" header line into @p out (name lower-cased,
/// value trimmed).  Lines without a colon are ignored.
void parse_header_line(std::string_view line, HttpResponse& out);

/// Read a complete response (status, headers, body) from @p reader.
/// The body is framed by Content-Length when present, else by EOF.
core::Result<HttpResponse> read_http_response(net::LineReader& reader,
                                              int timeout_ms);

/// POST @p body as application/json to @p path on a fresh connection
/// made by @p opener. Non-empty @p user enables Basic auth.
core::Result<HttpResponse> http_post(const std::string& host, uint16_t port,
                                     const std::string& path,
                                     const std::string& body,
                                     const std::string& user,
                                     const std::string& password,
                                     int timeout_ms,
                                     const net::StreamOpener& opener = {});

} // namespace rpc

#endif // CTW_RPC_HTTP_H
