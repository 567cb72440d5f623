#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Stream -- byte stream to a server, plaintext TCP or TLS over TCP.
//
// LineReader splits a stream into newline-terminated records for the
// line-oriented protocols (Electrum) and exposes the same buffer for the
// header-then-body framing of HTTP.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "net/socket.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace net {

class Stream {
public:
    virtual ~Stream() = default;

    virtual core::Result<void> write_all(std::string_view data) = 0;

    /// Read at least one byte within timeout_ms.  NETWORK_TIMEOUT when
    /// nothing arrived; NETWORK_CLOSED on end of stream.
    virtual core::Result<size_t> read_some(std::span<uint8_t> buf,
                                           int timeout_ms) = 0;

    virtual void close() = 0;
};

struct StreamOptions {
    bool tls = false;
    /// Verify the certificate chain and that it names the host.
    bool validate_domain = true;
    int  timeout_ms = 10000;
};

/// Connect to host:port.  TLS handshake failures are NETWORK_TLS.
core::Result<std::unique_ptr<Stream>> open_stream(const std::string& host,
                                                  uint16_t port,
                                                  const StreamOptions& opts);

/// How a client reaches its server. Empty means open_stream(); tests
/// hand in a scripted peer instead.
using StreamOpener = std::function<core::Result<std::unique_ptr<Stream>>(
    const std::string& host, uint16_t port, const StreamOptions& opts)>;

// ---------------------------------------------------------------------------
// LineReader
// ---------------------------------------------------------------------------

class LineReader {
public:
    /// Records longer than max_line are a NETWORK_PROTOCOL error.
    explicit LineReader(Stream& stream, size_t max_line = 64 * 1024 * 1024)
        : stream_(stream), max_line_(max_line) {}

    /// Next record without its terminator ("\n" or "\r\n").
    core::Result<std::string> read_line(int timeout_ms);

    /// Exactly n bytes, buffered data first.
    core::Result<std::string> read_exact(size_t n, int timeout_ms);

    /// Everything until the peer closes the stream.
    core::Result<std::string> read_to_end(int timeout_ms);

    /// Discard any buffered bytes (after a reconnect).
    void reset() { buffer_.clear(); }

private:
    core::Result<void> fill(int timeout_ms);

    Stream& stream_;
    size_t max_line_;
    std::string buffer_;
};

} // namespace net
