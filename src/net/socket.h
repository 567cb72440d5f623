#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <span>
#include <string>

#include "core/error.h"

namespace net {

/// Owns one connected outbound TCP descriptor. Every blocking call is
/// bounded by a timeout; failures carry a NETWORK_* code.
class Socket {
public:
    Socket();
    ~Socket();

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    /// Try each resolved address in turn. The error reported is the one
    /// from the last address tried: NETWORK_TIMEOUT or NETWORK_REFUSED.
    core::Result<void> connect(const std::string& host, uint16_t port,
                               int timeout_ms);

    core::Result<void> send_all(std::span<const uint8_t> data);

    /// At least one byte, or NETWORK_CLOSED on an orderly shutdown and
    /// NETWORK_TIMEOUT when nothing arrives in time.
    core::Result<size_t> recv_some(std::span<uint8_t> buf, int timeout_ms);

    bool wait_readable(int timeout_ms) const;

    void close();
    bool is_open() const { return fd_ >= 0; }

    void set_nodelay(bool enable);
    void set_io_timeout(int timeout_ms);

    /// For SSL_set_fd. The socket keeps ownership.
    int native_handle() const { return fd_; }

private:
    int fd_ = -1;
};

/// Numeric IPv4 or IPv6 address, bracketed or not. TLS skips SNI for these.
bool is_ip_literal(const std::string& host);

} // namespace net
