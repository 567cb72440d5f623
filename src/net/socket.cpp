// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/socket.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <memory>

#include "core/logging.h"

namespace net {

namespace {

using AddrInfoPtr = std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)>;

// A write to a peer that has gone away must fail with EPIPE instead of
// raising SIGPIPE.
void ignore_sigpipe() {
    static const bool done = [] {
        std::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)done;
}

std::string errno_text(int err) {
    return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
}

bool peer_gone(int err) {
    return err == ECONNRESET || err == EPIPE || err == ENOTCONN;
}

bool poll_fd(int fd, short events, int timeout_ms) {
    pollfd p{fd, events, 0};
    int rc;
    do {
        rc = ::poll(&p, 1, std::max(timeout_ms, 0));
    } while (rc < 0 && errno == EINTR);
    return rc > 0 && (p.revents & events) != 0;
}

void set_blocking(int fd, bool blocking) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return;
    ::fcntl(fd, F_SETFL, blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK));
}

constexpr size_t IO_CHUNK = 1 << 20;

} // namespace

Socket::Socket() {
    ignore_sigpipe();
}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

core::Result<void> Socket::connect(const std::string& host, uint16_t port,
                                   int timeout_ms) {
    const std::string endpoint = host + ":" + std::to_string(port);
    if (host.empty() || port == 0) {
        return core::Error(core::ErrorCode::NETWORK_ERROR,
                           "bad endpoint " + endpoint);
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* raw = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(),
                                  &hints, &raw);
    if (gai != 0 || raw == nullptr) {
        return core::Error(core::ErrorCode::NETWORK_ERROR,
                           "cannot resolve " + endpoint + ": " + gai_strerror(gai));
    }
    AddrInfoPtr addrs(raw, &::freeaddrinfo);

    core::Error last(core::ErrorCode::NETWORK_ERROR,
                     "no usable address for " + endpoint);
    for (const addrinfo* ai = addrs.get(); ai != nullptr; ai = ai->ai_next) {
        close();
        fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd_ < 0) {
            last = core::Error(core::ErrorCode::NETWORK_ERROR,
                               "socket: " + errno_text(errno));
            continue;
        }

        // Non-blocking so the handshake can be bounded by poll().
        set_blocking(fd_, false);
        if (::connect(fd_, ai->ai_addr, ai->ai_addrlen) != 0) {
            if (errno != EINPROGRESS) {
                last = core::Error(core::ErrorCode::NETWORK_REFUSED,
                                   endpoint + ": " + errno_text(errno));
                continue;
            }
            if (!poll_fd(fd_, POLLOUT, timeout_ms)) {
                last = core::Error(core::ErrorCode::NETWORK_TIMEOUT,
                                   endpoint + ": no answer within " +
                                   std::to_string(timeout_ms) + " ms");
                continue;
            }
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 ||
                so_error != 0) {
                last = core::Error(core::ErrorCode::NETWORK_REFUSED,
                                   endpoint + ": " + errno_text(so_error));
                continue;
            }
        }
        set_blocking(fd_, true);
        LOG_DEBUG(core::LogCategory::NET, "connected to " + endpoint);
        return core::make_ok();
    }

    close();
    return last;
}

core::Result<void> Socket::send_all(std::span<const uint8_t> data) {
    if (!is_open()) {
        return core::Error(core::ErrorCode::NETWORK_CLOSED, "socket is closed");
    }
    while (!data.empty()) {
        const ssize_t n = ::send(fd_, data.data(),
                                 std::min(data.size(), IO_CHUNK), MSG_NOSIGNAL);
        if (n > 0) {
            data = data.subspan(static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n == 0 || peer_gone(errno)) {
            return core::Error(core::ErrorCode::NETWORK_CLOSED,
                               "peer closed the connection during send");
        }
        return core::Error(core::ErrorCode::NETWORK_ERROR,
                           "send: " + errno_text(errno));
    }
    return core::make_ok();
}

core::Result<size_t> Socket::recv_some(std::span<uint8_t> buf, int timeout_ms) {
    if (!is_open()) {
        return core::Error(core::ErrorCode::NETWORK_CLOSED, "socket is closed");
    }
    if (buf.empty()) return size_t{0};
    if (!wait_readable(timeout_ms)) {
        return core::Error(core::ErrorCode::NETWORK_TIMEOUT,
                           "nothing received within " +
                           std::to_string(timeout_ms) + " ms");
    }
    for (;;) {
        const ssize_t n = ::recv(fd_, buf.data(), std::min(buf.size(), IO_CHUNK), 0);
        if (n > 0) return static_cast<size_t>(n);
        if (n == 0) {
            return core::Error(core::ErrorCode::NETWORK_CLOSED,
                               "peer closed the connection");
        }
        if (errno == EINTR) continue;
        if (peer_gone(errno)) {
            return core::Error(core::ErrorCode::NETWORK_CLOSED,
                               "connection reset by peer");
        }
        return core::Error(core::ErrorCode::NETWORK_ERROR,
                           "recv: " + errno_text(errno));
    }
}

bool Socket::wait_readable(int timeout_ms) const {
    return is_open() && poll_fd(fd_, POLLIN, timeout_ms);
}

void Socket::close() {
    if (!is_open()) return;
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    fd_ = -1;
}

void Socket::set_nodelay(bool enable) {
    if (!is_open()) return;
    const int on = enable ? 1 : 0;
    ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on));
}

void Socket::set_io_timeout(int timeout_ms) {
    if (!is_open()) return;
    timeval tv{};
    tv.tv_sec = std::max(timeout_ms, 0) / 1000;
    tv.tv_usec = (std::max(timeout_ms, 0) % 1000) * 1000;
    ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool is_ip_literal(const std::string& host) {
    std::string h = host;
    if (h.size() >= 2 && h.front() == '[' && h.back() == ']') {
        h = h.substr(1, h.size() - 2);
    }
    in6_addr buf{};
    return ::inet_pton(AF_INET, h.c_str(), &buf) == 1 ||
           ::inet_pton(AF_INET6, h.c_str(), &buf) == 1;
}

} // namespace net
