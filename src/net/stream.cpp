// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/stream.h"
#include "core/logging.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <array>
#include <chrono>

namespace net {

namespace {

// ---------------------------------------------------------------------------
// OpenSSL RAII
// ---------------------------------------------------------------------------

struct SslCtxDeleter {
    void operator()(SSL_CTX* ctx) const {
        if (ctx) SSL_CTX_free(ctx);
    }
};
struct SslDeleter {
    void operator()(SSL* ssl) const {
        if (ssl) SSL_free(ssl);
    }
};
using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr    = std::unique_ptr<SSL, SslDeleter>;

/// Drain the OpenSSL error queue into one message.
std::string openssl_errors() {
    std::string out;
    unsigned long code;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out.empty() ? "unknown TLS error" : out;
}

// ---------------------------------------------------------------------------
// PlainStream
// ---------------------------------------------------------------------------

class PlainStream final : public Stream {
public:
    explicit PlainStream(Socket sock) : sock_(std::move(sock)) {}

    core::Result<void> write_all(std::string_view data) override {
        return sock_.send_all(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(data.data()), data.size()));
    }

    core::Result<size_t> read_some(std::span<uint8_t> buf,
                                   int timeout_ms) override {
        return sock_.recv_some(buf, timeout_ms);
    }

    void close() override { sock_.close(); }

private:
    Socket sock_;
};

// ---------------------------------------------------------------------------
// TlsStream
// ---------------------------------------------------------------------------

class TlsStream final : public Stream {
public:
    TlsStream(Socket sock, SslCtxPtr ctx, SslPtr ssl)
        : sock_(std::move(sock)), ctx_(std::move(ctx)), ssl_(std::move(ssl)) {}

    ~TlsStream() override { close(); }

    core::Result<void> write_all(std::string_view data) override {
        if (!ssl_) {
            return core::Error(core::ErrorCode::NETWORK_CLOSED,
                               "write on closed TLS stream");
        }
        size_t written = 0;
        while (written < data.size()) {
            size_t n = 0;
            int rc = SSL_write_ex(ssl_.get(), data.data() + written,
                                  data.size() - written, &n);
            if (rc != 1) {
                return map_error(SSL_get_error(ssl_.get(), rc), "write");
            }
            written += n;
        }
        return core::make_ok();
    }

    core::Result<size_t> read_some(std::span<uint8_t> buf,
                                   int timeout_ms) override {
        if (!ssl_) {
            return core::Error(core::ErrorCode::NETWORK_CLOSED,
                               "read on closed TLS stream");
        }
        if (buf.empty()) return size_t{0};

        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(timeout_ms);
        while (true) {
            // Records already decrypted by OpenSSL do not show up on the fd.
            if (SSL_pending(ssl_.get()) == 0) {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now()).count();
                if (left < 0) left = 0;
                if (!sock_.wait_readable(static_cast<int>(left))) {
                    return core::Error(core::ErrorCode::NETWORK_TIMEOUT,
                                       "no data within " +
                                       std::to_string(timeout_ms) + " ms");
                }
            }
            size_t n = 0;
            int rc = SSL_read_ex(ssl_.get(), buf.data(), buf.size(), &n);
            if (rc == 1) return n;
            int err = SSL_get_error(ssl_.get(), rc);
            // A non-application record (session ticket, alert) was consumed.
            if (err == SSL_ERROR_WANT_READ) continue;
            return map_error(err, "read");
        }
    }

    void close() override {
        if (ssl_) {
            SSL_shutdown(ssl_.get());
            ssl_.reset();
        }
        sock_.close();
    }

private:
    core::Error map_error(int err, const char* op) {
        if (err == SSL_ERROR_ZERO_RETURN) {
            return core::Error(core::ErrorCode::NETWORK_CLOSED,
                               std::string("TLS ") + op + ": peer closed stream");
        }
        if (err == SSL_ERROR_SYSCALL) {
            ERR_clear_error();
            return core::Error(core::ErrorCode::NETWORK_CLOSED,
                               std::string("TLS ") + op + ": connection lost");
        }
        return core::Error(core::ErrorCode::NETWORK_TLS,
                           std::string("TLS ") + op + ": " + openssl_errors());
    }

    Socket sock_;
    SslCtxPtr ctx_;
    SslPtr ssl_;
};

core::Result<std::unique_ptr<Stream>> open_tls(Socket sock,
                                               const std::string& host,
                                               bool validate_domain) {
    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
        return core::Error(core::ErrorCode::NETWORK_TLS,
                           "SSL_CTX_new: " + openssl_errors());
    }
    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
    if (validate_domain) {
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1) {
            return core::Error(core::ErrorCode::NETWORK_TLS,
                               "cannot load trust store: " + openssl_errors());
        }
    } else {
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
    }

    SslPtr ssl(SSL_new(ctx.get()));
    if (!ssl) {
        return core::Error(core::ErrorCode::NETWORK_TLS,
                           "SSL_new: " + openssl_errors());
    }
    if (SSL_set_fd(ssl.get(), sock.native_handle()) != 1) {
        return core::Error(core::ErrorCode::NETWORK_TLS,
                           "SSL_set_fd: " + openssl_errors());
    }
    if (!is_ip_literal(host)) {
        SSL_set_tlsext_host_name(ssl.get(), host.c_str());
    }
    if (validate_domain) {
        SSL_set_hostflags(ssl.get(), X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
        if (SSL_set1_host(ssl.get(), host.c_str()) != 1) {
            return core::Error(core::ErrorCode::NETWORK_TLS,
                               "SSL_set1_host: " + openssl_errors());
        }
    }

    int rc = SSL_connect(ssl.get());
    if (rc != 1) {
        std::string detail = openssl_errors();
        long verify = SSL_get_verify_result(ssl.get());
        if (verify != X509_V_OK) {
            detail = std::string("certificate verification failed: ") +
                     X509_verify_cert_error_string(verify);
        }
        return core::Error(core::ErrorCode::NETWORK_TLS,
                           "TLS handshake with " + host + " failed: " + detail);
    }

    LOG_DEBUG(core::LogCategory::NET,
              "TLS established with " + host + " (" +
              SSL_get_version(ssl.get()) + ")");
    return std::unique_ptr<Stream>(
        new TlsStream(std::move(sock), std::move(ctx), std::move(ssl)));
}

} // anonymous namespace

// ===================================================================
// open_stream
// ===================================================================

core::Result<std::unique_ptr<Stream>> open_stream(const std::string& host,
                                                  uint16_t port,
                                                  const StreamOptions& opts) {
    Socket sock;
    CTW_TRY_VOID(sock.connect(host, port, opts.timeout_ms));
    sock.set_nodelay(true);
    // Bounds the TLS handshake and writes; reads use select().
    sock.set_io_timeout(opts.timeout_ms);

    if (opts.tls) {
        return open_tls(std::move(sock), host, opts.validate_domain);
    }
    return std::unique_ptr<Stream>(new PlainStream(std::move(sock)));
}

// ===================================================================
// LineReader
// ===================================================================

core::Result<void> LineReader::fill(int timeout_ms) {
    std::array<uint8_t, 16384> chunk;
    CTW_TRY_ASSIGN(n, stream_.read_some(chunk, timeout_ms));
    buffer_.append(reinterpret_cast<const char*>(chunk.data()), n);
    return core::make_ok();
}

core::Result<std::string> LineReader::read_line(int timeout_ms) {
    size_t scanned = 0;
    while (true) {
        size_t nl = buffer_.find('\n', scanned);
        if (nl != std::string::npos) {
            std::string line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
        scanned = buffer_.size();
        if (buffer_.size() > max_line_) {
            return core::Error(core::ErrorCode::NETWORK_PROTOCOL,
                               "line exceeds " + std::to_string(max_line_) +
                               " bytes");
        }
        CTW_TRY_VOID(fill(timeout_ms));
    }
}

core::Result<std::string> LineReader::read_exact(size_t n, int timeout_ms) {
    while (buffer_.size() < n) {
        CTW_TRY_VOID(fill(timeout_ms));
    }
    std::string out = buffer_.substr(0, n);
    buffer_.erase(0, n);
    return out;
}

core::Result<std::string> LineReader::read_to_end(int timeout_ms) {
    while (true) {
        auto r = fill(timeout_ms);
        if (!r.ok()) {
            if (r.error().code() == core::ErrorCode::NETWORK_CLOSED) break;
            return r.error();
        }
        if (buffer_.size() > max_line_) {
            return core::Error(core::ErrorCode::NETWORK_PROTOCOL,
                               "response body too large");
        }
    }
    std::string out = std::move(buffer_);
    buffer_.clear();
    return out;
}

} // namespace net
