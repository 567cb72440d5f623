#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------
// Grouped by hundreds so a log reader can tell the layer from the number.
// ---------------------------------------------------------------------------
#define CTW_ERROR_CODES(X)                                                \
    X(NONE, 0)                                                            \
    /* malformed bytes or text */                                         \
    X(PARSE_ERROR, 100) X(PARSE_OVERFLOW, 101) X(PARSE_UNDERFLOW, 102)    \
    X(PARSE_BAD_FORMAT, 103) X(PARSE_BAD_CHECKSUM, 104)                   \
    /* well-formed but unacceptable input */                              \
    X(VALIDATION_ERROR, 200) X(VALIDATION_RANGE, 201)                     \
    X(VALIDATION_SCRIPT, 202)                                             \
    /* backend reachability; NETWORK_PROTOCOL means it answered wrongly */\
    X(NETWORK_ERROR, 300) X(NETWORK_TIMEOUT, 301)                         \
    X(NETWORK_REFUSED, 302) X(NETWORK_CLOSED, 303) X(NETWORK_TLS, 304)    \
    X(NETWORK_PROTOCOL, 350)                                              \
    X(CRYPTO_ERROR, 400) X(CRYPTO_KEY_FAIL, 403)                          \
    X(CRYPTO_NETWORK_MISMATCH, 404)                                       \
    X(STORAGE_ERROR, 500) X(STORAGE_NOT_FOUND, 501)                       \
    X(STORAGE_CORRUPT, 502) X(STORAGE_LOCKED, 503)                        \
    X(STORAGE_POISONED, 504)                                              \
    X(WALLET_NOT_OURS, 601) X(WALLET_UNSUPPORTED_BLINDING, 602)           \
    X(RPC_ERROR, 700) X(RPC_METHOD_MISS, 702)                             \
    X(INTERNAL_ERROR, 900) X(NOT_IMPLEMENTED, 901)

enum class ErrorCode : uint16_t {
#define CTW_ERROR_ENUM(name, value) name = value,
    CTW_ERROR_CODES(CTW_ERROR_ENUM)
#undef CTW_ERROR_ENUM
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

// True for outage-type network failures the caller may retry. A
// NETWORK_PROTOCOL error is not transport: the peer misbehaved.
[[nodiscard]] bool is_transport_error(ErrorCode code) noexcept;

// ---------------------------------------------------------------------------
// Error -- code, message and the place it was raised
// ---------------------------------------------------------------------------
class Error {
public:
    Error() noexcept : code_(ErrorCode::NONE) {}

    explicit Error(ErrorCode code, std::string message = {},
                   std::source_location loc = std::source_location::current()) noexcept
        : code_(code), message_(std::move(message)), location_(loc) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return location_;
    }
    [[nodiscard]] bool is_ok() const noexcept { return code_ == ErrorCode::NONE; }

    /// "STORAGE_LOCKED(503): <message> [store.cpp:88]"
    [[nodiscard]] std::string format() const;

    // Errors compare by code only.
    bool operator==(const Error& o) const noexcept { return code_ == o.code_; }

private:
    ErrorCode code_;
    std::string message_;
    std::source_location location_;
};

// ---------------------------------------------------------------------------
// Result<T> -- a value or an Error
// ---------------------------------------------------------------------------
// value() and error() throw std::logic_error when called on the wrong
// alternative; callers test ok() first or go through CTW_TRY.
// ---------------------------------------------------------------------------
template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>, "Result value and error types must differ");

public:
    Result(const T& val) : storage_(val) {}          // NOLINT implicit
    Result(T&& val) : storage_(std::move(val)) {}    // NOLINT implicit
    Result(const E& err) : storage_(err) {}          // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}    // NOLINT implicit

    [[nodiscard]] bool ok() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        expect_value();
        return std::get<0>(storage_);
    }
    [[nodiscard]] const T& value() const& {
        expect_value();
        return std::get<0>(storage_);
    }
    [[nodiscard]] T&& value() && {
        expect_value();
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E& error() & {
        expect_error();
        return std::get<1>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        expect_error();
        return std::get<1>(storage_);
    }
    [[nodiscard]] E&& error() && {
        expect_error();
        return std::get<1>(std::move(storage_));
    }

private:
    void expect_value() const {
        if (!ok()) throw std::logic_error("Result::value() on error: " +
                                          std::get<1>(storage_).message());
    }
    void expect_error() const {
        if (ok()) throw std::logic_error("Result::error() on value");
    }

    std::variant<T, E> storage_;
};

// Side-effect-only operations.
template <typename E>
class Result<void, E> {
public:
    Result() noexcept = default;
    Result(const E& err) : error_(err), failed_(true) {}             // NOLINT implicit
    Result(E&& err) : error_(std::move(err)), failed_(true) {}       // NOLINT implicit

    [[nodiscard]] bool ok() const noexcept { return !failed_; }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    /// Throws std::runtime_error carrying the message if this holds an error.
    void value() const {
        if (failed_) throw std::runtime_error(error_.message());
    }

    [[nodiscard]] const E& error() const& {
        if (!failed_) throw std::logic_error("Result::error() on value");
        return error_;
    }
    [[nodiscard]] E&& error() && {
        if (!failed_) throw std::logic_error("Result::error() on value");
        return std::move(error_);
    }

private:
    E error_{};
    bool failed_ = false;
};

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

// ---------------------------------------------------------------------------
// Error propagation
// ---------------------------------------------------------------------------

// auto val = CTW_TRY(expr);   (GCC/Clang statement-expression)
#define CTW_TRY(expr)                                                     \
    ({                                                                    \
        auto&& _ctw_res = (expr);                                         \
        if (!_ctw_res.ok()) return std::move(_ctw_res).error();           \
        std::move(_ctw_res).value();                                      \
    })

// CTW_TRY_ASSIGN(val, expr);  declares |val|.
#define CTW_TRY_ASSIGN(var, expr)                                         \
    auto _ctw_tmp_##var = (expr);                                         \
    if (!_ctw_tmp_##var.ok())                                             \
        return std::move(_ctw_tmp_##var).error();                         \
    auto var = std::move(_ctw_tmp_##var).value()

// CTW_TRY_VOID(expr);  for Result<void>.
#define CTW_TRY_VOID(expr)                                                \
    do {                                                                  \
        auto _ctw_tmp = (expr);                                           \
        if (!_ctw_tmp.ok()) return std::move(_ctw_tmp).error();           \
    } while (false)

} // namespace core
