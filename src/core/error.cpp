// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <filesystem>

namespace core {

std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
#define CTW_ERROR_NAME(name, value) case ErrorCode::name: return #name;
        CTW_ERROR_CODES(CTW_ERROR_NAME)
#undef CTW_ERROR_NAME
    }
    return "UNKNOWN";
}

bool is_transport_error(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::NETWORK_ERROR:
    case ErrorCode::NETWORK_TIMEOUT:
    case ErrorCode::NETWORK_REFUSED:
    case ErrorCode::NETWORK_CLOSED:
    case ErrorCode::NETWORK_TLS:
        return true;
    default:
        return false;
    }
}

std::string Error::format() const {
    if (is_ok()) return "no error";

    std::string out(error_code_name(code_));
    out += '(' + std::to_string(static_cast<unsigned>(code_)) + ')';
    if (!message_.empty()) out += ": " + message_;

    const char* file = location_.file_name();
    if (file != nullptr && file[0] != '\0') {
        out += " [" + std::filesystem::path(file).filename().string() + ":" +
               std::to_string(location_.line()) + "]";
    }
    return out;
}

} // namespace core
