// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/hex.h"

#include <array>

namespace core {

namespace {

constexpr char DIGITS[] = "0123456789abcdef";

// ASCII -> nibble, 0xFF for anything that is not a hex digit.
constexpr std::array<uint8_t, 256> make_nibble_table() {
    std::array<uint8_t, 256> table{};
    table.fill(0xFF);
    for (int i = 0; i < 16; ++i) {
        table[static_cast<uint8_t>(DIGITS[i])] = static_cast<uint8_t>(i);
    }
    for (int i = 0; i < 6; ++i) {
        table[static_cast<uint8_t>('A' + i)] = static_cast<uint8_t>(10 + i);
    }
    return table;
}

constexpr auto NIBBLE = make_nibble_table();

}  // namespace

std::string to_hex(std::span<const uint8_t> data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        out.push_back(DIGITS[byte >> 4]);
        out.push_back(DIGITS[byte & 0x0F]);
    }
    return out;
}

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex) {
    if (!is_hex(hex)) {
        return std::nullopt;
    }
    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>(
            (NIBBLE[static_cast<uint8_t>(hex[2 * i])] << 4) |
            NIBBLE[static_cast<uint8_t>(hex[2 * i + 1])]);
    }
    return out;
}

bool is_hex(std::string_view str) {
    if (str.size() % 2 != 0) {
        return false;
    }
    for (char ch : str) {
        if (NIBBLE[static_cast<uint8_t>(ch)] == 0xFF) {
            return false;
        }
    }
    return true;
}

}  // namespace core
