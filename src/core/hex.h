#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Lowercase hex of |data|, in the order given.
std::string to_hex(std::span<const uint8_t> data);

// Decode hex (either case). nullopt on odd length or a non-hex character.
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

// True if |str| is even-length and every character is a hex digit.
bool is_hex(std::string_view str);

}  // namespace core
