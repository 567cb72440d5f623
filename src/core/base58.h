#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Base58Check, the text form of BIP32 extended keys (xpub/tpub).

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

/// Base58 digits of |data|; each leading zero byte becomes a '1'.
std::string base58_encode(std::span<const uint8_t> data);

/// Inverse of base58_encode. nullopt on a character outside the alphabet.
std::optional<std::vector<uint8_t>> base58_decode(std::string_view str);

/// |data| followed by the first 4 bytes of SHA256d(data), Base58 encoded.
std::string base58check_encode(std::span<const uint8_t> data);

/// Payload of a Base58Check string. nullopt on bad encoding or checksum.
std::optional<std::vector<uint8_t>> base58check_decode(std::string_view str);

}  // namespace core
