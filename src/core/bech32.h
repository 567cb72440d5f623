#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Segwit address text forms. Unconfidential addresses use Bech32 (BIP173)
// or Bech32m (BIP350); confidential ones use the Elements Blech32 and
// Blech32m codes, which share the alphabet but carry a 12 character
// checksum so the blinding pubkey fits in the payload.

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace core {

enum class Bech32Encoding {
    INVALID,
    BECH32,
    BECH32M,
    BLECH32,
    BLECH32M,
};

struct Bech32DecodeResult {
    Bech32Encoding encoding = Bech32Encoding::INVALID;
    std::string hrp;
    std::vector<uint8_t> data;  // 5-bit groups, checksum stripped
};

/// Encode 5-bit |values| under |hrp|. Empty string on a value above 31,
/// a bad HRP or a result longer than the encoding allows.
std::string bech32_encode(std::string_view hrp,
                          std::span<const uint8_t> values,
                          Bech32Encoding encoding);

/// Decode a string with a 6 character (Bech32/Bech32m) or, when
/// |blech| is set, a 12 character (Blech32/Blech32m) checksum.
Bech32DecodeResult bech32_decode(std::string_view str, bool blech = false);

/// Regroup bits, e.g. bytes to 5-bit groups. nullopt on an out of range
/// input or, without |pad|, on leftover non-zero bits.
std::optional<std::vector<uint8_t>> convert_bits(
    std::span<const uint8_t> data, int from_bits, int to_bits, bool pad);

std::string encode_segwit(std::string_view hrp, uint8_t witness_version,
                          std::span<const uint8_t> program);

/// (witness version, program) of an address under |hrp|.
std::optional<std::pair<uint8_t, std::vector<uint8_t>>> decode_segwit(
    std::string_view hrp, std::string_view addr);

struct ConfidentialSegwit {
    uint8_t witness_version = 0;
    std::vector<uint8_t> blinding_pubkey;  // 33 bytes
    std::vector<uint8_t> program;
};

/// Payload is the witness version followed by blinding_pubkey || program.
std::string encode_confidential_segwit(std::string_view hrp,
                                       uint8_t witness_version,
                                       std::span<const uint8_t> blinding_pubkey,
                                       std::span<const uint8_t> program);

std::optional<ConfidentialSegwit> decode_confidential_segwit(
    std::string_view hrp, std::string_view addr);

}  // namespace core
