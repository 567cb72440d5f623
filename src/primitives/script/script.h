#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/types.h"

namespace primitives::script {

inline constexpr uint8_t OP_0 = 0x00;
inline constexpr uint8_t OP_1 = 0x51;
inline constexpr uint8_t OP_16 = 0x60;

/// An output's scriptPubKey. The wallet only ever derives segwit
/// programs, so the helpers here stop at witness programs; everything
/// else is carried as opaque bytes.
class Script {
public:
    Script() = default;
    explicit Script(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}
    explicit Script(std::span<const uint8_t> bytes)
        : bytes_(bytes.begin(), bytes.end()) {}

    /// Throws std::invalid_argument on malformed hex.
    static Script from_hex(std::string_view hex);

    /// <version> <program>; version 0..16, program 2..40 bytes.
    static Script witness(int version, std::span<const uint8_t> program);

    static Script p2wpkh(const core::uint160& key_hash) {
        return witness(0, key_hash.bytes());
    }

    bool is_p2wpkh() const {
        return bytes_.size() == 22 && bytes_[0] == OP_0 && bytes_[1] == 20;
    }

    /// Elements fee outputs carry an empty scriptPubKey.
    bool is_fee() const { return bytes_.empty(); }

    /// (version, program) when this is a BIP141 witness program.
    std::optional<std::pair<int, std::vector<uint8_t>>> witness_program() const;

    const std::vector<uint8_t>& data() const { return bytes_; }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }
    std::string to_hex() const;

    bool operator==(const Script&) const = default;
    auto operator<=>(const Script&) const = default;

private:
    std::vector<uint8_t> bytes_;
};

} // namespace primitives::script
