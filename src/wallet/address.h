#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "crypto/secp256k1.h"
#include "primitives/script/script.h"
#include "wallet/network.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wallet {

// ---------------------------------------------------------------------------
// Address -- segwit address, optionally carrying a blinding pubkey
// ---------------------------------------------------------------------------
// Unconfidential addresses are bech32/bech32m under the network's bech32
// HRP. Confidential addresses are blech32/blech32m under the blech32 HRP
// and embed the receiver's 33-byte blinding pubkey before the program.
// ---------------------------------------------------------------------------
struct Address {
    Network network = Network::Liquid;
    uint8_t witness_version = 0;
    std::vector<uint8_t> program;
    std::optional<crypto::PubKey> blinding_pubkey;

    [[nodiscard]] bool is_confidential() const {
        return blinding_pubkey.has_value();
    }

    [[nodiscard]] primitives::script::Script script_pubkey() const;

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] Address to_unconfidential() const;

    /// Build from a witness-program scriptPubKey.
    static core::Result<Address> from_script(
        const primitives::script::Script& script, Network network,
        std::optional<crypto::PubKey> blinding_pubkey = std::nullopt);

    /// Parse an address string. An address valid for another network is
    /// rejected with CRYPTO_NETWORK_MISMATCH.
    static core::Result<Address> parse(std::string_view str,
                                       Network expected);

    bool operator==(const Address&) const = default;
};

} // namespace wallet
