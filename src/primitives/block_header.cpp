// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/block_header.h"

#include "core/hex.h"
#include "crypto/hash.h"

#include <stdexcept>

namespace primitives {

core::uint256 BlockHeader::hash() const {
    crypto::HashWriter hw;
    serialize_to(hw, false);
    return hw.hash();
}

std::vector<uint8_t> BlockHeader::serialize() const {
    core::DataStream s;
    serialize_to(s, true);
    return s.release();
}

core::Result<BlockHeader> BlockHeader::from_bytes(
    std::span<const uint8_t> bytes) {
    core::DataStream s(bytes);
    try {
        BlockHeader h = deserialize(s);
        if (!s.eof()) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                "BlockHeader::from_bytes: trailing data");
        }
        return h;
    } catch (const std::exception& e) {
        return core::Error(core::ErrorCode::PARSE_ERROR,
            std::string("BlockHeader::from_bytes: ") + e.what());
    }
}

core::Result<BlockHeader> BlockHeader::from_hex(std::string_view hex) {
    auto bytes = core::from_hex(hex);
    if (!bytes) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
            "BlockHeader::from_hex: invalid hex");
    }
    return from_bytes(*bytes);
}

} // namespace primitives
