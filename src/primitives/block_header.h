#pragma once
// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "core/types.h"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace primitives {

// ---------------------------------------------------------------------------
// DynafedParams -- one dynamic-federation parameter entry
// ---------------------------------------------------------------------------
// Selector 0 = null, 1 = compact (signblockscript + witness limit),
// 2 = full (adds fedpeg program, fedpeg script and extension space).
// ---------------------------------------------------------------------------
struct DynafedParams {
    uint8_t selector = 0;
    std::vector<uint8_t> signblockscript;
    uint32_t signblock_witness_limit = 0;
    std::vector<uint8_t> fedpeg_program;
    std::vector<uint8_t> fedpegscript;
    std::vector<std::vector<uint8_t>> extension_space;

    bool operator==(const DynafedParams&) const = default;

    template <typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_u8(s, selector);
        if (selector == 0) return;
        core::ser_write_vector(s, signblockscript);
        core::ser_write_u32(s, signblock_witness_limit);
        if (selector == 2) {
            core::ser_write_vector(s, fedpeg_program);
            core::ser_write_vector(s, fedpegscript);
            core::ser_write_stack(s, extension_space);
        }
    }

    template <typename Stream>
    static DynafedParams deserialize(Stream& s) {
        DynafedParams p;
        p.selector = core::ser_read_u8(s);
        if (p.selector == 0) return p;
        if (p.selector > 2) {
            throw std::runtime_error("DynafedParams: invalid selector");
        }
        p.signblockscript = core::ser_read_vector(s);
        p.signblock_witness_limit = core::ser_read_u32(s);
        if (p.selector == 2) {
            p.fedpeg_program = core::ser_read_vector(s);
            p.fedpegscript = core::ser_read_vector(s);
            p.extension_space = core::ser_read_stack(s);
        }
        return p;
    }
};

// ---------------------------------------------------------------------------
// BlockHeader -- Elements block header
// ---------------------------------------------------------------------------
// Layout (all integers little-endian):
//   version      (4 bytes)   bit 31 set = dynamic federation header
//   prev_hash    (32 bytes)
//   merkle_root  (32 bytes)
//   timestamp    (4 bytes)
//   height       (4 bytes)
// then either
//   challenge | solution                        (legacy signed blocks)
// or
//   current params | proposed params | signblock witness   (dynafed)
// The block hash covers everything except the solution / witness.
// ---------------------------------------------------------------------------
class BlockHeader {
public:
    static constexpr uint32_t DYNAFED_VERSION_BIT = 0x80000000u;

    int32_t version = 0x20000000;
    core::uint256 prev_hash;
    core::uint256 merkle_root;
    uint32_t timestamp = 0;
    uint32_t height = 0;

    // Legacy proof.
    std::vector<uint8_t> challenge;
    std::vector<uint8_t> solution;

    // Dynamic federation.
    DynafedParams current;
    DynafedParams proposed;
    std::vector<std::vector<uint8_t>> signblock_witness;

    BlockHeader() = default;

    [[nodiscard]] bool is_dynafed() const {
        return (static_cast<uint32_t>(version) & DYNAFED_VERSION_BIT) != 0;
    }

    /// sha256d of the header without the solution / signblock witness.
    [[nodiscard]] core::uint256 hash() const;

    [[nodiscard]] std::vector<uint8_t> serialize() const;

    template <typename Stream>
    void serialize_to(Stream& s, bool include_witness) const;

    template <typename Stream>
    static BlockHeader deserialize(Stream& s);

    /// Parse a complete header; trailing bytes or truncation fail.
    [[nodiscard]] static core::Result<BlockHeader> from_bytes(
        std::span<const uint8_t> bytes);

    [[nodiscard]] static core::Result<BlockHeader> from_hex(
        std::string_view hex);

    bool operator==(const BlockHeader& o) const = default;
};

// =========================================================================
// Template implementations
// =========================================================================

template <typename Stream>
void BlockHeader::serialize_to(Stream& s, bool include_witness) const {
    core::ser_write_i32(s, version);
    core::ser_write_uint256(s, prev_hash);
    core::ser_write_uint256(s, merkle_root);
    core::ser_write_u32(s, timestamp);
    core::ser_write_u32(s, height);
    if (is_dynafed()) {
        current.serialize(s);
        proposed.serialize(s);
        if (include_witness) {
            core::ser_write_stack(s, signblock_witness);
        }
    } else {
        core::ser_write_vector(s, challenge);
        if (include_witness) {
            core::ser_write_vector(s, solution);
        }
    }
}

template <typename Stream>
BlockHeader BlockHeader::deserialize(Stream& s) {
    BlockHeader h;
    h.version     = core::ser_read_i32(s);
    h.prev_hash   = core::ser_read_uint256(s);
    h.merkle_root = core::ser_read_uint256(s);
    h.timestamp   = core::ser_read_u32(s);
    h.height      = core::ser_read_u32(s);
    if (h.is_dynafed()) {
        h.current  = DynafedParams::deserialize(s);
        h.proposed = DynafedParams::deserialize(s);
        h.signblock_witness = core::ser_read_stack(s);
    } else {
        h.challenge = core::ser_read_vector(s);
        h.solution  = core::ser_read_vector(s);
    }
    return h;
}

} // namespace primitives
