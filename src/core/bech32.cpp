// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/bech32.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace core {

namespace {

constexpr char CHARSET[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

constexpr std::array<int8_t, 128> make_charset_rev() {
    std::array<int8_t, 128> rev{};
    rev.fill(-1);
    for (int i = 0; i < 32; ++i) {
        rev[static_cast<uint8_t>(CHARSET[i])] = static_cast<int8_t>(i);
    }
    return rev;
}

constexpr auto CHARSET_REV = make_charset_rev();

// A BCH code over GF(32): generator, checksum length in 5-bit groups,
// the residues that mark the plain and "m" variants, and the longest
// string the code is used for.
struct Code {
    std::array<uint64_t, 5> gen;
    size_t checksum_len;
    uint64_t plain_const;
    uint64_t m_const;
    size_t max_len;
    Bech32Encoding plain;
    Bech32Encoding m;
};

constexpr Code BECH32_CODE{
    {0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3},
    6, 1, 0x2bc830a3, 90,
    Bech32Encoding::BECH32, Bech32Encoding::BECH32M};

constexpr Code BLECH32_CODE{
    {0x7d52fba40bd886, 0x5e8dbf1a03950c, 0x1c3a3c74072a18,
     0x385d72fa0e5139, 0x7093e5a608865b},
    12, 1, 0x455972a3350f7a1, 1000,
    Bech32Encoding::BLECH32, Bech32Encoding::BLECH32M};

const Code* code_for(Bech32Encoding enc) {
    switch (enc) {
    case Bech32Encoding::BECH32:
    case Bech32Encoding::BECH32M:
        return &BECH32_CODE;
    case Bech32Encoding::BLECH32:
    case Bech32Encoding::BLECH32M:
        return &BLECH32_CODE;
    case Bech32Encoding::INVALID:
        break;
    }
    return nullptr;
}

uint64_t polymod(const Code& code, std::string_view hrp,
                 std::span<const uint8_t> values, size_t zero_tail) {
    const unsigned top_shift = static_cast<unsigned>(5 * (code.checksum_len - 1));
    const uint64_t low_mask = (uint64_t{1} << top_shift) - 1;
    uint64_t chk = 1;
    auto feed = [&](uint8_t v) {
        const auto top = static_cast<uint8_t>(chk >> top_shift);
        chk = ((chk & low_mask) << 5) ^ v;
        for (int i = 0; i < 5; ++i) {
            if ((top >> i) & 1) chk ^= code.gen[i];
        }
    };
    for (char c : hrp) feed(static_cast<uint8_t>(c) >> 5);
    feed(0);
    for (char c : hrp) feed(static_cast<uint8_t>(c) & 0x1f);
    for (uint8_t v : values) feed(v);
    for (size_t i = 0; i < zero_tail; ++i) feed(0);
    return chk;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool program_size_ok(uint8_t version, size_t size) {
    if (version > 16 || size < 2 || size > 40) return false;
    return version != 0 || size == 20 || size == 32;
}

// Version group followed by the regrouped bytes.
std::vector<uint8_t> witness_values(uint8_t version,
                                    std::span<const uint8_t> bytes) {
    std::vector<uint8_t> values{version};
    auto five = convert_bits(bytes, 8, 5, true);
    if (five) values.insert(values.end(), five->begin(), five->end());
    return values;
}

// Split a decoded segwit payload into its version and regrouped bytes,
// checking that the variant matches the version.
std::optional<std::pair<uint8_t, std::vector<uint8_t>>> witness_payload(
    const Bech32DecodeResult& dec, std::string_view hrp,
    Bech32Encoding v0_encoding) {
    if (dec.encoding == Bech32Encoding::INVALID || dec.data.empty() ||
        dec.hrp != lower(hrp)) {
        return std::nullopt;
    }
    const uint8_t version = dec.data[0];
    if (version > 16 || (version == 0) != (dec.encoding == v0_encoding)) {
        return std::nullopt;
    }
    auto bytes = convert_bits(
        std::span<const uint8_t>(dec.data).subspan(1), 5, 8, false);
    if (!bytes) return std::nullopt;
    return std::pair{version, std::move(*bytes)};
}

}  // namespace

std::string bech32_encode(std::string_view hrp,
                          std::span<const uint8_t> values,
                          Bech32Encoding encoding) {
    const Code* code = code_for(encoding);
    if (code == nullptr || hrp.empty() || hrp.size() > 83) return {};
    if (hrp.size() + 1 + values.size() + code->checksum_len > code->max_len) {
        return {};
    }
    if (std::any_of(hrp.begin(), hrp.end(),
                    [](char c) { return c < 33 || c > 126; }) ||
        std::any_of(values.begin(), values.end(),
                    [](uint8_t v) { return v > 31; })) {
        return {};
    }

    const std::string low_hrp = lower(hrp);
    const uint64_t target =
        encoding == code->m ? code->m_const : code->plain_const;
    const uint64_t mod =
        polymod(*code, low_hrp, values, code->checksum_len) ^ target;

    std::string out = low_hrp + '1';
    for (uint8_t v : values) out.push_back(CHARSET[v]);
    for (size_t i = 0; i < code->checksum_len; ++i) {
        out.push_back(CHARSET[(mod >> (5 * (code->checksum_len - 1 - i))) & 0x1f]);
    }
    return out;
}

Bech32DecodeResult bech32_decode(std::string_view str, bool blech) {
    const Code& code = blech ? BLECH32_CODE : BECH32_CODE;
    Bech32DecodeResult result;
    if (str.empty() || str.size() > code.max_len) return result;

    bool lower_seen = false;
    bool upper_seen = false;
    for (char c : str) {
        if (c < 33 || c > 126) return result;
        lower_seen |= (c >= 'a' && c <= 'z');
        upper_seen |= (c >= 'A' && c <= 'Z');
    }
    if (lower_seen && upper_seen) return result;

    const size_t sep = str.rfind('1');
    if (sep == std::string_view::npos || sep == 0 ||
        str.size() - sep - 1 < code.checksum_len) {
        return result;
    }

    std::string hrp = lower(str.substr(0, sep));
    std::vector<uint8_t> data;
    data.reserve(str.size() - sep - 1);
    for (char c : lower(str.substr(sep + 1))) {
        const int8_t v = CHARSET_REV[static_cast<uint8_t>(c)];
        if (v < 0) return result;
        data.push_back(static_cast<uint8_t>(v));
    }

    const uint64_t residue = polymod(code, hrp, data, 0);
    if (residue == code.plain_const) {
        result.encoding = code.plain;
    } else if (residue == code.m_const) {
        result.encoding = code.m;
    } else {
        return result;
    }
    data.resize(data.size() - code.checksum_len);
    result.hrp = std::move(hrp);
    result.data = std::move(data);
    return result;
}

std::optional<std::vector<uint8_t>> convert_bits(
    std::span<const uint8_t> data, int from_bits, int to_bits, bool pad) {
    std::vector<uint8_t> out;
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t max_v = (1u << to_bits) - 1;
    for (uint8_t value : data) {
        if ((value >> from_bits) != 0) return std::nullopt;
        acc = (acc << from_bits) | value;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & max_v));
        }
        acc &= (1u << bits) - 1;
    }
    if (pad) {
        if (bits > 0) {
            out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & max_v));
        }
    } else if (bits >= from_bits || acc != 0) {
        return std::nullopt;
    }
    return out;
}

std::string encode_segwit(std::string_view hrp, uint8_t witness_version,
                          std::span<const uint8_t> program) {
    if (!program_size_ok(witness_version, program.size())) return {};
    return bech32_encode(hrp, witness_values(witness_version, program),
                         witness_version == 0 ? Bech32Encoding::BECH32
                                              : Bech32Encoding::BECH32M);
}

std::optional<std::pair<uint8_t, std::vector<uint8_t>>> decode_segwit(
    std::string_view hrp, std::string_view addr) {
    auto payload = witness_payload(bech32_decode(addr), hrp,
                                   Bech32Encoding::BECH32);
    if (!payload || !program_size_ok(payload->first, payload->second.size())) {
        return std::nullopt;
    }
    return payload;
}

std::string encode_confidential_segwit(std::string_view hrp,
                                       uint8_t witness_version,
                                       std::span<const uint8_t> blinding_pubkey,
                                       std::span<const uint8_t> program) {
    if (blinding_pubkey.size() != 33 ||
        !program_size_ok(witness_version, program.size())) {
        return {};
    }
    std::vector<uint8_t> payload(blinding_pubkey.begin(), blinding_pubkey.end());
    payload.insert(payload.end(), program.begin(), program.end());
    return bech32_encode(hrp, witness_values(witness_version, payload),
                         witness_version == 0 ? Bech32Encoding::BLECH32
                                              : Bech32Encoding::BLECH32M);
}

std::optional<ConfidentialSegwit> decode_confidential_segwit(
    std::string_view hrp, std::string_view addr) {
    auto payload = witness_payload(bech32_decode(addr, true), hrp,
                                   Bech32Encoding::BLECH32);
    if (!payload || payload->second.size() < 33 ||
        !program_size_ok(payload->first, payload->second.size() - 33)) {
        return std::nullopt;
    }
    ConfidentialSegwit out;
    out.witness_version = payload->first;
    out.blinding_pubkey.assign(payload->second.begin(),
                               payload->second.begin() + 33);
    out.program.assign(payload->second.begin() + 33, payload->second.end());
    return out;
}

}  // namespace core
