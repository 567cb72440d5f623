// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/base58.h"

#include <algorithm>
#include <array>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace core {

namespace {

constexpr char ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

constexpr std::array<int8_t, 256> make_digit_table() {
    std::array<int8_t, 256> table{};
    table.fill(-1);
    for (int i = 0; i < 58; ++i) {
        table[static_cast<uint8_t>(ALPHABET[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto DIGIT = make_digit_table();

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// First four bytes of SHA256(SHA256(data)). core/ sits below crypto/, so
// this goes to OpenSSL directly.
std::array<uint8_t, 4> checksum(std::span<const uint8_t> data) {
    MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    std::array<uint8_t, 32> round{};
    unsigned int len = 0;
    bool ok = ctx != nullptr &&
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1 &&
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1 &&
        EVP_DigestFinal_ex(ctx.get(), round.data(), &len) == 1 &&
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1 &&
        EVP_DigestUpdate(ctx.get(), round.data(), round.size()) == 1 &&
        EVP_DigestFinal_ex(ctx.get(), round.data(), &len) == 1;
    if (!ok) {
        throw std::runtime_error("base58check: SHA-256 failed");
    }
    return {round[0], round[1], round[2], round[3]};
}

// Multiply the big-endian number in |digits| (base |from|) by |from| and
// add |value|, in base |to|.
bool mul_add(std::vector<uint8_t>& digits, int to, int from, int value) {
    int carry = value;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        carry += from * static_cast<int>(*it);
        *it = static_cast<uint8_t>(carry % to);
        carry /= to;
    }
    return carry == 0;
}

}  // namespace

std::string base58_encode(std::span<const uint8_t> data) {
    size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) ++zeros;

    // log(256) / log(58) < 1.38
    std::vector<uint8_t> digits(data.size() * 138 / 100 + 1, 0);
    for (size_t i = zeros; i < data.size(); ++i) {
        mul_add(digits, 58, 256, data[i]);
    }

    auto first = std::find_if(digits.begin(), digits.end(),
                              [](uint8_t d) { return d != 0; });
    std::string out(zeros, '1');
    for (auto it = first; it != digits.end(); ++it) out.push_back(ALPHABET[*it]);
    return out;
}

std::optional<std::vector<uint8_t>> base58_decode(std::string_view str) {
    size_t ones = 0;
    while (ones < str.size() && str[ones] == '1') ++ones;

    // log(58) / log(256) < 0.733
    std::vector<uint8_t> bytes(str.size() * 733 / 1000 + 1, 0);
    for (size_t i = ones; i < str.size(); ++i) {
        int digit = DIGIT[static_cast<uint8_t>(str[i])];
        if (digit < 0 || !mul_add(bytes, 256, 58, digit)) {
            return std::nullopt;
        }
    }

    auto first = std::find_if(bytes.begin(), bytes.end(),
                              [](uint8_t b) { return b != 0; });
    std::vector<uint8_t> out(ones, 0x00);
    out.insert(out.end(), first, bytes.end());
    return out;
}

std::string base58check_encode(std::span<const uint8_t> data) {
    std::vector<uint8_t> buf(data.begin(), data.end());
    auto sum = checksum(data);
    buf.insert(buf.end(), sum.begin(), sum.end());
    return base58_encode(buf);
}

std::optional<std::vector<uint8_t>> base58check_decode(std::string_view str) {
    auto decoded = base58_decode(str);
    if (!decoded || decoded->size() < 4) {
        return std::nullopt;
    }
    size_t payload = decoded->size() - 4;
    auto sum = checksum(std::span<const uint8_t>(decoded->data(), payload));
    if (!std::equal(sum.begin(), sum.end(), decoded->begin() + payload)) {
        return std::nullopt;
    }
    decoded->resize(payload);
    return decoded;
}

}  // namespace core
