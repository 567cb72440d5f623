// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/transaction.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "core/hex.h"
#include "crypto/hash.h"

namespace primitives {

namespace {

template <typename T>
std::vector<T> read_list(core::DataStream& s, const char* what) {
    const uint64_t count = core::ser_read_compact_size(s);
    if (count > core::MAX_VECTOR_SIZE) {
        throw std::length_error(std::string("too many ") + what);
    }
    std::vector<T> items;
    items.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        items.push_back(T::deserialize(s));
    }
    return items;
}

Transaction read_transaction(core::DataStream& s) {
    const int32_t version = core::ser_read_i32(s);
    const uint8_t flags = core::ser_read_u8(s);
    if (flags > 1) {
        throw std::invalid_argument("unknown transaction flags");
    }
    auto vin = read_list<TxInput>(s, "inputs");
    auto vout = read_list<TxOutput>(s, "outputs");
    const uint32_t locktime = core::ser_read_u32(s);

    if (flags == 1) {
        for (auto& in : vin) {
            in.witness.issuance_amount_rangeproof = core::ser_read_vector(s);
            in.witness.inflation_keys_rangeproof = core::ser_read_vector(s);
            in.witness.script_witness = core::ser_read_stack(s);
            in.witness.pegin_witness = core::ser_read_stack(s);
        }
        for (auto& out : vout) {
            out.witness.surjection_proof = core::ser_read_vector(s);
            out.witness.rangeproof = core::ser_read_vector(s);
        }
    }
    return Transaction(std::move(vin), std::move(vout), version, locktime);
}

} // namespace

Transaction::Transaction(std::vector<TxInput> vin, std::vector<TxOutput> vout,
                         int32_t version, uint32_t locktime)
    : version_(version), vin_(std::move(vin)), vout_(std::move(vout)),
      locktime_(locktime) {
    crypto::HashWriter hw;
    serialize_to(hw, false);
    txid_ = hw.hash();
}

bool Transaction::has_witness() const {
    return std::any_of(vin_.begin(), vin_.end(),
                       [](const TxInput& in) { return !in.witness.is_null(); }) ||
           std::any_of(vout_.begin(), vout_.end(),
                       [](const TxOutput& out) { return !out.witness.is_null(); });
}

uint64_t Transaction::fee(const core::uint256& policy_asset) const {
    uint64_t total = 0;
    for (const auto& out : vout_) {
        if (!out.script_pubkey.is_fee()) continue;
        auto asset = out.asset.explicit_asset();
        auto value = out.value.explicit_value();
        if (asset && value && *asset == policy_asset) total += *value;
    }
    return total;
}

std::vector<uint8_t> Transaction::serialize() const {
    core::DataStream s;
    serialize_to(s, true);
    return s.release();
}

std::string Transaction::to_hex() const {
    return core::to_hex(serialize());
}

core::Result<Transaction> Transaction::from_bytes(
    std::span<const uint8_t> bytes) {
    core::DataStream s(bytes);
    try {
        Transaction tx = read_transaction(s);
        if (!s.eof()) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                               "trailing bytes after transaction");
        }
        return tx;
    } catch (const std::exception& e) {
        return core::Error(core::ErrorCode::PARSE_ERROR,
                           std::string("malformed transaction: ") + e.what());
    }
}

core::Result<Transaction> Transaction::from_hex(std::string_view hex) {
    auto bytes = core::from_hex(hex);
    if (!bytes) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "transaction is not valid hex");
    }
    return from_bytes(*bytes);
}

} // namespace primitives
