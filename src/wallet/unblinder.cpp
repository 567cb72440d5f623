// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/unblinder.h"

#include "core/logging.h"

namespace wallet {

namespace {

core::Error not_ours(std::string msg) {
    return core::Error(core::ErrorCode::WALLET_NOT_OURS, std::move(msg));
}

} // anonymous namespace

core::Result<crypto::TxOutSecrets> unblind(
    const primitives::TxOutput& output, const crypto::ECKey& blinding_key) {
    if (output.is_explicit()) {
        crypto::TxOutSecrets secrets;
        secrets.asset = *output.asset.explicit_asset();
        secrets.value = *output.value.explicit_value();
        return secrets;
    }

    // A blinded asset needs a blinded value; the reverse is allowed.
    if (!output.value.is_commitment()) {
        return not_ours("output mixes explicit and blinded fields");
    }
    if (!output.nonce.is_commitment() || output.witness.rangeproof.empty()) {
        return not_ours("output carries no nonce or proof");
    }

    crypto::Commitment generator{};
    if (output.asset.is_commitment()) {
        generator = output.asset.commitment();
    } else if (auto asset = output.asset.explicit_asset()) {
        auto gen = crypto::asset_generator(*asset);
        if (!gen) return not_ours("explicit asset has no generator");
        generator = gen.value();
    } else {
        return not_ours("output has no asset");
    }

    auto nonce = output.nonce.commitment();
    return crypto::unblind_output(blinding_key,
                                  generator,
                                  output.value.commitment(),
                                  nonce,
                                  output.witness.rangeproof,
                                  output.script_pubkey.data());
}

core::Result<std::vector<std::pair<primitives::OutPoint, crypto::TxOutSecrets>>>
Unblinder::unblind_transaction(
    const primitives::Transaction& tx,
    const std::map<primitives::script::Script, uint32_t>& owned) const {
    std::vector<std::pair<primitives::OutPoint, crypto::TxOutSecrets>> found;
    const auto& outputs = tx.vout();

    for (uint32_t vout = 0; vout < outputs.size(); ++vout) {
        const auto& output = outputs[vout];
        if (owned.find(output.script_pubkey) == owned.end()) continue;

        CTW_TRY_ASSIGN(key, descriptor_.blinding_key(output.script_pubkey));
        auto secrets = unblind(output, key);
        if (!secrets) {
            if (secrets.error().code() != core::ErrorCode::WALLET_NOT_OURS) {
                return secrets.error();
            }
            ++not_ours_;
            LOG_TRACE(core::LogCategory::WALLET,
                      "output " + std::to_string(vout) + " of " +
                      tx.txid().to_hex() + " does not open");
            continue;
        }
        found.emplace_back(primitives::OutPoint(tx.txid(), vout),
                           std::move(secrets).value());
    }
    return found;
}

} // namespace wallet
