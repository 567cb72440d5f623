// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/confidential.h"

#include <cstring>
#include <memory>

#include <openssl/crypto.h>
#include <secp256k1.h>
#include <secp256k1_generator.h>
#include <secp256k1_rangeproof.h>

#include "crypto/sha256.h"

namespace crypto {

namespace {

// Largest range proof secp256k1_rangeproof_sign can emit.
constexpr size_t MAX_RANGEPROOF_SIZE = 5134;

// Elements defaults for -ct_exponent / -ct_bits.
constexpr int CT_EXPONENT = 0;
constexpr int CT_BITS = 52;

constexpr uint8_t OP_RETURN = 0x6a;

struct ContextDeleter {
    void operator()(secp256k1_context* ctx) const {
        secp256k1_context_destroy(ctx);
    }
};

const secp256k1_context* blind_context() {
    static const std::unique_ptr<secp256k1_context, ContextDeleter> ctx{
        secp256k1_context_create(SECP256K1_CONTEXT_SIGN |
                                 SECP256K1_CONTEXT_VERIFY)};
    return ctx.get();
}

core::Error not_ours(std::string msg) {
    return core::Error(core::ErrorCode::WALLET_NOT_OURS, std::move(msg));
}

core::Error zkp_error(std::string msg) {
    return core::Error(core::ErrorCode::CRYPTO_ERROR, std::move(msg));
}

Commitment serialize(const secp256k1_generator& gen) {
    Commitment out{};
    secp256k1_generator_serialize(blind_context(), out.data(), &gen);
    return out;
}

Commitment serialize(const secp256k1_pedersen_commitment& commit) {
    Commitment out{};
    secp256k1_pedersen_commitment_serialize(blind_context(), out.data(),
                                            &commit);
    return out;
}

// Fresh 32-byte blinder that is a valid non-zero scalar.
core::uint256 random_blinder() {
    ECKey k = ECKey::generate();
    return core::uint256::from_bytes(k.secret());
}

const unsigned char* data_or_null(std::span<const uint8_t> s) {
    return s.empty() ? nullptr : s.data();
}

}  // namespace

// ---------------------------------------------------------------------------
// Generators and commitments
// ---------------------------------------------------------------------------

core::Result<Commitment> asset_generator(const core::uint256& asset) {
    secp256k1_generator gen;
    if (secp256k1_generator_generate(blind_context(), &gen, asset.data()) != 1) {
        return zkp_error("asset id does not map to a generator");
    }
    return serialize(gen);
}

core::Result<Commitment> asset_commitment(const core::uint256& asset,
                                          const core::uint256& abf) {
    secp256k1_generator gen;
    if (secp256k1_generator_generate_blinded(blind_context(), &gen,
                                             asset.data(), abf.data()) != 1) {
        return zkp_error("asset blinding factor is out of range");
    }
    return serialize(gen);
}

core::Result<Commitment> value_commitment(uint64_t value,
                                          const Commitment& generator,
                                          const core::uint256& vbf) {
    secp256k1_generator gen;
    if (secp256k1_generator_parse(blind_context(), &gen, generator.data()) != 1) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "invalid asset commitment");
    }
    secp256k1_pedersen_commitment commit;
    if (secp256k1_pedersen_commit(blind_context(), &commit, vbf.data(), value,
                                  &gen) != 1) {
        return zkp_error("value blinding factor is out of range");
    }
    return serialize(commit);
}

core::Result<core::uint256> rewind_nonce(
    const ECKey& blinding_key, std::span<const uint8_t> nonce_commitment) {
    auto shared = blinding_key.ecdh(nonce_commitment);
    if (!shared) return shared.error();
    core::uint256 nonce = sha256(shared.value().data(), shared.value().size());
    OPENSSL_cleanse(shared.value().data(), shared.value().size());
    return nonce;
}

// ---------------------------------------------------------------------------
// Sender side
// ---------------------------------------------------------------------------

core::Result<BlindedOutput> blind_output(
    const core::uint256& asset, uint64_t value,
    std::span<const uint8_t> receiver_blinding_pubkey,
    std::span<const uint8_t> script_pubkey) {
    if (!is_valid_pubkey(receiver_blinding_pubkey)) {
        return core::Error(core::ErrorCode::CRYPTO_KEY_FAIL,
                           "invalid receiver blinding pubkey");
    }
    if (value > MAX_MONEY) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "amount out of range");
    }

    const secp256k1_context* ctx = blind_context();
    BlindedOutput out;
    out.secrets.asset = asset;
    out.secrets.value = value;
    out.secrets.asset_bf = random_blinder();
    out.secrets.value_bf = random_blinder();

    secp256k1_generator gen;
    if (secp256k1_generator_generate_blinded(ctx, &gen, asset.data(),
                                             out.secrets.asset_bf.data()) != 1) {
        return zkp_error("cannot blind asset generator");
    }
    out.asset_commitment = serialize(gen);

    secp256k1_pedersen_commitment commit;
    if (secp256k1_pedersen_commit(ctx, &commit, out.secrets.value_bf.data(),
                                  value, &gen) != 1) {
        return zkp_error("cannot commit to value");
    }
    out.value_commitment = serialize(commit);

    ECKey ephemeral = ECKey::generate();
    out.nonce_commitment = ephemeral.pubkey_compressed();

    // The sender's view of the shared point equals the receiver's.
    CTW_TRY_ASSIGN(nonce, rewind_nonce(ephemeral, receiver_blinding_pubkey));

    unsigned char message[SIDECHANNEL_MSG_SIZE];
    std::memcpy(message, asset.data(), 32);
    std::memcpy(message + 32, out.secrets.asset_bf.data(), 32);

    // An unspendable output may carry a zero amount.
    bool unspendable = script_pubkey.empty() || script_pubkey[0] == OP_RETURN;
    uint64_t min_value = unspendable ? 0 : 1;

    out.rangeproof.resize(MAX_RANGEPROOF_SIZE);
    size_t proof_len = out.rangeproof.size();
    int ok = secp256k1_rangeproof_sign(
        ctx, out.rangeproof.data(), &proof_len, min_value, &commit,
        out.secrets.value_bf.data(), nonce.data(), CT_EXPONENT, CT_BITS,
        value, message, sizeof(message), data_or_null(script_pubkey),
        script_pubkey.size(), &gen);
    OPENSSL_cleanse(message, sizeof(message));
    if (ok != 1) return zkp_error("range proof signing failed");
    out.rangeproof.resize(proof_len);
    return out;
}

// ---------------------------------------------------------------------------
// Receiver side
// ---------------------------------------------------------------------------

core::Result<TxOutSecrets> unblind_output(
    const ECKey& blinding_key,
    const Commitment& asset_generator_bytes,
    const Commitment& value_commitment_bytes,
    std::span<const uint8_t> nonce_commitment,
    std::span<const uint8_t> rangeproof,
    std::span<const uint8_t> script_pubkey) {
    if (rangeproof.empty()) return not_ours("output carries no range proof");

    auto nonce = rewind_nonce(blinding_key, nonce_commitment);
    if (!nonce) return not_ours("nonce commitment is not a valid point");

    const secp256k1_context* ctx = blind_context();
    secp256k1_generator observed_gen;
    if (secp256k1_generator_parse(ctx, &observed_gen,
                                  asset_generator_bytes.data()) != 1) {
        return not_ours("invalid asset commitment");
    }
    secp256k1_pedersen_commitment value_commit;
    if (secp256k1_pedersen_commitment_parse(
            ctx, &value_commit, value_commitment_bytes.data()) != 1) {
        return not_ours("invalid value commitment");
    }

    TxOutSecrets secrets;
    unsigned char message[SIDECHANNEL_MSG_SIZE] = {0};
    size_t message_len = sizeof(message);
    uint64_t min_value = 0;
    uint64_t max_value = 0;
    if (secp256k1_rangeproof_rewind(
            ctx, secrets.value_bf.data(), &secrets.value, message,
            &message_len, nonce.value().data(), &min_value, &max_value,
            &value_commit, rangeproof.data(), rangeproof.size(),
            data_or_null(script_pubkey), script_pubkey.size(),
            &observed_gen) != 1) {
        return not_ours("range proof does not rewind");
    }
    if (secrets.value > MAX_MONEY) {
        return not_ours("rewound amount out of range");
    }
    if (message_len != SIDECHANNEL_MSG_SIZE) {
        OPENSSL_cleanse(message, sizeof(message));
        return not_ours("range proof message has unexpected length");
    }

    std::memcpy(secrets.asset.data(), message, 32);
    std::memcpy(secrets.asset_bf.data(), message + 32, 32);
    OPENSSL_cleanse(message, sizeof(message));

    // The side channel must reproduce the published generator.
    auto derived = asset_commitment(secrets.asset, secrets.asset_bf);
    if (!derived || derived.value() != asset_generator_bytes) {
        return not_ours("asset commitment does not open");
    }
    return secrets;
}

}  // namespace crypto
