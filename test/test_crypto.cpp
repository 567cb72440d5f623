// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/hex.h"
#include "core/types.h"
#include "crypto/bip32.h"
#include "crypto/confidential.h"
#include "crypto/hash.h"
#include "crypto/secp256k1.h"
#include "crypto/sha256.h"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::span<const uint8_t> text(std::string_view s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

std::string digest_hex(const core::uint256& d) { return core::to_hex(d.bytes()); }

std::array<uint8_t, 32> scalar(uint8_t low) {
    std::array<uint8_t, 32> s{};
    s[31] = low;
    return s;
}

const std::string GENERATOR_HEX =
    "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
const std::string DOUBLE_GENERATOR_HEX =
    "02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5";

crypto::PubKey generator() {
    crypto::PubKey g{};
    auto raw = core::from_hex(GENERATOR_HEX).value();
    std::copy(raw.begin(), raw.end(), g.begin());
    return g;
}

const char* MASTER_XPUB =
    "xpub661MyMwAqRbcFtXgS5sYJABqqG9YLmC4Q1Rdap9gSE8NqtwybGhePY2gZ29ESFjqJoCu1Rupje8YtGqsefD265TMg7usUDFdp6W1EGMcet8";
const char* HARDENED_CHILD_XPUB =
    "xpub68Gmy5EdvgibQVfPdqkBBCHxA5htiqg55crXYuXoQRKfDBFA1WEjWgP6LHhwBZeNK1VTsfTFUHCdrfp1bgwQ9xv5ski8PX9rL2dZXvgGDnw";
const char* GRANDCHILD_XPUB =
    "xpub6ASuArnXKPbfEwhqN6e3mwBcDTgzisQN1wXN9BJcM47sSikHjJf3UFHKkNAWbWMiGj7Wf5uMash7SyYq527Hqck2AxYysAA7xmALppuCkwQ";

const core::uint256 POLICY_ASSET = core::uint256::from_hex(
    "6f0279e9ed041c3d710a9f57d0c02928416460c4b722ae3457a11eec381c526d");

} // namespace

// ===================================================================
// Hashes
// ===================================================================

TEST_CASE(Sha256, KnownDigests) {
    CHECK_EQ(digest_hex(crypto::sha256(text("abc"))),
             std::string("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
    CHECK_EQ(digest_hex(crypto::sha256d(text("abc"))),
             std::string("4f8b42c22dd3729b519ba6f68d2da7cc5b2d606d05daed5ad5128cc03e6c6358"));
    CHECK_EQ(core::to_hex(crypto::hash160(text("abc")).bytes()),
             std::string("bb1be98c142444d7a56aa3981c3942a978e4dc33"));
}

TEST_CASE(Sha256, StreamingMatchesOneShot) {
    crypto::Sha256Hasher hasher;
    hasher.write(text("a")).write(text("bc"));
    core::uint256 streamed = hasher.finalize();
    CHECK(streamed == crypto::sha256(text("abc")));

    CHECK_THROWS(hasher.write(text("more")));
    hasher.reset();
    hasher.write("abc", 3);
    CHECK(hasher.finalize() == streamed);
}

TEST_CASE(Sha256, HashWriterIsDoubleSha) {
    crypto::HashWriter writer;
    writer.write(text("ab"));
    writer.write(text("c"));
    CHECK_EQ(writer.size(), size_t{3});
    CHECK(writer.hash() == crypto::sha256d(text("abc")));
}

TEST_CASE(Sha256, TaggedHash) {
    core::uint256 tag = crypto::sha256(text("CTWallet/test"));
    std::vector<uint8_t> buf(tag.bytes().begin(), tag.bytes().end());
    buf.insert(buf.end(), tag.bytes().begin(), tag.bytes().end());
    buf.push_back('x');
    CHECK(crypto::tagged_hash("CTWallet/test", text("x")) == crypto::sha256(buf));
}

TEST_CASE(Hmac, Sha256Vector) {
    auto mac = crypto::hmac_sha256(
        text("key"), text("The quick brown fox jumps over the lazy dog"));
    CHECK_EQ(core::to_hex(mac),
             std::string("f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8"));

    auto wide = crypto::hmac_sha512(text("key"), text("data"));
    CHECK_EQ(wide.size(), size_t{64});
    CHECK(wide != crypto::hmac_sha512(text("key2"), text("data")));
}

// ===================================================================
// secp256k1
// ===================================================================

TEST_CASE(Secp256k1, SecretOneIsGenerator) {
    auto key = crypto::ECKey::from_secret(scalar(1));
    CHECK_OK(key);
    CHECK_EQ(core::to_hex(key.value().pubkey_compressed()), GENERATOR_HEX);
}

TEST_CASE(Secp256k1, RejectsOutOfRangeSecrets) {
    CHECK_ERR(crypto::ECKey::from_secret(scalar(0)));
    CHECK(!crypto::is_valid_secret(scalar(0)));

    // The group order itself.
    auto order = core::from_hex(
        "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141").value();
    std::array<uint8_t, 32> n{};
    std::copy(order.begin(), order.end(), n.begin());
    CHECK(!crypto::is_valid_secret(n));
    n[31] = 0x40;
    CHECK(crypto::is_valid_secret(n));
}

TEST_CASE(Secp256k1, PointArithmetic) {
    auto g = generator();
    auto doubled = crypto::point_mul_add(g, scalar(1), scalar(1));
    CHECK_OK(doubled);
    CHECK_EQ(core::to_hex(doubled.value()), DOUBLE_GENERATOR_HEX);

    auto tweaked = crypto::pubkey_tweak_add(g, scalar(1));
    CHECK_OK(tweaked);
    CHECK(tweaked.value() == doubled.value());

    std::array<uint8_t, 32> x{};
    std::copy(g.begin() + 1, g.end(), x.begin());
    auto lifted = crypto::lift_x(x);
    CHECK_OK(lifted);
    CHECK(lifted.value() == g);
}

TEST_CASE(Secp256k1, PubkeyValidation) {
    CHECK(crypto::is_valid_pubkey(generator()));
    auto bad = generator();
    bad[0] = 0x05;
    CHECK(!crypto::is_valid_pubkey(bad));
    CHECK(!crypto::is_valid_pubkey(std::vector<uint8_t>(32, 0x02)));
}

TEST_CASE(Secp256k1, EcdhIsSymmetric) {
    auto alice = crypto::ECKey::generate();
    auto bob = crypto::ECKey::generate();
    CHECK(alice.is_valid());
    CHECK(bob.is_valid());

    auto ab = alice.ecdh(bob.pubkey_compressed());
    auto ba = bob.ecdh(alice.pubkey_compressed());
    CHECK_OK(ab);
    CHECK_OK(ba);
    CHECK(ab.value() == ba.value());

    std::vector<uint8_t> junk(33, 0x07);
    CHECK_ERR(alice.ecdh(junk));
}

// ===================================================================
// BIP32
// ===================================================================

TEST_CASE(Bip32, ParseMaster) {
    auto master = crypto::ExtendedPubKey::from_base58(MASTER_XPUB);
    CHECK_OK(master);
    const auto& key = master.value();
    CHECK_EQ(key.depth(), uint8_t{0});
    CHECK(!key.is_testnet());
    CHECK_EQ(core::to_hex(key.pubkey()),
             std::string("0339a36013301597daef41fbe593a02cc513d0b55527ec2df1050e2e8ff49c85c2"));
    CHECK_EQ(key.fingerprint(), uint32_t{0x3442193e});
    CHECK_EQ(key.to_base58(), std::string(MASTER_XPUB));
}

TEST_CASE(Bip32, PublicChildDerivation) {
    auto parent = crypto::ExtendedPubKey::from_base58(HARDENED_CHILD_XPUB);
    CHECK_OK(parent);
    CHECK_EQ(parent.value().fingerprint(), uint32_t{0x5c1bd648});

    auto child = parent.value().derive(1);
    CHECK_OK(child);
    CHECK_EQ(child.value().depth(), uint8_t{2});
    CHECK_EQ(child.value().to_base58(), std::string(GRANDCHILD_XPUB));

    auto via_path = parent.value().derive_path("/1");
    CHECK_OK(via_path);
    CHECK_EQ(via_path.value().to_base58(), std::string(GRANDCHILD_XPUB));

    auto two_steps = parent.value().derive_path("/1/7");
    CHECK_OK(two_steps);
    CHECK(two_steps.value().pubkey() == child.value().derive(7).value().pubkey());
}

TEST_CASE(Bip32, RejectsHardenedAndMalformed) {
    auto parent = crypto::ExtendedPubKey::from_base58(HARDENED_CHILD_XPUB).value();
    CHECK_ERR_CODE(parent.derive(crypto::ExtendedPubKey::HARDENED_BIT),
                   core::ErrorCode::VALIDATION_RANGE);
    CHECK_ERR_CODE(parent.derive_path("/0'"), core::ErrorCode::PARSE_BAD_FORMAT);
    CHECK_ERR_CODE(parent.derive_path("0/1"), core::ErrorCode::PARSE_BAD_FORMAT);

    std::string corrupt = MASTER_XPUB;
    corrupt.back() = corrupt.back() == '8' ? '9' : '8';
    CHECK_ERR_CODE(crypto::ExtendedPubKey::from_base58(corrupt),
                   core::ErrorCode::PARSE_BAD_CHECKSUM);
    CHECK_ERR(crypto::ExtendedPubKey::from_base58("xpub-not-base58"));
}

// ===================================================================
// Confidential outputs
// ===================================================================

namespace {

// OP_0 <20 bytes>: the range proof commits to it.
const std::vector<uint8_t> SPK = core::from_hex(
    "0014751e76e8199196d454941c45d1b3a323f1433bd6").value();

core::uint256 blinder(uint8_t low) {
    std::array<uint8_t, 32> b{};
    b[31] = low;
    return core::uint256::from_bytes(b);
}

} // namespace

TEST_CASE(Confidential, RewindNonceIsDoubleSha256OfSharedPoint) {
    // secret 1 times G is G itself.
    auto one = crypto::ECKey::from_secret(scalar(1)).value();
    auto nonce = crypto::rewind_nonce(one, generator());
    CHECK_OK(nonce);
    CHECK_EQ(digest_hex(nonce.value()),
             std::string("b1cd0a4eb6d1cea5eb288fb4474ac403eab044004cc48f12bcb4ca8346d487e1"));

    std::array<uint8_t, 33> not_a_point{};
    CHECK_ERR(crypto::rewind_nonce(one, not_a_point));
}

TEST_CASE(Confidential, CommitmentEncodings) {
    auto plain = crypto::asset_generator(POLICY_ASSET);
    CHECK_OK(plain);
    uint8_t pp = plain.value()[0];
    CHECK(pp == crypto::ASSET_COMMITMENT_PREFIX_EVEN ||
          pp == crypto::ASSET_COMMITMENT_PREFIX_ODD);
    CHECK(crypto::asset_generator(POLICY_ASSET).value() == plain.value());

    auto gen = crypto::asset_commitment(POLICY_ASSET, blinder(5));
    CHECK_OK(gen);
    uint8_t gp = gen.value()[0];
    CHECK(gp == crypto::ASSET_COMMITMENT_PREFIX_EVEN ||
          gp == crypto::ASSET_COMMITMENT_PREFIX_ODD);
    CHECK(gen.value() != plain.value());

    auto vc = crypto::value_commitment(5000, gen.value(), blinder(9));
    CHECK_OK(vc);
    uint8_t vp = vc.value()[0];
    CHECK(vp == crypto::VALUE_COMMITMENT_PREFIX_EVEN ||
          vp == crypto::VALUE_COMMITMENT_PREFIX_ODD);

    // Deterministic in the opening, sensitive to the value.
    CHECK(crypto::value_commitment(5000, gen.value(), blinder(9)).value() == vc.value());
    CHECK(crypto::value_commitment(5001, gen.value(), blinder(9)).value() != vc.value());

    // A value commitment is not a generator.
    CHECK_ERR_CODE(crypto::value_commitment(1, vc.value(), blinder(9)),
                   core::ErrorCode::PARSE_BAD_FORMAT);
}

TEST_CASE(Confidential, BlindThenUnblind) {
    auto receiver = crypto::ECKey::generate();
    auto blinded = crypto::blind_output(POLICY_ASSET, 123456,
                                        receiver.pubkey_compressed(), SPK);
    CHECK_OK(blinded);
    const auto& out = blinded.value();

    auto secrets = crypto::unblind_output(receiver, out.asset_commitment,
                                          out.value_commitment,
                                          out.nonce_commitment, out.rangeproof,
                                          SPK);
    CHECK_OK(secrets);
    CHECK(secrets.value() == out.secrets);
    CHECK_EQ(secrets.value().value, uint64_t{123456});
    CHECK(secrets.value().asset == POLICY_ASSET);

    // The published commitments are reproducible from the opening.
    auto gen = crypto::asset_commitment(POLICY_ASSET, secrets.value().asset_bf).value();
    CHECK(gen == out.asset_commitment);
    CHECK(crypto::value_commitment(123456, gen, secrets.value().value_bf).value() ==
          out.value_commitment);
}

TEST_CASE(Confidential, FailuresAreNotOurs) {
    auto receiver = crypto::ECKey::generate();
    auto stranger = crypto::ECKey::generate();
    auto out = crypto::blind_output(POLICY_ASSET, 1000,
                                    receiver.pubkey_compressed(), SPK).value();

    CHECK_ERR_CODE(crypto::unblind_output(stranger, out.asset_commitment,
                                          out.value_commitment,
                                          out.nonce_commitment, out.rangeproof, SPK),
                   core::ErrorCode::WALLET_NOT_OURS);

    auto proof = out.rangeproof;
    proof.back() ^= 0x01;
    CHECK_ERR_CODE(crypto::unblind_output(receiver, out.asset_commitment,
                                          out.value_commitment,
                                          out.nonce_commitment, proof, SPK),
                   core::ErrorCode::WALLET_NOT_OURS);

    // The proof is bound to the script it was made for.
    auto other_spk = SPK;
    other_spk.back() ^= 0x01;
    CHECK_ERR_CODE(crypto::unblind_output(receiver, out.asset_commitment,
                                          out.value_commitment,
                                          out.nonce_commitment, out.rangeproof,
                                          other_spk),
                   core::ErrorCode::WALLET_NOT_OURS);

    // A value commitment from another output does not match the proof.
    auto other = crypto::blind_output(POLICY_ASSET, 1000,
                                      receiver.pubkey_compressed(), SPK).value();
    CHECK_ERR_CODE(crypto::unblind_output(receiver, out.asset_commitment,
                                          other.value_commitment,
                                          out.nonce_commitment, out.rangeproof, SPK),
                   core::ErrorCode::WALLET_NOT_OURS);

    CHECK_ERR_CODE(crypto::unblind_output(receiver, out.asset_commitment,
                                          out.value_commitment,
                                          out.nonce_commitment, {}, SPK),
                   core::ErrorCode::WALLET_NOT_OURS);
}

TEST_CASE(Confidential, BlindRejectsBadInputs) {
    std::array<uint8_t, 33> bad_key{};
    CHECK_ERR_CODE(crypto::blind_output(POLICY_ASSET, 1, bad_key, SPK),
                   core::ErrorCode::CRYPTO_KEY_FAIL);
    auto receiver = crypto::ECKey::generate();
    CHECK_ERR_CODE(crypto::blind_output(POLICY_ASSET, crypto::MAX_MONEY + 1,
                                        receiver.pubkey_compressed(), SPK),
                   core::ErrorCode::VALIDATION_RANGE);
}
