// Copyright (c) 2024-2026 The ctwallet Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"
#include "wallet_fixtures.h"

#include "wallet/address.h"
#include "wallet/descriptor.h"
#include "wallet/network.h"
#include "wallet/unblinder.h"

#include <array>
#include <map>
#include <set>
#include <string>

namespace {

const std::string GENERATOR_PUBKEY =
    "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";

crypto::ECKey key_from_byte(uint8_t b) {
    std::array<uint8_t, 32> secret{};
    secret.fill(b);
    return crypto::ECKey::from_secret(secret).value();
}

} // anonymous namespace

// ===========================================================================
// Descriptor :: checksum
// ===========================================================================

TEST_CASE(Descriptor, ChecksumKnownVector) {
    auto sum = wallet::descriptor_checksum("raw(deadbeef)");
    CHECK_OK(sum);
    CHECK_EQ(sum.value(), std::string("89f8spxm"));
    CHECK_EQ(wallet::add_checksum("raw(deadbeef)").value(),
             std::string("raw(deadbeef)#89f8spxm"));
}

TEST_CASE(Descriptor, ChecksumRejectsBadCharacter) {
    auto sum = wallet::descriptor_checksum("raw(dead\x01)");
    CHECK_ERR(sum);
    CHECK_EQ(sum.error().code(), core::ErrorCode::PARSE_BAD_FORMAT);
}

// ===========================================================================
// Descriptor :: parsing
// ===========================================================================

TEST_CASE(Descriptor, ParsesSlip77) {
    auto d = wallet::ConfidentialDescriptor::parse(fixtures::slip77_descriptor(),
                                                   wallet::Network::Liquid);
    CHECK_OK(d);
    CHECK(d.value().blinding_kind() == wallet::BlindingKind::Slip77);
    CHECK(d.value().has_derivable_blinding());
    CHECK(d.value().network() == wallet::Network::Liquid);

    // Canonical text carries a checksum and parses again to the same wallet.
    const auto& canonical = d.value().to_string();
    CHECK_EQ(canonical.substr(0, canonical.size() - 9),
             fixtures::slip77_descriptor());
    auto again = wallet::ConfidentialDescriptor::parse(canonical,
                                                       wallet::Network::Liquid);
    CHECK_OK(again);
    CHECK_EQ(again.value().wallet_id(), d.value().wallet_id());
}

TEST_CASE(Descriptor, ParsesViewKeyAndOrigin) {
    auto view = wallet::ConfidentialDescriptor::parse(
        fixtures::view_key_descriptor(), wallet::Network::Liquid);
    CHECK_OK(view);
    CHECK(view.value().blinding_kind() == wallet::BlindingKind::ViewKey);

    auto origin = wallet::ConfidentialDescriptor::parse(
        "ct(slip77(" + fixtures::SLIP77_KEY + "),elwpkh([3442193e/84h/1776h/0h]" +
            fixtures::XPUB + "/0/*))",
        wallet::Network::Liquid);
    CHECK_OK(origin);
}

TEST_CASE(Descriptor, WrongChecksumRejected) {
    auto d = wallet::ConfidentialDescriptor::parse(
        fixtures::slip77_descriptor() + "#aaaaaaaa", wallet::Network::Liquid);
    CHECK_ERR(d);
    CHECK_EQ(d.error().code(), core::ErrorCode::PARSE_BAD_CHECKSUM);
}

TEST_CASE(Descriptor, MalformedRejected) {
    const std::vector<std::string> bad = {
        "",
        "elwpkh(" + fixtures::XPUB + "/0/*)",
        "ct(slip77(" + fixtures::SLIP77_KEY + "))",
        "ct(slip77(abcd),elwpkh(" + fixtures::XPUB + "/0/*))",
        "ct(slip77(" + fixtures::SLIP77_KEY + "),wpkh(" + fixtures::XPUB + "/0/*))",
        "ct(slip77(" + fixtures::SLIP77_KEY + "),elwpkh(" + fixtures::XPUB + "/0))",
        "ct(slip77(" + fixtures::SLIP77_KEY + "),elwpkh(" + fixtures::XPUB + "/0h/*))",
        "ct(slip77(" + fixtures::SLIP77_KEY + "),elwpkh([abcd" + fixtures::XPUB + "/*))",
        "ct(zz,elwpkh(" + fixtures::XPUB + "/0/*))",
    };
    for (const auto& text : bad) {
        auto d = wallet::ConfidentialDescriptor::parse(text, wallet::Network::Liquid);
        CHECK_ERR(d);
    }
}

TEST_CASE(Descriptor, NetworkMismatch) {
    auto d = wallet::ConfidentialDescriptor::parse(
        fixtures::slip77_descriptor(), wallet::Network::LiquidTestnet);
    CHECK_ERR(d);
    CHECK_EQ(d.error().code(), core::ErrorCode::CRYPTO_NETWORK_MISMATCH);
}

TEST_CASE(Descriptor, BareBlindingKeyCannotDerive) {
    auto d = wallet::ConfidentialDescriptor::parse(
        "ct(" + GENERATOR_PUBKEY + ",elwpkh(" + fixtures::XPUB + "/0/*))",
        wallet::Network::Liquid);
    CHECK_OK(d);
    CHECK(!d.value().has_derivable_blinding());

    // Scripts still derive, blinding keys do not.
    CHECK_OK(d.value().script_pubkey(0));
    auto addr = d.value().derive(0);
    CHECK_ERR(addr);
    CHECK_EQ(addr.error().code(), core::ErrorCode::WALLET_UNSUPPORTED_BLINDING);
}

// ===========================================================================
// Descriptor :: derivation
// ===========================================================================

TEST_CASE(Descriptor, DerivationIsDeterministic) {
    auto d = fixtures::descriptor();
    std::set<primitives::script::Script> seen;
    for (uint32_t i = 0; i < 10; ++i) {
        auto a = d.derive(i);
        auto b = d.derive(i);
        CHECK_OK(a);
        CHECK_EQ(a.value().index, i);
        CHECK(a.value().script == b.value().script);
        CHECK(a.value().address == b.value().address);
        CHECK(a.value().script.is_p2wpkh());
        CHECK(a.value().address.is_confidential());
        CHECK(a.value().address.script_pubkey() == a.value().script);
        seen.insert(a.value().script);
    }
    CHECK_EQ(seen.size(), 10u);
}

TEST_CASE(Descriptor, HardenedIndexRejected) {
    auto d = fixtures::descriptor();
    auto s = d.script_pubkey(0x80000000u);
    CHECK_ERR(s);
    CHECK_EQ(s.error().code(), core::ErrorCode::VALIDATION_RANGE);
}

TEST_CASE(Descriptor, BlindingKeysDifferPerScriptForSlip77) {
    auto d = fixtures::descriptor();
    auto s0 = d.script_pubkey(0).value();
    auto s1 = d.script_pubkey(1).value();
    auto k0 = d.blinding_key(s0).value();
    auto k1 = d.blinding_key(s1).value();
    CHECK(k0.pubkey_compressed() != k1.pubkey_compressed());

    auto view = fixtures::descriptor(fixtures::view_key_descriptor());
    auto v0 = view.blinding_key(s0).value();
    auto v1 = view.blinding_key(s1).value();
    CHECK(v0.pubkey_compressed() == v1.pubkey_compressed());
}

TEST_CASE(Descriptor, WalletIdDependsOnBlindingKey) {
    auto a = fixtures::descriptor();
    auto b = fixtures::descriptor(fixtures::slip77_descriptor(fixtures::OTHER_SLIP77_KEY));
    CHECK_EQ(a.wallet_id().size(), 64u);
    CHECK_NE(a.wallet_id(), b.wallet_id());
}

// ===========================================================================
// Address
// ===========================================================================

TEST_CASE(Address, RoundTripConfidentialAndPlain) {
    auto d = fixtures::descriptor();
    auto derived = d.derive(3).value();
    auto text = derived.address.to_string();
    CHECK_EQ(text.substr(0, 3), std::string("lq1"));

    auto parsed = wallet::Address::parse(text, wallet::Network::Liquid);
    CHECK_OK(parsed);
    CHECK(parsed.value() == derived.address);

    auto plain = derived.address.to_unconfidential();
    CHECK(!plain.is_confidential());
    CHECK(plain.script_pubkey() == derived.script);
    CHECK_EQ(plain.to_string().substr(0, 3), std::string("ex1"));
    auto plain_parsed = wallet::Address::parse(plain.to_string(),
                                               wallet::Network::Liquid);
    CHECK_OK(plain_parsed);
    CHECK(plain_parsed.value() == plain);
}

TEST_CASE(Address, ForeignNetworkRejected) {
    auto text = fixtures::descriptor().derive(0).value().address.to_string();
    auto parsed = wallet::Address::parse(text, wallet::Network::LiquidTestnet);
    CHECK_ERR(parsed);
    CHECK_EQ(parsed.error().code(), core::ErrorCode::CRYPTO_NETWORK_MISMATCH);

    auto garbage = wallet::Address::parse("lq1notanaddress", wallet::Network::Liquid);
    CHECK_ERR(garbage);
    CHECK_EQ(garbage.error().code(), core::ErrorCode::PARSE_BAD_FORMAT);
}

TEST_CASE(Network, NamesAndPolicyAssets) {
    CHECK(wallet::parse_network("liquid").value() == wallet::Network::Liquid);
    CHECK(wallet::parse_network("testnet").value() == wallet::Network::LiquidTestnet);
    CHECK(wallet::parse_network("regtest").value() == wallet::Network::ElementsRegtest);
    CHECK_ERR(wallet::parse_network("bitcoin"));

    CHECK_EQ(wallet::policy_asset(wallet::Network::Liquid).to_hex(),
             std::string("6f0279e9ed041c3d710a9f57d0c02928416460c4b722ae3457a11eec381c526d"));
    CHECK_OK(wallet::check_network(wallet::Network::Liquid, wallet::Network::Liquid));
    auto mismatch = wallet::check_network(wallet::Network::Liquid,
                                          wallet::Network::ElementsRegtest);
    CHECK_ERR(mismatch);
    CHECK_EQ(mismatch.error().code(), core::ErrorCode::CRYPTO_NETWORK_MISMATCH);
}

// ===========================================================================
// Unblinder
// ===========================================================================

TEST_CASE(Unblinder, OpensOutputBlindedToUs) {
    auto d = fixtures::descriptor();
    auto derived = d.derive(0).value();
    auto out = fixtures::blinded_output(derived.address, fixtures::policy(), 12'345);

    auto key = d.blinding_key(derived.script).value();
    auto secrets = wallet::unblind(out, key);
    CHECK_OK(secrets);
    CHECK(secrets.value().asset == fixtures::policy());
    CHECK_EQ(secrets.value().value, uint64_t{12'345});
    CHECK(!secrets.value().asset_bf.is_zero());
}

TEST_CASE(Unblinder, ForeignKeyIsNotOurs) {
    auto d = fixtures::descriptor();
    auto derived = d.derive(0).value();
    auto out = fixtures::blinded_output(derived.address, fixtures::other_asset(), 7);

    auto secrets = wallet::unblind(out, key_from_byte(0x42));
    CHECK_ERR(secrets);
    CHECK_EQ(secrets.error().code(), core::ErrorCode::WALLET_NOT_OURS);
}

TEST_CASE(Unblinder, ProofIsBoundToItsScript) {
    auto d = fixtures::descriptor(fixtures::view_key_descriptor());
    auto first = d.derive(0).value();
    auto out = fixtures::blinded_output(first.address, fixtures::policy(), 4'000);

    // The view key opens every script, so only the committed script differs.
    out.script_pubkey = d.derive(1).value().script;
    auto key = d.blinding_key(out.script_pubkey).value();
    CHECK_ERR_CODE(wallet::unblind(out, key), core::ErrorCode::WALLET_NOT_OURS);
}

TEST_CASE(Unblinder, ExplicitOutputHasZeroFactors) {
    auto script = fixtures::descriptor().script_pubkey(0).value();
    auto out = fixtures::explicit_output(script, fixtures::other_asset(), 99);
    auto secrets = wallet::unblind(out, key_from_byte(0x42));
    CHECK_OK(secrets);
    CHECK(secrets.value().asset == fixtures::other_asset());
    CHECK_EQ(secrets.value().value, uint64_t{99});
    CHECK(secrets.value().asset_bf.is_zero());
    CHECK(secrets.value().value_bf.is_zero());
}

TEST_CASE(Unblinder, TransactionOnlyOwnedOutputs) {
    auto d = fixtures::descriptor(fixtures::view_key_descriptor());
    auto mine = d.derive(1).value();
    auto theirs = fixtures::descriptor(
        fixtures::slip77_descriptor(fixtures::OTHER_SLIP77_KEY)).derive(1).value();

    auto tx = fixtures::make_tx(
        {fixtures::funding_outpoint("unblinder")},
        {fixtures::blinded_output(theirs.address, fixtures::policy(), 500),
         fixtures::blinded_output(mine.address, fixtures::policy(), 700)});

    std::map<primitives::script::Script, uint32_t> owned{{mine.script, 1}};
    wallet::Unblinder unblinder(d);
    auto found = unblinder.unblind_transaction(tx, owned);
    CHECK_OK(found);
    CHECK_EQ(found.value().size(), 1u);
    CHECK(found.value()[0].first == primitives::OutPoint(tx.txid(), 1));
    CHECK_EQ(found.value()[0].second.value, uint64_t{700});
    CHECK_EQ(unblinder.not_ours_count(), 0u);
}
