// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "anchoring/multisig.h"
#include "anchoring/transactions.h"
#include "btc/address.h"
#include "btc/key.h"
#include "random.h"
#include "test/test_anchoring.h"

#include <boost/test/unit_test.hpp>

#include <algorithm>

using namespace anchoring;

static std::vector<btc::CKey> MakeKeys(size_t n)
{
    std::vector<btc::CKey> keys(n);
    for (btc::CKey& key : keys) {
        key.MakeNewKey();
    }
    return keys;
}

static std::vector<btc::CPubKey> PubKeys(const std::vector<btc::CKey>& keys)
{
    std::vector<btc::CPubKey> pubkeys;
    for (const btc::CKey& key : keys) {
        pubkeys.push_back(key.GetPubKey());
    }
    return pubkeys;
}

static CBitcoinTx BuildAnchoring(const CRedeemScript& redeem, uint64_t height, const uint256& hash, size_t nInputs = 1)
{
    CAnchoringTxBuilder builder(redeem.ScriptPubKey());
    for (size_t i = 0; i < nInputs; i++) {
        builder.AddInput(btc::COutPoint(GetRandHash(), 0), 10000);
    }
    builder.SetPayload(height, hash).SetFee(1000);
    CBitcoinTx tx;
    std::string strError;
    BOOST_REQUIRE_MESSAGE(builder.Build(tx, strError), strError);
    return tx;
}

BOOST_FIXTURE_TEST_SUITE(anchoring_tx_tests, BasicTestingSetup)

// =============================================================================
// Payload: BE64 height || block hash
// =============================================================================
BOOST_AUTO_TEST_CASE(payload_encoding)
{
    uint256 hash = GetRandHash();
    std::vector<unsigned char> data = AnchoringPayload(0x0102030405060708ULL, hash).Encode();
    BOOST_REQUIRE_EQUAL(data.size(), ANCHORING_PAYLOAD_SIZE);
    const unsigned char height[] = {1, 2, 3, 4, 5, 6, 7, 8};
    BOOST_CHECK(std::equal(data.begin(), data.begin() + 8, height));
    BOOST_CHECK(std::equal(data.begin() + 8, data.end(), hash.begin()));

    AnchoringPayload decoded;
    BOOST_CHECK(AnchoringPayload::Decode(data, decoded));
    BOOST_CHECK(decoded == AnchoringPayload(0x0102030405060708ULL, hash));

    data.pop_back();
    BOOST_CHECK(!AnchoringPayload::Decode(data, decoded));
    data.resize(41);
    BOOST_CHECK(!AnchoringPayload::Decode(data, decoded));
}

// =============================================================================
// Classification
// =============================================================================
BOOST_AUTO_TEST_CASE(classify_transactions)
{
    std::vector<btc::CKey> keys = MakeKeys(3);
    CRedeemScript redeem = CRedeemScript::FromPubKeys(2, PubKeys(keys));
    const uint256 hash = GetRandHash();

    CBitcoinTx anchoring = BuildAnchoring(redeem, 500, hash);
    BOOST_CHECK(ClassifyTransaction(anchoring, redeem.Script()) == TxKind::ANCHORING);
    Optional<AnchoringPayload> payload = GetPayload(anchoring);
    BOOST_REQUIRE(payload);
    BOOST_CHECK_EQUAL(payload->block_height, 500U);
    BOOST_CHECK(payload->block_hash == hash);
    BOOST_CHECK_EQUAL(anchoring->vout[0].nValue, 9000);

    // anchoring to another multisig address
    CRedeemScript other = CRedeemScript::FromPubKeys(2, PubKeys(MakeKeys(3)));
    BOOST_CHECK(ClassifyTransaction(anchoring, other.Script()) == TxKind::OTHER);
    BOOST_CHECK(IsAnchoringShape(anchoring));

    CBitcoinTx funding(CreateDepositTx(redeem.ScriptPubKey(), 50000));
    BOOST_CHECK(ClassifyTransaction(funding, redeem.Script()) == TxKind::FUNDING);
    BOOST_CHECK(!GetPayload(funding));

    // funding plus change still funds
    btc::CMutableTransaction mtx = CreateDepositTx(RandomScriptPubKey(), 1000);
    mtx.vout.emplace_back(2000, redeem.ScriptPubKey());
    CBitcoinTx change(mtx);
    BOOST_CHECK(ClassifyTransaction(change, redeem.Script()) == TxKind::FUNDING);
    BOOST_CHECK_EQUAL(*FindOutput(change, redeem.ScriptPubKey()), 1U);

    CBitcoinTx unrelated(CreateDepositTx(RandomScriptPubKey(), 1000));
    BOOST_CHECK(ClassifyTransaction(unrelated, redeem.Script()) == TxKind::OTHER);
}

BOOST_AUTO_TEST_CASE(anchoring_shape_rejects_near_misses)
{
    CRedeemScript redeem = CRedeemScript::FromPubKeys(1, PubKeys(MakeKeys(1)));
    CBitcoinTx good = BuildAnchoring(redeem, 7, GetRandHash());
    btc::CMutableTransaction base(good.Get());

    btc::CMutableTransaction shortPayload = base;
    std::vector<unsigned char> data = AnchoringPayload(7, uint256()).Encode();
    data.pop_back();
    shortPayload.vout[1].scriptPubKey = btc::GetScriptForNullData(data);
    BOOST_CHECK(!IsAnchoringShape(CBitcoinTx(shortPayload)));

    btc::CMutableTransaction threeOutputs = base;
    threeOutputs.vout.emplace_back(1, RandomScriptPubKey());
    BOOST_CHECK(!IsAnchoringShape(CBitcoinTx(threeOutputs)));

    btc::CMutableTransaction noInputs = base;
    noInputs.vin.clear();
    BOOST_CHECK(!IsAnchoringShape(CBitcoinTx(noInputs)));

    btc::CMutableTransaction swapped = base;
    std::swap(swapped.vout[0], swapped.vout[1]);
    BOOST_CHECK(!IsAnchoringShape(CBitcoinTx(swapped)));
}

BOOST_AUTO_TEST_CASE(builder_checks_funds)
{
    CRedeemScript redeem = CRedeemScript::FromPubKeys(1, PubKeys(MakeKeys(1)));
    CBitcoinTx tx;
    std::string strError;

    CAnchoringTxBuilder empty(redeem.ScriptPubKey());
    empty.SetPayload(1, uint256());
    BOOST_CHECK(!empty.Build(tx, strError));

    CAnchoringTxBuilder noPayload(redeem.ScriptPubKey());
    noPayload.AddInput(btc::COutPoint(GetRandHash(), 0), 5000);
    BOOST_CHECK(!noPayload.Build(tx, strError));

    CAnchoringTxBuilder poor(redeem.ScriptPubKey());
    poor.AddInput(btc::COutPoint(GetRandHash(), 0), 1000).SetPayload(1, uint256()).SetFee(1000);
    BOOST_CHECK(!poor.Build(tx, strError));
    BOOST_CHECK(strError.find("insufficient funds") != std::string::npos);

    CAnchoringTxBuilder two(redeem.ScriptPubKey());
    const btc::COutPoint first(GetRandHash(), 1), second(GetRandHash(), 0);
    two.AddInput(first, 3000).AddInput(second, 4000).SetPayload(9, uint256()).SetFee(500);
    BOOST_REQUIRE(two.Build(tx, strError));
    BOOST_CHECK_EQUAL(two.InputSum(), 7000);
    BOOST_REQUIRE_EQUAL(tx->vin.size(), 2U);
    BOOST_CHECK(tx->vin[0].prevout == first);
    BOOST_CHECK(tx->vin[1].prevout == second);
    BOOST_CHECK_EQUAL(tx->vout[0].nValue, 6500);
    BOOST_CHECK_EQUAL(tx->vout[1].nValue, 0);
}

// =============================================================================
// Multisig
// =============================================================================
BOOST_AUTO_TEST_CASE(redeem_script_is_order_independent)
{
    std::vector<btc::CKey> keys = MakeKeys(4);
    std::vector<btc::CPubKey> pubkeys = PubKeys(keys);
    CRedeemScript a = CRedeemScript::FromPubKeys(3, pubkeys);
    std::reverse(pubkeys.begin(), pubkeys.end());
    CRedeemScript b = CRedeemScript::FromPubKeys(3, pubkeys);
    BOOST_CHECK(a == b);
    BOOST_CHECK_EQUAL(a.Address(btc::Network::TESTNET), b.Address(btc::Network::TESTNET));
    BOOST_CHECK(a.Address(btc::Network::TESTNET) != a.Address(btc::Network::MAINNET));
    BOOST_CHECK(std::is_sorted(a.Keys().begin(), a.Keys().end()));

    CRedeemScript parsed;
    BOOST_REQUIRE(CRedeemScript::FromScript(a.Script(), parsed));
    BOOST_CHECK(parsed == a);
    BOOST_CHECK_EQUAL(parsed.Required(), 3);

    uint160 scriptHash;
    BOOST_REQUIRE(btc::DecodeScriptAddress(a.Address(btc::Network::TESTNET), btc::Network::TESTNET, scriptHash));
    BOOST_CHECK(btc::GetScriptForP2SH(scriptHash) == a.ScriptPubKey());

    BOOST_CHECK(a.KeyPosition(keys[0].GetPubKey()) >= 0);
    BOOST_CHECK_EQUAL(a.KeyPosition(MakeKeys(1)[0].GetPubKey()), -1);

    BOOST_CHECK_THROW(CRedeemScript::FromPubKeys(0, PubKeys(keys)), std::runtime_error);
    BOOST_CHECK_THROW(CRedeemScript::FromPubKeys(5, PubKeys(keys)), std::runtime_error);
    BOOST_CHECK_THROW(CRedeemScript::FromPubKeys(1, PubKeys(MakeKeys(17))), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(sign_and_finalize)
{
    std::vector<btc::CKey> keys = MakeKeys(4);
    CRedeemScript redeem = CRedeemScript::FromPubKeys(3, PubKeys(keys));
    CBitcoinTx tx = BuildAnchoring(redeem, 100, GetRandHash(), 2);

    InputSignatures collected;
    for (uint32_t input = 0; input < 2; input++) {
        for (size_t k = 0; k < keys.size(); k++) {
            std::vector<unsigned char> sig;
            BOOST_REQUIRE(SignInput(tx, input, redeem, keys[k], sig));
            BOOST_CHECK_EQUAL(sig.back(), 0x01);
            BOOST_CHECK(VerifyInput(tx, input, redeem, keys[k].GetPubKey(), sig));
            BOOST_CHECK(!VerifyInput(tx, 1 - input, redeem, keys[k].GetPubKey(), sig));
            // RFC6979: signing again gives the same bytes
            std::vector<unsigned char> again;
            BOOST_REQUIRE(SignInput(tx, input, redeem, keys[k], again));
            BOOST_CHECK(again == sig);
            if (k < 2) collected[input][redeem.KeyPosition(keys[k].GetPubKey())] = sig;
        }
    }

    CBitcoinTx finalized;
    BOOST_CHECK(!FinalizeTransaction(tx, redeem, collected, finalized));

    std::vector<unsigned char> sig;
    BOOST_REQUIRE(SignInput(tx, 0, redeem, keys[3], sig));
    collected[0][redeem.KeyPosition(keys[3].GetPubKey())] = sig;
    BOOST_CHECK(!FinalizeTransaction(tx, redeem, collected, finalized));

    BOOST_REQUIRE(SignInput(tx, 1, redeem, keys[3], sig));
    collected[1][redeem.KeyPosition(keys[3].GetPubKey())] = sig;
    BOOST_REQUIRE(FinalizeTransaction(tx, redeem, collected, finalized));

    // scriptSig changes the id, the outputs stay
    BOOST_CHECK(finalized.GetId() != tx.GetId());
    BOOST_CHECK(finalized->vout == tx->vout);
    for (const btc::CTxIn& in : finalized->vin) {
        BOOST_CHECK(!in.scriptSig.empty());
    }
}

BOOST_AUTO_TEST_SUITE_END()
