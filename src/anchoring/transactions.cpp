// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "anchoring/transactions.h"

#include "crypto/common.h"
#include "logging.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"

namespace anchoring {

bool CBitcoinTx::FromRaw(const std::vector<unsigned char>& raw, CBitcoinTx& txOut)
{
    try {
        txOut = CBitcoinTx(btc::DeserializeTx(raw));
    } catch (const std::ios_base::failure&) {
        return false;
    }
    return true;
}

bool CBitcoinTx::FromHex(const std::string& hex, CBitcoinTx& txOut)
{
    if (!IsHex(hex)) return false;
    return FromRaw(ParseHex(hex), txOut);
}

std::vector<unsigned char> AnchoringPayload::Encode() const
{
    std::vector<unsigned char> data(ANCHORING_PAYLOAD_SIZE);
    WriteBE64(data.data(), block_height);
    std::copy(block_hash.begin(), block_hash.end(), data.begin() + 8);
    return data;
}

bool AnchoringPayload::Decode(const std::vector<unsigned char>& data, AnchoringPayload& payload)
{
    if (data.size() != ANCHORING_PAYLOAD_SIZE) return false;
    payload.block_height = ReadBE64(data.data());
    std::copy(data.begin() + 8, data.end(), payload.block_hash.begin());
    return true;
}

const char* TxKindToString(TxKind kind)
{
    switch (kind) {
    case TxKind::ANCHORING: return "anchoring";
    case TxKind::FUNDING: return "funding";
    case TxKind::OTHER: return "other";
    }
    return "unknown";
}

bool IsAnchoringShape(const CBitcoinTx& tx, AnchoringPayload* payload)
{
    if (tx->vin.empty() || tx->vout.size() != 2) return false;
    if (!tx->vout[0].scriptPubKey.IsPayToScriptHash()) return false;

    std::vector<unsigned char> data;
    if (!btc::ParseNullData(tx->vout[1].scriptPubKey, data)) return false;
    AnchoringPayload decoded;
    if (!AnchoringPayload::Decode(data, decoded)) return false;
    if (payload) *payload = decoded;
    return true;
}

TxKind ClassifyTransaction(const CBitcoinTx& tx, const btc::CScript& redeemScript)
{
    const btc::CScript scriptPubKey = btc::GetScriptForP2SH(btc::ScriptHash(redeemScript));
    if (IsAnchoringShape(tx) && tx->vout[0].scriptPubKey == scriptPubKey) {
        return TxKind::ANCHORING;
    }
    if (FindOutput(tx, scriptPubKey)) {
        return TxKind::FUNDING;
    }
    return TxKind::OTHER;
}

Optional<AnchoringPayload> GetPayload(const CBitcoinTx& tx)
{
    AnchoringPayload payload;
    if (!IsAnchoringShape(tx, &payload)) return nullopt;
    return payload;
}

Optional<uint32_t> FindOutput(const CBitcoinTx& tx, const btc::CScript& scriptPubKey)
{
    for (uint32_t i = 0; i < tx->vout.size(); i++) {
        if (tx->vout[i].scriptPubKey == scriptPubKey) return i;
    }
    return nullopt;
}

CAnchoringTxBuilder& CAnchoringTxBuilder::AddInput(const btc::COutPoint& prevout, CAmount value)
{
    inputs.emplace_back(prevout, value);
    return *this;
}

CAnchoringTxBuilder& CAnchoringTxBuilder::SetPayload(uint64_t height, const uint256& hash)
{
    payload = AnchoringPayload(height, hash);
    return *this;
}

CAnchoringTxBuilder& CAnchoringTxBuilder::SetFee(CAmount feeIn)
{
    fee = feeIn;
    return *this;
}

CAmount CAnchoringTxBuilder::InputSum() const
{
    CAmount sum = 0;
    for (const auto& input : inputs) {
        sum += input.second;
    }
    return sum;
}

bool CAnchoringTxBuilder::Build(CBitcoinTx& tx, std::string& strError) const
{
    if (inputs.empty()) {
        strError = "no inputs";
        return false;
    }
    if (!payload) {
        strError = "no payload";
        return false;
    }
    for (const auto& input : inputs) {
        if (!MoneyRange(input.second)) {
            strError = strprintf("input %s has an out-of-range value", input.first.ToString());
            return false;
        }
    }
    CAmount sum = InputSum();
    if (!MoneyRange(sum) || !MoneyRange(fee) || sum <= fee) {
        strError = strprintf("insufficient funds: inputs %s, fee %s", FormatMoney(sum), FormatMoney(fee));
        return false;
    }

    btc::CMutableTransaction mtx;
    mtx.nVersion = 2;
    mtx.nLockTime = 0;
    for (const auto& input : inputs) {
        mtx.vin.emplace_back(input.first);
    }
    mtx.vout.emplace_back(sum - fee, destination);
    mtx.vout.emplace_back(0, btc::GetScriptForNullData(payload->Encode()));
    tx = CBitcoinTx(mtx);
    return true;
}

} // namespace anchoring
