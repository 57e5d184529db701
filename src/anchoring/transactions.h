// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_ANCHORING_TRANSACTIONS_H
#define ANCHORING_ANCHORING_TRANSACTIONS_H

#include "amount.h"
#include "btc/script.h"
#include "btc/transaction.h"
#include "optional.h"
#include "serialize.h"
#include "uint256.h"

#include <cstdint>
#include <ios>
#include <string>
#include <utility>
#include <vector>

namespace anchoring {

/**
 * Immutable raw Bitcoin transaction as stored on the host chain.
 *
 * Serializes as its raw Bitcoin bytes (length-prefixed), so a stored
 * transaction always decodes back to the same txid.
 */
class CBitcoinTx
{
private:
    btc::CTransactionRef tx;

public:
    CBitcoinTx() : tx(btc::MakeTransactionRef()) {}
    explicit CBitcoinTx(btc::CTransactionRef txIn) : tx(std::move(txIn)) {}
    explicit CBitcoinTx(const btc::CMutableTransaction& mtx) : tx(btc::MakeTransactionRef(mtx)) {}

    const btc::CTransaction& Get() const { return *tx; }
    const btc::CTransaction* operator->() const { return tx.get(); }

    uint256 GetId() const { return tx->GetHash(); }
    bool IsNull() const { return tx->IsNull(); }

    std::vector<unsigned char> Raw() const { return btc::SerializeTx(*tx); }
    std::string ToHex() const { return btc::EncodeHexTx(*tx); }

    static bool FromHex(const std::string& hex, CBitcoinTx& txOut);
    static bool FromRaw(const std::vector<unsigned char>& raw, CBitcoinTx& txOut);

    template<typename Stream>
    void Serialize(Stream& s) const
    {
        ::Serialize(s, Raw());
    }

    template<typename Stream>
    void Unserialize(Stream& s)
    {
        std::vector<unsigned char> raw;
        ::Unserialize(s, raw);
        tx = btc::DeserializeTx(raw);
    }

    friend bool operator==(const CBitcoinTx& a, const CBitcoinTx& b) { return a.GetId() == b.GetId(); }
    friend bool operator!=(const CBitcoinTx& a, const CBitcoinTx& b) { return !(a == b); }
};

static const size_t ANCHORING_PAYLOAD_SIZE = 40;

/** Commitment carried by the OP_RETURN output: BE64 host height followed by the host block hash. */
struct AnchoringPayload {
    uint64_t block_height{0};
    uint256 block_hash;

    AnchoringPayload() {}
    AnchoringPayload(uint64_t heightIn, const uint256& hashIn) : block_height(heightIn), block_hash(hashIn) {}

    std::vector<unsigned char> Encode() const;
    static bool Decode(const std::vector<unsigned char>& data, AnchoringPayload& payload);

    friend bool operator==(const AnchoringPayload& a, const AnchoringPayload& b)
    {
        return a.block_height == b.block_height && a.block_hash == b.block_hash;
    }
    friend bool operator!=(const AnchoringPayload& a, const AnchoringPayload& b) { return !(a == b); }
};

enum class TxKind {
    ANCHORING,
    FUNDING,
    OTHER,
};

const char* TxKindToString(TxKind kind);

/**
 * Anchoring shape without reference to an address: at least one input,
 * exactly two outputs, a P2SH first output and a well-formed payload in
 * the second.
 */
bool IsAnchoringShape(const CBitcoinTx& tx, AnchoringPayload* payload = nullptr);

/**
 * Classify a transaction against the multisig address of redeemScript:
 * ANCHORING if it has the anchoring shape and its first output pays the
 * address, FUNDING if any output pays the address, OTHER otherwise.
 */
TxKind ClassifyTransaction(const CBitcoinTx& tx, const btc::CScript& redeemScript);

Optional<AnchoringPayload> GetPayload(const CBitcoinTx& tx);

/** Index of the first output paying scriptPubKey. */
Optional<uint32_t> FindOutput(const CBitcoinTx& tx, const btc::CScript& scriptPubKey);

/**
 * Builds the unsigned anchoring transaction: inputs in the order given,
 * output 0 pays the destination the input sum minus the fee, output 1
 * carries the payload.
 */
class CAnchoringTxBuilder
{
private:
    btc::CScript destination;
    std::vector<std::pair<btc::COutPoint, CAmount>> inputs;
    Optional<AnchoringPayload> payload;
    CAmount fee{0};

public:
    explicit CAnchoringTxBuilder(const btc::CScript& destinationScript) : destination(destinationScript) {}

    CAnchoringTxBuilder& AddInput(const btc::COutPoint& prevout, CAmount value);
    CAnchoringTxBuilder& SetPayload(uint64_t height, const uint256& hash);
    CAnchoringTxBuilder& SetFee(CAmount feeIn);

    CAmount InputSum() const;
    size_t InputCount() const { return inputs.size(); }

    bool Build(CBitcoinTx& tx, std::string& strError) const;
};

} // namespace anchoring

#endif // ANCHORING_ANCHORING_TRANSACTIONS_H
