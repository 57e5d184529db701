// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_ANCHORING_MESSAGES_H
#define ANCHORING_ANCHORING_MESSAGES_H

#include "anchoring/transactions.h"
#include "chain/hostkey.h"
#include "chain/message.h"
#include "uint256.h"

#include <boost/variant.hpp>

#include <cstdint>
#include <ios>
#include <string>
#include <vector>

namespace anchoring {

static const uint16_t ANCHORING_SERVICE_ID = 3;

enum AnchoringMessageType : uint16_t {
    MSG_ANCHORING_SIGNATURE = 0,
    MSG_ANCHORING_UPDATE_LATEST = 1,
};

//! Signature body: from [0,32) validator [32,36) tx [36,44) input [44,48) signature [48,56)
static const size_t SIGNATURE_BODY_LENGTH = 56;
//! UpdateLatest body: from [0,32) validator [32,36) tx [36,44) lect_count [44,52)
static const size_t UPDATE_LATEST_BODY_LENGTH = 52;

//! DER signature (at most 72 bytes) plus the hash type byte
static const size_t MAX_INPUT_SIGNATURE_SIZE = 73;

/** A validator's signature over one input of a proposed anchoring transaction. */
class CAnchoringSignature
{
private:
    chain::CRawMessage raw;
    chain::CHostPubKey from;
    uint32_t validator{0};
    CBitcoinTx tx;
    uint32_t input{0};
    std::vector<unsigned char> signature;

public:
    CAnchoringSignature() {}

    static CAnchoringSignature Create(const chain::CHostKey& key, uint32_t validator, const CBitcoinTx& tx,
                                      uint32_t input, const std::vector<unsigned char>& signature);

    /** Decode without checking the host signature. */
    static chain::MessageError Decode(const chain::CRawMessage& raw, CAnchoringSignature& msg);

    const chain::CRawMessage& Raw() const { return raw; }
    const chain::CHostPubKey& From() const { return from; }
    uint32_t Validator() const { return validator; }
    const CBitcoinTx& Tx() const { return tx; }
    uint32_t Input() const { return input; }
    const std::vector<unsigned char>& Signature() const { return signature; }
    uint256 GetHash() const { return raw.GetHash(); }

    template<typename Stream>
    void Serialize(Stream& s) const
    {
        ::Serialize(s, raw);
    }

    template<typename Stream>
    void Unserialize(Stream& s)
    {
        chain::CRawMessage stored;
        ::Unserialize(s, stored);
        if (Decode(stored, *this) != chain::MessageError::OK)
            throw std::ios_base::failure("CAnchoringSignature: stored message does not decode");
    }

    friend bool operator==(const CAnchoringSignature& a, const CAnchoringSignature& b) { return a.raw == b.raw; }
};

/** A validator's announcement of its new latest expected confirmed transaction. */
class CAnchoringUpdateLatest
{
private:
    chain::CRawMessage raw;
    chain::CHostPubKey from;
    uint32_t validator{0};
    CBitcoinTx tx;
    uint64_t lect_count{0};

public:
    CAnchoringUpdateLatest() {}

    static CAnchoringUpdateLatest Create(const chain::CHostKey& key, uint32_t validator, const CBitcoinTx& tx,
                                         uint64_t lectCount);

    static chain::MessageError Decode(const chain::CRawMessage& raw, CAnchoringUpdateLatest& msg);

    const chain::CRawMessage& Raw() const { return raw; }
    const chain::CHostPubKey& From() const { return from; }
    uint32_t Validator() const { return validator; }
    const CBitcoinTx& Tx() const { return tx; }
    uint64_t LectCount() const { return lect_count; }
    uint256 GetHash() const { return raw.GetHash(); }
};

/**
 * Any anchoring service message. Shared operations dispatch on the
 * contained alternative.
 */
class CAnchoringMessage
{
public:
    typedef boost::variant<CAnchoringSignature, CAnchoringUpdateLatest> Variant;

private:
    Variant msg;

public:
    CAnchoringMessage() {}
    CAnchoringMessage(CAnchoringSignature sig) : msg(std::move(sig)) {}
    CAnchoringMessage(CAnchoringUpdateLatest update) : msg(std::move(update)) {}

    /**
     * Decode a raw message of the anchoring service: header, service id,
     * message type, fixed body, segments and the carried transaction.
     * With fVerifySignature the host signature is checked against the
     * declared sender.
     */
    static chain::MessageError Decode(const chain::CRawMessage& raw, CAnchoringMessage& out, bool fVerifySignature = true);

    const Variant& Get() const { return msg; }
    const CAnchoringSignature* AsSignature() const { return boost::get<CAnchoringSignature>(&msg); }
    const CAnchoringUpdateLatest* AsUpdateLatest() const { return boost::get<CAnchoringUpdateLatest>(&msg); }

    uint16_t MessageType() const;
    const chain::CRawMessage& Raw() const;
    const chain::CHostPubKey& From() const;
    uint32_t Validator() const;
    const CBitcoinTx& Tx() const;
    uint256 GetHash() const { return Raw().GetHash(); }
    bool VerifySignature() const { return Raw().VerifySignature(From()); }

    std::string ToString() const;
};

} // namespace anchoring

#endif // ANCHORING_ANCHORING_MESSAGES_H
