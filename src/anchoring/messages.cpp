// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "anchoring/messages.h"

#include "logging.h"
#include "utilstrencodings.h"

#include <stdexcept>

namespace anchoring {

using chain::MessageError;

static MessageError CheckEnvelope(const chain::CRawMessage& raw, uint16_t type, size_t bodyLength)
{
    MessageError err = raw.CheckHeader(bodyLength);
    if (err != MessageError::OK) return err;
    if (raw.ServiceId() != ANCHORING_SERVICE_ID) return MessageError::IncorrectServiceId;
    if (raw.MessageType() != type) return MessageError::IncorrectMessageType;
    return MessageError::OK;
}

CAnchoringSignature CAnchoringSignature::Create(const chain::CHostKey& key, uint32_t validator, const CBitcoinTx& tx,
                                                uint32_t input, const std::vector<unsigned char>& signature)
{
    chain::CHostPubKey from = key.GetPubKey();
    chain::CMessageWriter writer(ANCHORING_SERVICE_ID, MSG_ANCHORING_SIGNATURE, SIGNATURE_BODY_LENGTH);
    writer.WriteBytes(0, from.data(), from.size());
    writer.WriteU32(32, validator);
    writer.WriteSegment(36, tx.Raw());
    writer.WriteU32(44, input);
    writer.WriteSegment(48, signature);

    CAnchoringSignature msg;
    MessageError err = Decode(writer.Sign(key), msg);
    if (err != MessageError::OK)
        throw std::runtime_error("CAnchoringSignature::Create(): " + chain::MessageErrorString(err));
    return msg;
}

MessageError CAnchoringSignature::Decode(const chain::CRawMessage& raw, CAnchoringSignature& msg)
{
    MessageError err = CheckEnvelope(raw, MSG_ANCHORING_SIGNATURE, SIGNATURE_BODY_LENGTH);
    if (err != MessageError::OK) return err;

    std::vector<std::vector<unsigned char>> segments;
    err = raw.ReadSegments(SIGNATURE_BODY_LENGTH, {36, 48}, segments);
    if (err != MessageError::OK) return err;
    if (segments[1].empty() || segments[1].size() > MAX_INPUT_SIGNATURE_SIZE)
        return MessageError::IncorrectSegmentSize;

    CAnchoringSignature decoded;
    if (!CBitcoinTx::FromRaw(segments[0], decoded.tx))
        return MessageError::InvalidField;
    decoded.raw = raw;
    decoded.from = chain::CHostPubKey(raw.Field(0));
    decoded.validator = raw.ReadU32(32);
    decoded.input = raw.ReadU32(44);
    decoded.signature = std::move(segments[1]);
    msg = std::move(decoded);
    return MessageError::OK;
}

CAnchoringUpdateLatest CAnchoringUpdateLatest::Create(const chain::CHostKey& key, uint32_t validator,
                                                      const CBitcoinTx& tx, uint64_t lectCount)
{
    chain::CHostPubKey from = key.GetPubKey();
    chain::CMessageWriter writer(ANCHORING_SERVICE_ID, MSG_ANCHORING_UPDATE_LATEST, UPDATE_LATEST_BODY_LENGTH);
    writer.WriteBytes(0, from.data(), from.size());
    writer.WriteU32(32, validator);
    writer.WriteSegment(36, tx.Raw());
    writer.WriteU64(44, lectCount);

    CAnchoringUpdateLatest msg;
    MessageError err = Decode(writer.Sign(key), msg);
    if (err != MessageError::OK)
        throw std::runtime_error("CAnchoringUpdateLatest::Create(): " + chain::MessageErrorString(err));
    return msg;
}

MessageError CAnchoringUpdateLatest::Decode(const chain::CRawMessage& raw, CAnchoringUpdateLatest& msg)
{
    MessageError err = CheckEnvelope(raw, MSG_ANCHORING_UPDATE_LATEST, UPDATE_LATEST_BODY_LENGTH);
    if (err != MessageError::OK) return err;

    std::vector<std::vector<unsigned char>> segments;
    err = raw.ReadSegments(UPDATE_LATEST_BODY_LENGTH, {36}, segments);
    if (err != MessageError::OK) return err;

    CAnchoringUpdateLatest decoded;
    if (!CBitcoinTx::FromRaw(segments[0], decoded.tx))
        return MessageError::InvalidField;
    decoded.raw = raw;
    decoded.from = chain::CHostPubKey(raw.Field(0));
    decoded.validator = raw.ReadU32(32);
    decoded.lect_count = raw.ReadU64(44);
    msg = std::move(decoded);
    return MessageError::OK;
}

MessageError CAnchoringMessage::Decode(const chain::CRawMessage& raw, CAnchoringMessage& out, bool fVerifySignature)
{
    if (raw.size() < chain::HEADER_LENGTH)
        return MessageError::UnexpectedlyShortPayload;
    if (raw.ServiceId() != ANCHORING_SERVICE_ID)
        return MessageError::IncorrectServiceId;

    MessageError err;
    switch (raw.MessageType()) {
    case MSG_ANCHORING_SIGNATURE: {
        CAnchoringSignature sig;
        err = CAnchoringSignature::Decode(raw, sig);
        if (err == MessageError::OK) out = CAnchoringMessage(std::move(sig));
        break;
    }
    case MSG_ANCHORING_UPDATE_LATEST: {
        CAnchoringUpdateLatest update;
        err = CAnchoringUpdateLatest::Decode(raw, update);
        if (err == MessageError::OK) out = CAnchoringMessage(std::move(update));
        break;
    }
    default:
        return MessageError::IncorrectMessageType;
    }
    if (err != MessageError::OK) return err;
    if (fVerifySignature && !out.VerifySignature()) return MessageError::InvalidSignature;
    return MessageError::OK;
}

namespace {

struct RawVisitor : public boost::static_visitor<const chain::CRawMessage&> {
    template<typename T>
    const chain::CRawMessage& operator()(const T& m) const { return m.Raw(); }
};

struct FromVisitor : public boost::static_visitor<const chain::CHostPubKey&> {
    template<typename T>
    const chain::CHostPubKey& operator()(const T& m) const { return m.From(); }
};

struct ValidatorVisitor : public boost::static_visitor<uint32_t> {
    template<typename T>
    uint32_t operator()(const T& m) const { return m.Validator(); }
};

struct TxVisitor : public boost::static_visitor<const CBitcoinTx&> {
    template<typename T>
    const CBitcoinTx& operator()(const T& m) const { return m.Tx(); }
};

struct DescribeVisitor : public boost::static_visitor<std::string> {
    std::string operator()(const CAnchoringSignature& m) const
    {
        return strprintf("Signature(validator=%u, tx=%s, input=%u)", m.Validator(), m.Tx().GetId().ToString(), m.Input());
    }
    std::string operator()(const CAnchoringUpdateLatest& m) const
    {
        return strprintf("UpdateLatest(validator=%u, tx=%s, lect_count=%u)", m.Validator(), m.Tx().GetId().ToString(), m.LectCount());
    }
};

} // namespace

uint16_t CAnchoringMessage::MessageType() const
{
    return AsSignature() ? MSG_ANCHORING_SIGNATURE : MSG_ANCHORING_UPDATE_LATEST;
}

const chain::CRawMessage& CAnchoringMessage::Raw() const
{
    return boost::apply_visitor(RawVisitor(), msg);
}

const chain::CHostPubKey& CAnchoringMessage::From() const
{
    return boost::apply_visitor(FromVisitor(), msg);
}

uint32_t CAnchoringMessage::Validator() const
{
    return boost::apply_visitor(ValidatorVisitor(), msg);
}

const CBitcoinTx& CAnchoringMessage::Tx() const
{
    return boost::apply_visitor(TxVisitor(), msg);
}

std::string CAnchoringMessage::ToString() const
{
    return boost::apply_visitor(DescribeVisitor(), msg);
}

} // namespace anchoring
