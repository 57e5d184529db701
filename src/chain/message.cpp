// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/message.h"

#include "crypto/common.h"
#include "hash.h"

#include <stdexcept>

namespace chain {

std::string MessageErrorString(MessageError err)
{
    switch (err) {
    case MessageError::OK: return "ok";
    case MessageError::UnexpectedlyShortPayload: return "unexpectedly-short-payload";
    case MessageError::IncorrectPayloadLength: return "incorrect-payload-length";
    case MessageError::IncorrectNetworkId: return "incorrect-network-id";
    case MessageError::IncorrectVersion: return "incorrect-version";
    case MessageError::IncorrectServiceId: return "incorrect-service-id";
    case MessageError::IncorrectMessageType: return "incorrect-message-type";
    case MessageError::IncorrectSegmentReference: return "incorrect-segment-reference";
    case MessageError::IncorrectSegmentSize: return "incorrect-segment-size";
    case MessageError::TrailingData: return "trailing-data";
    case MessageError::InvalidField: return "invalid-field";
    case MessageError::InvalidSignature: return "invalid-signature";
    }
    return "unknown";
}

uint8_t CRawMessage::NetworkId() const { return data.size() > 0 ? data[0] : 0; }
uint8_t CRawMessage::Version() const { return data.size() > 1 ? data[1] : 0; }
uint16_t CRawMessage::MessageType() const { return data.size() >= HEADER_LENGTH ? ReadLE16(&data[2]) : 0; }
uint16_t CRawMessage::ServiceId() const { return data.size() >= HEADER_LENGTH ? ReadLE16(&data[4]) : 0; }
uint32_t CRawMessage::PayloadLength() const { return data.size() >= HEADER_LENGTH ? ReadLE32(&data[6]) : 0; }

MessageError CRawMessage::CheckHeader(size_t bodyLength) const
{
    if (data.size() < HEADER_LENGTH + bodyLength + HOST_SIGNATURE_SIZE)
        return MessageError::UnexpectedlyShortPayload;
    if (PayloadLength() != data.size())
        return MessageError::IncorrectPayloadLength;
    if (NetworkId() != NETWORK_ID)
        return MessageError::IncorrectNetworkId;
    if (Version() != PROTOCOL_VERSION_HOST)
        return MessageError::IncorrectVersion;
    return MessageError::OK;
}

const unsigned char* CRawMessage::Field(size_t offset) const
{
    if (HEADER_LENGTH + offset > data.size())
        throw std::out_of_range("CRawMessage::Field(): offset beyond message");
    return data.data() + HEADER_LENGTH + offset;
}

uint32_t CRawMessage::ReadU32(size_t offset) const
{
    if (HEADER_LENGTH + offset + 4 > data.size())
        throw std::out_of_range("CRawMessage::ReadU32(): offset beyond message");
    return ReadLE32(Field(offset));
}

uint64_t CRawMessage::ReadU64(size_t offset) const
{
    if (HEADER_LENGTH + offset + 8 > data.size())
        throw std::out_of_range("CRawMessage::ReadU64(): offset beyond message");
    return ReadLE64(Field(offset));
}

MessageError CRawMessage::ReadSegments(size_t bodyLength, const std::vector<size_t>& offsets,
                                       std::vector<std::vector<unsigned char>>& out) const
{
    MessageError err = CheckHeader(bodyLength);
    if (err != MessageError::OK) return err;

    const uint64_t limit = data.size() - HOST_SIGNATURE_SIZE;
    uint64_t cursor = HEADER_LENGTH + bodyLength;
    out.clear();
    for (size_t offset : offsets) {
        if (offset + SEGMENT_HEADER_LENGTH > bodyLength)
            throw std::out_of_range("CRawMessage::ReadSegments(): segment header beyond body");
        uint32_t start = ReadLE32(Field(offset));
        uint32_t len = ReadLE32(Field(offset + 4));
        if (start != cursor)
            return MessageError::IncorrectSegmentReference;
        if ((uint64_t)start + len > limit)
            return MessageError::IncorrectSegmentReference;
        out.emplace_back(data.begin() + start, data.begin() + start + len);
        cursor = (uint64_t)start + len;
    }
    if (cursor != limit)
        return MessageError::TrailingData;
    return MessageError::OK;
}

uint256 CRawMessage::SignedHash() const
{
    if (data.size() < HOST_SIGNATURE_SIZE)
        return uint256();
    return Hash(data.begin(), data.end() - HOST_SIGNATURE_SIZE);
}

uint256 CRawMessage::GetHash() const
{
    return Hash(data.begin(), data.end());
}

bool CRawMessage::VerifySignature(const CHostPubKey& pubkey) const
{
    if (data.size() < HEADER_LENGTH + HOST_SIGNATURE_SIZE)
        return false;
    return pubkey.Verify(SignedHash(), data.data() + data.size() - HOST_SIGNATURE_SIZE);
}

CMessageWriter::CMessageWriter(uint16_t serviceId, uint16_t messageType, size_t bodyLengthIn)
    : buffer(HEADER_LENGTH + bodyLengthIn, 0), bodyLength(bodyLengthIn)
{
    buffer[0] = NETWORK_ID;
    buffer[1] = PROTOCOL_VERSION_HOST;
    WriteLE16(&buffer[2], messageType);
    WriteLE16(&buffer[4], serviceId);
}

void CMessageWriter::WriteBytes(size_t offset, const unsigned char* data, size_t len)
{
    if (offset + len > bodyLength)
        throw std::out_of_range("CMessageWriter::WriteBytes(): field beyond body");
    std::copy(data, data + len, buffer.begin() + HEADER_LENGTH + offset);
}

void CMessageWriter::WriteU32(size_t offset, uint32_t value)
{
    unsigned char buf[4];
    WriteLE32(buf, value);
    WriteBytes(offset, buf, sizeof(buf));
}

void CMessageWriter::WriteU64(size_t offset, uint64_t value)
{
    unsigned char buf[8];
    WriteLE64(buf, value);
    WriteBytes(offset, buf, sizeof(buf));
}

void CMessageWriter::WriteSegment(size_t offset, std::vector<unsigned char> value)
{
    if (offset + SEGMENT_HEADER_LENGTH > bodyLength)
        throw std::out_of_range("CMessageWriter::WriteSegment(): header beyond body");
    segments.emplace_back(offset, std::move(value));
}

CRawMessage CMessageWriter::Sign(const CHostKey& key)
{
    std::vector<unsigned char> raw = buffer;
    for (const auto& segment : segments) {
        WriteLE32(&raw[HEADER_LENGTH + segment.first], raw.size());
        WriteLE32(&raw[HEADER_LENGTH + segment.first + 4], segment.second.size());
        raw.insert(raw.end(), segment.second.begin(), segment.second.end());
    }
    WriteLE32(&raw[6], raw.size() + HOST_SIGNATURE_SIZE);

    uint256 hash = Hash(raw.begin(), raw.end());
    HostSignature sig = key.Sign(hash);
    raw.insert(raw.end(), sig.begin(), sig.end());
    return CRawMessage(std::move(raw));
}

} // namespace chain
