// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_CHAIN_MESSAGE_H
#define ANCHORING_CHAIN_MESSAGE_H

#include "chain/hostkey.h"
#include "serialize.h"
#include "uint256.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chain {

/**
 * Signed host-chain message.
 *
 * Wire layout:
 *   [0]      network id (u8)
 *   [1]      protocol version (u8)
 *   [2..4)   message type (u16 LE)
 *   [4..6)   service id (u16 LE)
 *   [6..10)  total length of the message including signature (u32 LE)
 *   [10..)   fixed-size body, segment headers inside it point at
 *            variable-length data that follows the body in field order
 *   last 64  BIP340 signature over Hash(everything before it)
 *
 * A segment header is (offset u32 LE, length u32 LE); the offset is
 * measured from the start of the message.
 */
static const size_t HEADER_LENGTH = 10;
static const uint8_t PROTOCOL_VERSION_HOST = 0;
static const uint8_t NETWORK_ID = 0;
static const size_t SEGMENT_HEADER_LENGTH = 8;

enum class MessageError {
    OK,
    UnexpectedlyShortPayload,    //!< fewer bytes than header + body + signature
    IncorrectPayloadLength,      //!< header length field disagrees with the buffer
    IncorrectNetworkId,
    IncorrectVersion,
    IncorrectServiceId,
    IncorrectMessageType,
    IncorrectSegmentReference,   //!< segment outside the data area or not in canonical order
    IncorrectSegmentSize,        //!< segment length out of range for its field
    TrailingData,                //!< bytes between the last segment and the signature
    InvalidField,                //!< a field failed to decode (e.g. a malformed Bitcoin transaction)
    InvalidSignature,            //!< host signature does not verify against the sender
};

std::string MessageErrorString(MessageError err);

class CRawMessage
{
private:
    std::vector<unsigned char> data;

public:
    CRawMessage() {}
    explicit CRawMessage(std::vector<unsigned char> dataIn) : data(std::move(dataIn)) {}

    const std::vector<unsigned char>& Data() const { return data; }
    size_t size() const { return data.size(); }

    uint8_t NetworkId() const;
    uint8_t Version() const;
    uint16_t MessageType() const;
    uint16_t ServiceId() const;
    uint32_t PayloadLength() const;

    /** Header checks common to every message: sizes, network, version. */
    MessageError CheckHeader(size_t bodyLength) const;

    /** Fixed-width little-endian fields inside the body (offsets relative to the body start). */
    uint32_t ReadU32(size_t offset) const;
    uint64_t ReadU64(size_t offset) const;
    const unsigned char* Field(size_t offset) const;

    /**
     * Resolve the segment headers found at the given body offsets, in field
     * order. The first segment must start right after the fixed body, every
     * following one right after its predecessor, and the last one must end
     * at the signature.
     */
    MessageError ReadSegments(size_t bodyLength, const std::vector<size_t>& offsets,
                              std::vector<std::vector<unsigned char>>& out) const;

    /** Hash(header || body): the digest covered by the signature. */
    uint256 SignedHash() const;

    /** Hash of the complete raw message; identifies it in the mempool and chain. */
    uint256 GetHash() const;

    bool VerifySignature(const CHostPubKey& pubkey) const;

    template<typename Stream>
    void Serialize(Stream& s) const
    {
        ::Serialize(s, data);
    }

    template<typename Stream>
    void Unserialize(Stream& s)
    {
        ::Unserialize(s, data);
    }

    friend bool operator==(const CRawMessage& a, const CRawMessage& b) { return a.data == b.data; }
};

/**
 * Builds the raw form of a message: fixed body first, then segments in the
 * order they are added, then the signature.
 */
class CMessageWriter
{
private:
    std::vector<unsigned char> buffer;
    size_t bodyLength;
    std::vector<std::pair<size_t, std::vector<unsigned char>>> segments;

public:
    CMessageWriter(uint16_t serviceId, uint16_t messageType, size_t bodyLengthIn);

    void WriteBytes(size_t offset, const unsigned char* data, size_t len);
    void WriteU32(size_t offset, uint32_t value);
    void WriteU64(size_t offset, uint64_t value);
    void WriteSegment(size_t offset, std::vector<unsigned char> value);

    CRawMessage Sign(const CHostKey& key);
};

} // namespace chain

#endif // ANCHORING_CHAIN_MESSAGE_H
