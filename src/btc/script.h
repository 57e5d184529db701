// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_BTC_SCRIPT_H
#define ANCHORING_BTC_SCRIPT_H

#include "crypto/common.h"
#include "serialize.h"
#include "uint256.h"

#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace btc {

// Maximum number of bytes pushable to the stack
static const unsigned int MAX_SCRIPT_ELEMENT_SIZE = 520;

// Maximum number of public keys per multisig
static const int MAX_PUBKEYS_PER_MULTISIG = 20;

/** Script opcodes */
enum opcodetype {
    // push value
    OP_0 = 0x00,
    OP_FALSE = OP_0,
    OP_PUSHDATA1 = 0x4c,
    OP_PUSHDATA2 = 0x4d,
    OP_PUSHDATA4 = 0x4e,
    OP_1NEGATE = 0x4f,
    OP_RESERVED = 0x50,
    OP_1 = 0x51,
    OP_TRUE = OP_1,
    OP_2 = 0x52,
    OP_3 = 0x53,
    OP_4 = 0x54,
    OP_5 = 0x55,
    OP_6 = 0x56,
    OP_7 = 0x57,
    OP_8 = 0x58,
    OP_9 = 0x59,
    OP_10 = 0x5a,
    OP_11 = 0x5b,
    OP_12 = 0x5c,
    OP_13 = 0x5d,
    OP_14 = 0x5e,
    OP_15 = 0x5f,
    OP_16 = 0x60,

    // control
    OP_NOP = 0x61,
    OP_RETURN = 0x6a,

    // stack ops
    OP_DUP = 0x76,

    // bit logic
    OP_EQUAL = 0x87,
    OP_EQUALVERIFY = 0x88,

    // crypto
    OP_HASH160 = 0xa9,
    OP_CHECKSIG = 0xac,
    OP_CHECKSIGVERIFY = 0xad,
    OP_CHECKMULTISIG = 0xae,
    OP_CHECKMULTISIGVERIFY = 0xaf,

    OP_INVALIDOPCODE = 0xff,
};

const char* GetOpName(opcodetype opcode);

class scriptnum_error : public std::runtime_error
{
public:
    explicit scriptnum_error(const std::string& str) : std::runtime_error(str) {}
};

/** Serialized script, used inside transaction inputs and outputs */
class CScript : public std::vector<unsigned char>
{
protected:
    CScript& push_int64(int64_t n)
    {
        if (n == -1 || (n >= 1 && n <= 16)) {
            push_back(n + (OP_1 - 1));
        } else if (n == 0) {
            push_back(OP_0);
        } else {
            throw scriptnum_error("CScript::push_int64(): only small integers are supported");
        }
        return *this;
    }

public:
    CScript() {}
    CScript(const_iterator pbegin, const_iterator pend) : std::vector<unsigned char>(pbegin, pend) {}
    CScript(const unsigned char* pbegin, const unsigned char* pend) : std::vector<unsigned char>(pbegin, pend) {}

    template<typename Stream>
    void Serialize(Stream& s) const
    {
        ::Serialize(s, static_cast<const std::vector<unsigned char>&>(*this));
    }

    template<typename Stream>
    void Unserialize(Stream& s)
    {
        ::Unserialize(s, static_cast<std::vector<unsigned char>&>(*this));
    }

    explicit CScript(int64_t b) { operator<<(b); }
    explicit CScript(opcodetype b) { operator<<(b); }

    CScript& operator<<(int64_t b) { return push_int64(b); }

    CScript& operator<<(opcodetype opcode)
    {
        if (opcode < 0 || opcode > 0xff)
            throw std::runtime_error("CScript::operator<<(): invalid opcode");
        insert(end(), (unsigned char)opcode);
        return *this;
    }

    CScript& operator<<(const std::vector<unsigned char>& b)
    {
        if (b.size() < OP_PUSHDATA1) {
            insert(end(), (unsigned char)b.size());
        } else if (b.size() <= 0xff) {
            insert(end(), OP_PUSHDATA1);
            insert(end(), (unsigned char)b.size());
        } else if (b.size() <= 0xffff) {
            insert(end(), OP_PUSHDATA2);
            uint8_t _data[2];
            WriteLE16(_data, b.size());
            insert(end(), _data, _data + sizeof(_data));
        } else {
            insert(end(), OP_PUSHDATA4);
            uint8_t _data[4];
            WriteLE32(_data, b.size());
            insert(end(), _data, _data + sizeof(_data));
        }
        insert(end(), b.begin(), b.end());
        return *this;
    }

    CScript& operator<<(const CScript& b) = delete;

    bool GetOp(const_iterator& pc, opcodetype& opcodeRet, std::vector<unsigned char>& vchRet) const;
    bool GetOp(const_iterator& pc, opcodetype& opcodeRet) const;

    /** Encode/decode small integers: */
    static int DecodeOP_N(opcodetype opcode)
    {
        if (opcode == OP_0)
            return 0;
        assert(opcode >= OP_1 && opcode <= OP_16);
        return (int)opcode - (int)(OP_1 - 1);
    }
    static opcodetype EncodeOP_N(int n)
    {
        assert(n >= 0 && n <= 16);
        if (n == 0)
            return OP_0;
        return (opcodetype)(OP_1 + n - 1);
    }

    bool IsPayToScriptHash() const;

    /** Called by IsStandardTx and P2SH/BIP62 VerifyScript (which makes it consensus-critical). */
    bool IsPushOnly() const;

    /**
     * Returns whether the script is guaranteed to fail at execution,
     * regardless of the initial stack. This allows outputs to be pruned
     * instantly when entering the UTXO set.
     */
    bool IsUnspendable() const
    {
        return (size() > 0 && *begin() == OP_RETURN);
    }

    /** Human readable disassembly */
    std::string ToString() const;

    void clear()
    {
        // The default std::vector::clear() does not release memory.
        CScript().swap(*this);
    }
};

/** 20-byte script hash of a redeem script. */
uint160 ScriptHash(const CScript& script);

/** OP_HASH160 <hash> OP_EQUAL */
CScript GetScriptForP2SH(const uint160& scriptHash);

/** OP_m <pubkey...> OP_n OP_CHECKMULTISIG */
CScript GetScriptForMultisig(int nRequired, const std::vector<std::vector<unsigned char>>& keys);

/**
 * Parse a bare multisig script into its threshold and public keys.
 * Returns false if the script is not of the form OP_m <keys> OP_n OP_CHECKMULTISIG.
 */
bool ParseMultisigScript(const CScript& script, int& nRequired, std::vector<std::vector<unsigned char>>& keys);

/** OP_RETURN <data> */
CScript GetScriptForNullData(const std::vector<unsigned char>& data);

/** Extract the single push following OP_RETURN. */
bool ParseNullData(const CScript& script, std::vector<unsigned char>& data);

} // namespace btc

#endif // ANCHORING_BTC_SCRIPT_H
