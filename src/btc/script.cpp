// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "btc/script.h"

#include "hash.h"
#include "utilstrencodings.h"

namespace btc {

const char* GetOpName(opcodetype opcode)
{
    switch (opcode) {
    // push value
    case OP_0                      : return "0";
    case OP_PUSHDATA1              : return "OP_PUSHDATA1";
    case OP_PUSHDATA2              : return "OP_PUSHDATA2";
    case OP_PUSHDATA4              : return "OP_PUSHDATA4";
    case OP_1NEGATE                : return "-1";
    case OP_RESERVED               : return "OP_RESERVED";
    case OP_1                      : return "1";
    case OP_2                      : return "2";
    case OP_3                      : return "3";
    case OP_4                      : return "4";
    case OP_5                      : return "5";
    case OP_6                      : return "6";
    case OP_7                      : return "7";
    case OP_8                      : return "8";
    case OP_9                      : return "9";
    case OP_10                     : return "10";
    case OP_11                     : return "11";
    case OP_12                     : return "12";
    case OP_13                     : return "13";
    case OP_14                     : return "14";
    case OP_15                     : return "15";
    case OP_16                     : return "16";

    // control
    case OP_NOP                    : return "OP_NOP";
    case OP_RETURN                 : return "OP_RETURN";

    // stack ops
    case OP_DUP                    : return "OP_DUP";

    // bit logic
    case OP_EQUAL                  : return "OP_EQUAL";
    case OP_EQUALVERIFY            : return "OP_EQUALVERIFY";

    // crypto
    case OP_HASH160                : return "OP_HASH160";
    case OP_CHECKSIG               : return "OP_CHECKSIG";
    case OP_CHECKSIGVERIFY         : return "OP_CHECKSIGVERIFY";
    case OP_CHECKMULTISIG          : return "OP_CHECKMULTISIG";
    case OP_CHECKMULTISIGVERIFY    : return "OP_CHECKMULTISIGVERIFY";

    case OP_INVALIDOPCODE          : return "OP_INVALIDOPCODE";

    default:
        return "OP_UNKNOWN";
    }
}

bool CScript::GetOp(const_iterator& pc, opcodetype& opcodeRet, std::vector<unsigned char>& vchRet) const
{
    opcodeRet = OP_INVALIDOPCODE;
    vchRet.clear();
    if (pc >= end())
        return false;

    // Read instruction
    if (end() - pc < 1)
        return false;
    unsigned int opcode = *pc++;

    // Immediate operand
    if (opcode <= OP_PUSHDATA4) {
        unsigned int nSize = 0;
        if (opcode < OP_PUSHDATA1) {
            nSize = opcode;
        } else if (opcode == OP_PUSHDATA1) {
            if (end() - pc < 1)
                return false;
            nSize = *pc++;
        } else if (opcode == OP_PUSHDATA2) {
            if (end() - pc < 2)
                return false;
            nSize = ReadLE16(&pc[0]);
            pc += 2;
        } else if (opcode == OP_PUSHDATA4) {
            if (end() - pc < 4)
                return false;
            nSize = ReadLE32(&pc[0]);
            pc += 4;
        }
        if (end() - pc < 0 || (unsigned int)(end() - pc) < nSize)
            return false;
        vchRet.assign(pc, pc + nSize);
        pc += nSize;
    }

    opcodeRet = static_cast<opcodetype>(opcode);
    return true;
}

bool CScript::GetOp(const_iterator& pc, opcodetype& opcodeRet) const
{
    std::vector<unsigned char> vch;
    return GetOp(pc, opcodeRet, vch);
}

bool CScript::IsPayToScriptHash() const
{
    // Extra-fast test for pay-to-script-hash CScripts:
    return (this->size() == 23 &&
            (*this)[0] == OP_HASH160 &&
            (*this)[1] == 0x14 &&
            (*this)[22] == OP_EQUAL);
}

bool CScript::IsPushOnly() const
{
    const_iterator pc = begin();
    while (pc < end()) {
        opcodetype opcode;
        if (!GetOp(pc, opcode))
            return false;
        // Note that IsPushOnly() *does* consider OP_RESERVED to be a
        // push-type opcode, however execution of OP_RESERVED fails, so
        // it's not relevant to P2SH/BIP62 as the scriptSig would fail prior to
        // the P2SH special validation code being executed.
        if (opcode > OP_16)
            return false;
    }
    return true;
}

std::string CScript::ToString() const
{
    std::string str;
    opcodetype opcode;
    std::vector<unsigned char> vch;
    const_iterator pc = begin();
    while (pc < end()) {
        if (!str.empty())
            str += " ";
        if (!GetOp(pc, opcode, vch)) {
            str += "[error]";
            return str;
        }
        if (0 <= opcode && opcode <= OP_PUSHDATA4) {
            str += vch.empty() ? "0" : HexStr(vch);
        } else {
            str += GetOpName(opcode);
        }
    }
    return str;
}

uint160 ScriptHash(const CScript& script)
{
    return Hash160(script.begin(), script.end());
}

CScript GetScriptForP2SH(const uint160& scriptHash)
{
    CScript script;
    script << OP_HASH160 << std::vector<unsigned char>(scriptHash.begin(), scriptHash.end()) << OP_EQUAL;
    return script;
}

CScript GetScriptForMultisig(int nRequired, const std::vector<std::vector<unsigned char>>& keys)
{
    CScript script;

    script << nRequired;
    for (const std::vector<unsigned char>& key : keys)
        script << key;
    script << (int64_t)keys.size() << OP_CHECKMULTISIG;
    return script;
}

bool ParseMultisigScript(const CScript& script, int& nRequired, std::vector<std::vector<unsigned char>>& keys)
{
    keys.clear();
    opcodetype opcode;
    std::vector<unsigned char> data;
    CScript::const_iterator it = script.begin();

    if (!script.GetOp(it, opcode, data) || opcode < OP_1 || opcode > OP_16)
        return false;
    nRequired = CScript::DecodeOP_N(opcode);

    while (script.GetOp(it, opcode, data)) {
        if (opcode >= OP_1 && opcode <= OP_16) {
            int nKeys = CScript::DecodeOP_N(opcode);
            if (nKeys != (int)keys.size() || nRequired > nKeys)
                return false;
            if (!script.GetOp(it, opcode) || opcode != OP_CHECKMULTISIG)
                return false;
            return it == script.end();
        }
        if (data.size() != 33 && data.size() != 65)
            return false;
        keys.push_back(data);
    }
    return false;
}

CScript GetScriptForNullData(const std::vector<unsigned char>& data)
{
    CScript script;
    script << OP_RETURN << data;
    return script;
}

bool ParseNullData(const CScript& script, std::vector<unsigned char>& data)
{
    if (!script.IsUnspendable())
        return false;
    CScript::const_iterator it = script.begin() + 1;
    opcodetype opcode;
    if (!script.GetOp(it, opcode, data) || opcode > OP_PUSHDATA4)
        return false;
    return it == script.end();
}

} // namespace btc
