// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_BTC_INTERPRETER_H
#define ANCHORING_BTC_INTERPRETER_H

#include "btc/script.h"
#include "btc/transaction.h"
#include "uint256.h"

namespace btc {

/** Signature hash types/flags */
enum {
    SIGHASH_ALL = 1,
    SIGHASH_NONE = 2,
    SIGHASH_SINGLE = 3,
    SIGHASH_ANYONECANPAY = 0x80,
};

/**
 * Legacy (pre-segwit) signature hash of input nIn, with scriptCode standing in
 * for the spent output's script. Only SIGHASH_ALL is produced or accepted by
 * the anchoring service. Returns the "one" hash when nIn is out of range.
 */
uint256 SignatureHash(const CScript& scriptCode, const CTransaction& txTo, unsigned int nIn, int nHashType);

} // namespace btc

#endif // ANCHORING_BTC_INTERPRETER_H
