// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Money parsing/formatting utilities.
 */
#ifndef ANCHORING_UTILMONEYSTR_H
#define ANCHORING_UTILMONEYSTR_H

#include "amount.h"

#include <string>

/** Satoshis to a decimal BTC string with all 8 fractional digits ("0.00010000"). */
std::string FormatMoney(const CAmount& n, bool fPlus = false);

/** Inverse of FormatMoney; accepts up to 8 fractional digits. */
bool ParseMoney(const std::string& str, CAmount& nRet);
bool ParseMoney(const char* pszIn, CAmount& nRet);

#endif // ANCHORING_UTILMONEYSTR_H
