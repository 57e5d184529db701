// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_TEST_TEST_ANCHORING_H
#define ANCHORING_TEST_TEST_ANCHORING_H

#include "amount.h"
#include "btc/script.h"
#include "btc/transaction.h"
#include "dbwrapper.h"
#include "fs.h"
#include "uint256.h"

#include <memory>

/** ECC context, quiet logging and a fixed mock time. */
struct BasicTestingSetup {
    fs::path pathTemp;

    BasicTestingSetup();
    ~BasicTestingSetup();
};

/** BasicTestingSetup plus an in-memory host chain database. */
struct DBTestingSetup : public BasicTestingSetup {
    std::unique_ptr<CDBWrapper> db;

    DBTestingSetup();
    ~DBTestingSetup();
};

/** One output paying scriptPubKey, spending a random outpoint. */
btc::CMutableTransaction CreateDepositTx(const btc::CScript& scriptPubKey, CAmount value);

/** Random 20-byte P2SH script, for outputs nobody in the test controls. */
btc::CScript RandomScriptPubKey();

#endif // ANCHORING_TEST_TEST_ANCHORING_H
