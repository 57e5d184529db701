// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/storage.h"
#include "chain/tables.h"
#include "hash.h"
#include "random.h"
#include "test/test_anchoring.h"

#include <boost/test/unit_test.hpp>

#include <algorithm>

using namespace chain;

static uint256 LeafHash(const uint256& item)
{
    std::string raw = EncodeValue(item);
    return Hash(raw.begin(), raw.end());
}

static uint256 NodeHash(const uint256& left, const uint256& right)
{
    return Hash(left.begin(), left.end(), right.begin(), right.end());
}

static uint256 LoneHash(const uint256& left)
{
    return Hash(left.begin(), left.end());
}

BOOST_FIXTURE_TEST_SUITE(tables_tests, DBTestingSetup)

// =============================================================================
// Key layout
// =============================================================================
BOOST_AUTO_TEST_CASE(table_prefix_layout)
{
    std::string prefix = MakeTablePrefix(3, 0x02);
    BOOST_REQUIRE_EQUAL(prefix.size(), 2U);
    BOOST_CHECK_EQUAL((uint8_t)prefix[0], 3);
    BOOST_CHECK_EQUAL((uint8_t)prefix[1], 0x02);

    std::string scoped = MakeValidatorPrefix(3, 0x03, 0x01020304);
    BOOST_REQUIRE_EQUAL(scoped.size(), 10U);
    const unsigned char expected[] = {3, 0x03, 1, 2, 3, 4, 0, 0, 0, 0};
    BOOST_CHECK(std::equal(scoped.begin(), scoped.end(), (const char*)expected));

    // list items sort by index
    BOOST_CHECK(EncodeIndex(1) < EncodeIndex(2));
    BOOST_CHECK(EncodeIndex(255) < EncodeIndex(256));
}

// =============================================================================
// Layered views
// =============================================================================
BOOST_AUTO_TEST_CASE(fork_merge_and_rollback)
{
    CStorageView root(*db);
    root.Put("a", "1");

    {
        CStorageView fork(root);
        fork.Put("b", "2");
        fork.Erase("a");
        BOOST_CHECK(!fork.Exists("a"));
        BOOST_CHECK(fork.Exists("b"));
        BOOST_CHECK(root.Exists("a"));
        fork.Rollback();
        BOOST_CHECK(fork.Exists("a"));
        BOOST_CHECK(!fork.Exists("b"));
    }

    {
        CStorageView fork(root);
        fork.Put("c", "3");
        fork.Merge();
    }
    std::string value;
    BOOST_CHECK(root.Get("c", value));
    BOOST_CHECK_EQUAL(value, "3");

    // nothing reaches the database before the flush
    std::unique_ptr<CStorageView> before = CStorageView::Snapshot(*db);
    BOOST_CHECK(!before->Exists("a"));
    root.Flush();
    BOOST_CHECK(!before->Exists("a"));
    std::unique_ptr<CStorageView> after = CStorageView::Snapshot(*db);
    BOOST_CHECK(after->Exists("a"));
    BOOST_CHECK(after->Exists("c"));
}

// =============================================================================
// Tables
// =============================================================================
BOOST_AUTO_TEST_CASE(map_and_list_tables)
{
    CStorageView view(*db);
    CMapTable<uint256, uint64_t> map(view, MakeTablePrefix(3, 0x04));
    uint256 key = GetRandHash();
    BOOST_CHECK(!map.Get(key));
    map.Put(key, 7);
    BOOST_CHECK_EQUAL(*map.Get(key), 7U);
    map.Erase(key);
    BOOST_CHECK(!map.Contains(key));

    CListTable<uint256> list(view, MakeTablePrefix(3, 0x05));
    BOOST_CHECK(list.Empty());
    BOOST_CHECK(!list.Last());
    uint256 first = GetRandHash(), second = GetRandHash();
    list.Append(first);
    list.Append(second);
    BOOST_CHECK_EQUAL(list.Len(), 2U);
    BOOST_CHECK(*list.Get(0) == first);
    BOOST_CHECK(*list.Last() == second);
    BOOST_CHECK(!list.Get(2));
    BOOST_CHECK_EQUAL(list.Values().size(), 2U);

    // tables under other prefixes are unaffected
    CListTable<uint256> other(view, MakeTablePrefix(4, 0x05));
    BOOST_CHECK(other.Empty());
}

BOOST_AUTO_TEST_CASE(merkle_root_of_small_tables)
{
    CStorageView view(*db);
    CMerkleTable<uint256> table(view, MakeValidatorPrefix(3, 0x03, 0));
    BOOST_CHECK(table.RootHash().IsNull());

    uint256 a = GetRandHash(), b = GetRandHash(), c = GetRandHash();
    table.Append(a);
    BOOST_CHECK(table.RootHash() == LeafHash(a));

    table.Append(b);
    const uint256 ab = NodeHash(LeafHash(a), LeafHash(b));
    BOOST_CHECK(table.RootHash() == ab);

    table.Append(c);
    BOOST_CHECK(table.RootHash() == NodeHash(ab, LoneHash(LeafHash(c))));
    BOOST_CHECK_EQUAL(table.Len(), 3U);
    BOOST_CHECK(*table.Get(2) == c);
    BOOST_CHECK(*table.Last() == c);

    // same items, same root, regardless of the view
    CStorageView other(*db);
    CMerkleTable<uint256> copy(other, MakeValidatorPrefix(3, 0x03, 1));
    copy.Append(a);
    copy.Append(b);
    copy.Append(c);
    BOOST_CHECK(copy.RootHash() == table.RootHash());
}

BOOST_AUTO_TEST_CASE(corrupted_value_is_a_storage_fault)
{
    CStorageView view(*db);
    CListTable<uint256> list(view, MakeTablePrefix(3, 0x02));
    list.Append(GetRandHash());
    view.Put(MakeTablePrefix(3, 0x02) + EncodeIndex(0), "short");
    BOOST_CHECK_THROW(list.Get(0), dbwrapper_error);
}

BOOST_AUTO_TEST_SUITE_END()
