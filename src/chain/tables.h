// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_CHAIN_TABLES_H
#define ANCHORING_CHAIN_TABLES_H

#include "chain/storage.h"
#include "crypto/common.h"
#include "hash.h"
#include "optional.h"
#include "streams.h"
#include "uint256.h"

#include <cstdint>
#include <string>
#include <vector>

namespace chain {

template<typename T>
std::string EncodeValue(const T& obj)
{
    CDataStream ss(SER_DISK, PROTOCOL_VERSION);
    ss << obj;
    return ss.str();
}

/** Decode a stored value. A value that does not decode is a storage fault. */
template<typename T>
void DecodeValue(const std::string& raw, T& obj)
{
    try {
        CDataStream ss(raw.data(), raw.data() + raw.size(), SER_DISK, PROTOCOL_VERSION);
        ss >> obj;
    } catch (const std::ios_base::failure& e) {
        throw dbwrapper_error(std::string("corrupted table value: ") + e.what());
    }
}

/** Big-endian u64 key suffix, so that list items sort by index. */
inline std::string EncodeIndex(uint64_t index)
{
    unsigned char buf[8];
    WriteBE64(buf, index);
    return std::string((const char*)buf, sizeof(buf));
}

/** Table prefix [service_tag, table_disc]. */
inline std::string MakeTablePrefix(uint8_t serviceTag, uint8_t tableDisc)
{
    std::string prefix;
    prefix.push_back((char)serviceTag);
    prefix.push_back((char)tableDisc);
    return prefix;
}

/** Table prefix with a per-validator scope: 32-bit big-endian index padded to 8 bytes. */
inline std::string MakeValidatorPrefix(uint8_t serviceTag, uint8_t tableDisc, uint32_t validator)
{
    std::string prefix = MakeTablePrefix(serviceTag, tableDisc);
    unsigned char buf[8] = {};
    WriteBE32(buf, validator);
    prefix.append((const char*)buf, sizeof(buf));
    return prefix;
}

/** Key/value table: entries stored at prefix || serialize(key). */
template<typename K, typename V>
class CMapTable
{
private:
    CStorageView& view;
    std::string prefix;

    std::string MakeKey(const K& key) const { return prefix + EncodeValue(key); }

public:
    CMapTable(CStorageView& viewIn, std::string prefixIn) : view(viewIn), prefix(std::move(prefixIn)) {}

    bool Get(const K& key, V& value) const
    {
        std::string raw;
        if (!view.Get(MakeKey(key), raw)) return false;
        DecodeValue(raw, value);
        return true;
    }

    Optional<V> Get(const K& key) const
    {
        V value;
        if (!Get(key, value)) return nullopt;
        return value;
    }

    bool Contains(const K& key) const { return view.Exists(MakeKey(key)); }
    void Put(const K& key, const V& value) { view.Put(MakeKey(key), EncodeValue(value)); }
    void Erase(const K& key) { view.Erase(MakeKey(key)); }
};

/**
 * Append-only list. The length lives at the bare prefix, item i at
 * prefix || BE64(i).
 */
template<typename V>
class CListTable
{
private:
    CStorageView& view;
    std::string prefix;

public:
    CListTable(CStorageView& viewIn, std::string prefixIn) : view(viewIn), prefix(std::move(prefixIn)) {}

    uint64_t Len() const
    {
        std::string raw;
        uint64_t len = 0;
        if (view.Get(prefix, raw)) DecodeValue(raw, len);
        return len;
    }

    bool Empty() const { return Len() == 0; }

    Optional<V> Get(uint64_t index) const
    {
        std::string raw;
        if (!view.Get(prefix + EncodeIndex(index), raw)) return nullopt;
        V value;
        DecodeValue(raw, value);
        return value;
    }

    Optional<V> Last() const
    {
        uint64_t len = Len();
        if (len == 0) return nullopt;
        return Get(len - 1);
    }

    void Append(const V& value)
    {
        uint64_t len = Len();
        view.Put(prefix + EncodeIndex(len), EncodeValue(value));
        view.Put(prefix, EncodeValue(len + 1));
    }

    std::vector<V> Values() const
    {
        std::vector<V> values;
        uint64_t len = Len();
        values.reserve(len);
        for (uint64_t i = 0; i < len; i++) {
            Optional<V> value = Get(i);
            if (!value) throw dbwrapper_error("list table is missing an item below its length");
            values.push_back(*value);
        }
        return values;
    }
};

/**
 * Merkleized append-only list.
 *
 * Layout under the prefix:
 *   prefix                         -> length (u64)
 *   prefix || 0x00 || BE64(i)      -> item i
 *   prefix || level || BE64(i)     -> hash node i at level (level >= 1)
 *
 * Level 1 holds leaf hashes Hash(serialize(item)). A node at level l+1 is
 * Hash(left || right), or Hash(left) when the right child does not exist.
 * The root is the single node of the lowest level with one node; the root
 * of an empty table is zero.
 */
template<typename V>
class CMerkleTable
{
private:
    CStorageView& view;
    std::string prefix;

    std::string NodeKey(uint8_t level, uint64_t index) const
    {
        std::string key = prefix;
        key.push_back((char)level);
        key += EncodeIndex(index);
        return key;
    }

    uint256 GetNode(uint8_t level, uint64_t index) const
    {
        std::string raw;
        uint256 hash;
        if (!view.Get(NodeKey(level, index), raw)) {
            throw dbwrapper_error("merkle table is missing a hash node");
        }
        DecodeValue(raw, hash);
        return hash;
    }

    void SetNode(uint8_t level, uint64_t index, const uint256& hash)
    {
        view.Put(NodeKey(level, index), EncodeValue(hash));
    }

public:
    CMerkleTable(CStorageView& viewIn, std::string prefixIn) : view(viewIn), prefix(std::move(prefixIn)) {}

    uint64_t Len() const
    {
        std::string raw;
        uint64_t len = 0;
        if (view.Get(prefix, raw)) DecodeValue(raw, len);
        return len;
    }

    bool Empty() const { return Len() == 0; }

    Optional<V> Get(uint64_t index) const
    {
        std::string raw;
        if (!view.Get(NodeKey(0, index), raw)) return nullopt;
        V value;
        DecodeValue(raw, value);
        return value;
    }

    Optional<V> Last() const
    {
        uint64_t len = Len();
        if (len == 0) return nullopt;
        return Get(len - 1);
    }

    void Append(const V& value)
    {
        uint64_t index = Len();
        std::string raw = EncodeValue(value);
        view.Put(NodeKey(0, index), raw);
        view.Put(prefix, EncodeValue(index + 1));

        // Recompute the path from the new leaf to the root
        SetNode(1, index, Hash(raw.begin(), raw.end()));
        uint64_t count = index + 1;
        uint8_t level = 1;
        while (count > 1) {
            uint64_t parentIndex = index / 2;
            uint256 left = GetNode(level, parentIndex * 2);
            uint256 node;
            if (parentIndex * 2 + 1 < count) {
                uint256 right = GetNode(level, parentIndex * 2 + 1);
                node = Hash(left.begin(), left.end(), right.begin(), right.end());
            } else {
                node = Hash(left.begin(), left.end());
            }
            SetNode(level + 1, parentIndex, node);
            index = parentIndex;
            count = (count + 1) / 2;
            level++;
        }
    }

    uint256 RootHash() const
    {
        uint64_t count = Len();
        if (count == 0) return uint256();
        uint8_t level = 1;
        while (count > 1) {
            count = (count + 1) / 2;
            level++;
        }
        return GetNode(level, 0);
    }

    std::vector<V> Values() const
    {
        std::vector<V> values;
        uint64_t len = Len();
        values.reserve(len);
        for (uint64_t i = 0; i < len; i++) {
            Optional<V> value = Get(i);
            if (!value) throw dbwrapper_error("merkle table is missing an item below its length");
            values.push_back(*value);
        }
        return values;
    }
};

} // namespace chain

#endif // ANCHORING_CHAIN_TABLES_H
