// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_SYNC_H
#define ANCHORING_SYNC_H

#include <mutex>
#include <type_traits>

/** Wrapped mutex: supports recursive locking, but no waiting */
typedef std::recursive_mutex RecursiveMutex;

/** Wrapped mutex: supports waiting but not recursive locking */
typedef std::mutex Mutex;

/** Wrapper around std::unique_lock style lock for MutexType */
template<typename MutexType>
class CMutexLock : public std::unique_lock<MutexType>
{
public:
    explicit CMutexLock(MutexType& mutexIn) : std::unique_lock<MutexType>(mutexIn) {}
};

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CMutexLock<typename std::remove_reference<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs)
#define LOCK2(cs1, cs2)                                                                               \
    CMutexLock<typename std::remove_reference<decltype(cs1)>::type> criticalblock1(cs1);             \
    CMutexLock<typename std::remove_reference<decltype(cs2)>::type> criticalblock2(cs2)

#define WITH_LOCK(cs, code) [&] { LOCK(cs); code; }()

#endif // ANCHORING_SYNC_H
