// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_SYNC_H
#define CROWDFUND_SYNC_H

#include "threadsafety.h"

#include <mutex>
#include <type_traits>

////////////////////////////////////////////////
//                                            //
// THE SIMPLE DEFINITION, EXCLUDING DEBUG CODE //
//                                            //
////////////////////////////////////////////////

/*
RecursiveMutex mutex;
    std::recursive_mutex mutex;

LOCK(mutex);
    std::unique_lock<std::recursive_mutex> criticalblock(mutex);
 */

/**
 * Template mixin that adds -Wthread-safety locking annotations to a
 * subset of the mutex API.
 */
template <typename PARENT>
class LOCKABLE AnnotatedMixin : public PARENT
{
public:
    void lock() EXCLUSIVE_LOCK_FUNCTION()
    {
        PARENT::lock();
    }

    void unlock() UNLOCK_FUNCTION()
    {
        PARENT::unlock();
    }

    bool try_lock() EXCLUSIVE_TRYLOCK_FUNCTION(true)
    {
        return PARENT::try_lock();
    }
};

/**
 * Wrapped mutex: supports recursive locking, but no waiting.
 * Used by the ledger so that a transfer rail or notification sink may call
 * back into the ledger from the thread that holds the lock.
 */
typedef AnnotatedMixin<std::recursive_mutex> RecursiveMutex;

/** Wrapped mutex: supports waiting but not recursive locking */
typedef AnnotatedMixin<std::mutex> Mutex;

/** Wrapper around std::unique_lock style lock for Mutex. */
template <typename MutexType, typename Base = std::unique_lock<MutexType>>
class SCOPED_LOCKABLE UniqueLock : public Base
{
public:
    UniqueLock(MutexType& mutexIn, bool fTry = false) EXCLUSIVE_LOCK_FUNCTION(mutexIn)
        : Base(mutexIn, std::defer_lock)
    {
        if (fTry)
            Base::try_lock();
        else
            Base::lock();
    }

    ~UniqueLock() UNLOCK_FUNCTION()
    {
        if (Base::owns_lock())
            Base::unlock();
    }

    operator bool()
    {
        return Base::owns_lock();
    }
};

template <typename MutexArg>
using DebugLock = UniqueLock<typename std::remove_reference<typename std::remove_pointer<MutexArg>::type>::type>;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) DebugLock<decltype(cs)> PASTE2(criticalblock, __COUNTER__)(cs)

#endif // CROWDFUND_SYNC_H
