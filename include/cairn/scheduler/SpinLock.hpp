//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_SCHEDULER_SPIN_LOCK_H_
#define _CAIRN_SCHEDULER_SPIN_LOCK_H_

#include <atomic>

namespace cairn::scheduler {

/**
 * A lock for critical sections that are only ever a handful of
 * instructions long, such as the state transition of a `Promise`.
 * Never hold it across user code: callbacks, process functions and
 * memoizer calls all run after the lock is released.
 *
 * Meets the standard Lockable requirements, so it is used through
 * `std::lock_guard` like any mutex.
 */
class SpinLock {
public:
    SpinLock() = default;
    SpinLock(const SpinLock&) = delete;
    SpinLock& operator=(const SpinLock&) = delete;

    /**
     * Spin until the lock is acquired. Yields the thread once a short
     * burst of attempts has failed.
     */
    void lock();

    /**
     * @return True if the lock was free and is now held by the caller.
     */
    bool try_lock();

    void unlock();

private:
    static constexpr int spins_before_yield = 64;

    std::atomic_bool held{false};
};

} // namespace cairn::scheduler

#endif
