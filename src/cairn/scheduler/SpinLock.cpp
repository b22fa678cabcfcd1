//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "cairn/scheduler/SpinLock.hpp"
#include <thread>

namespace cairn::scheduler {

void SpinLock::lock() {
    int attempts = 0;

    while(!try_lock()) {
        // Wait on plain loads so contended cores do not bounce the line.
        while(held.load(std::memory_order_relaxed)) {
            if(++attempts >= spins_before_yield) {
                attempts = 0;
                std::this_thread::yield();
            }
        }
    }
}

bool SpinLock::try_lock() {
    return !held.exchange(true, std::memory_order_acquire);
}

void SpinLock::unlock() {
    held.store(false, std::memory_order_release);
}

} // namespace cairn::scheduler
