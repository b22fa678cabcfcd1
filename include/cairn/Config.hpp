//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_CONFIG_H_
#define _CAIRN_CONFIG_H_

#include <chrono>

namespace cairn {

/**
 * How long a process function invocation waits for its task's evaluation
 * bundle to become visible before a warning is written to the diagnostic
 * log. The wait itself never gives up; the warning repeats once per interval.
 */
constexpr std::chrono::milliseconds bundle_wait_warning_interval(1000);

/**
 * Number of worker threads used by the global scheduler. Zero selects
 * the number of hardware threads.
 */
constexpr unsigned int global_scheduler_threads = 0;

} // namespace cairn

#endif
