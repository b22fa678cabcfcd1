//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_LOGGING_H_
#define _CAIRN_LOGGING_H_

#include <any>
#include <chrono>
#include <memory>

#include "Either.hpp"
#include "TaskId.hpp"

namespace cairn {

class Logging;
using LoggingRef = std::shared_ptr<Logging>;

/**
 * An observer of evaluation events, notified by `LoggingContext`.
 *
 * For every task reaching its process function the events arrive as
 * `startEval` followed by exactly one of `completedValue` or `failedValue` -
 * the latter possibly on another thread. Memoized tasks only ever see
 * `willEval`.
 *
 * Implementations may be called concurrently. Anything they throw is
 * logged and otherwise ignored.
 */
class Logging {
public:
    /**
     * A task is about to be evaluated, whether or not its value turns out
     * to be memoized.
     */
    virtual void willEval(const TaskId& taskId) = 0;

    /**
     * The process function of a task is about to be invoked.
     */
    virtual void startEval(const TaskId& taskId) = 0;

    virtual void completedValue(const TaskId& taskId, const std::any& value, std::chrono::nanoseconds elapsed) = 0;
    virtual void failedValue(const TaskId& taskId, const Error& error, std::chrono::nanoseconds elapsed) = 0;

    virtual ~Logging() = default;
};

} // namespace cairn

#endif
