//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_SCHEDULER_H_
#define _CAIRN_SCHEDULER_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cairn {

class Scheduler;
using SchedulerRef = std::shared_ptr<Scheduler>;

/**
 * A Scheduler represents the executor upon which process functions and
 * lifted computations run. Evaluation contexts never block on the
 * scheduler - they submit work and observe its result through a `Value`.
 */
class Scheduler {
public:
    /**
     * Obtain a reference to the global default scheduler.
     *
     * @return The default globally available scheduler instance.
     */
    static SchedulerRef global();

    /**
     * Submit a task for execution. This task will execute after an
     * indeterminite amount of time as resources free to perform the task.
     *
     * @param task The task to submit for execution.
     */
    virtual void submit(const std::function<void()>& task) = 0;

    /**
     * Submit several tasks at once. The order these tasks will be taken
     * up and executed is undefined.
     *
     * @param tasks The vector of tasks to submit in-bulk.
     */
    virtual void submitBulk(const std::vector<std::function<void()>>& tasks) = 0;

    /**
     * Check if the scheduler is currently idle - meaning no submitted
     * work is waiting or running.
     *
     * @return true if the scheduler is idle.
     */
    virtual bool isIdle() const = 0;

    /**
     * @return A short human readable name for this scheduler.
     */
    virtual std::string toString() const = 0;

    virtual ~Scheduler() = default;
};

} // namespace cairn

#endif
