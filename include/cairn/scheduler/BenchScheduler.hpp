//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_BENCH_SCHEDULER_H_
#define _CAIRN_BENCH_SCHEDULER_H_

#include "../Scheduler.hpp"
#include <deque>
#include <mutex>
#include <optional>

namespace cairn::scheduler {

/**
 * The BenchScheduler is a scheduler geared towards making tests of
 * evaluation order repeatable. Submitted work never runs in the
 * background. Instead the test bench pumps it explicitly via the
 * `run_one_task` and `run_ready_tasks` methods, which execute on the
 * calling thread in submission order.
 *
 * This gives the test bench full control over when process functions
 * run - for example to observe the state of a graph after expansion
 * but before any leaf has been computed.
 */
class BenchScheduler final : public Scheduler {
public:
    BenchScheduler();

    /**
     * Check the number of tasks that are currently
     * ready for execution.
     *
     * @return The number of ready tasks.
     */
    std::size_t num_task_ready() const;

    /**
     * Run a single task from the ready queue.
     *
     * @return True iff a task was executed.
     */
    bool run_one_task();

    /**
     * Run all tasks from the ready queue - including
     * tasks which may be scheduled for immediate execution
     * by the executing code. As a result the number of
     * tasks executed may be larger than what `num_task_ready()`
     * indicates before calling this method.
     *
     * @return The number of tasks that were executed.
     */
    std::size_t run_ready_tasks();

    void submit(const std::function<void()>& task) override;
    void submitBulk(const std::vector<std::function<void()>>& tasks) override;
    bool isIdle() const override;
    std::string toString() const override;

private:
    std::deque<std::function<void()>> ready_queue;
    mutable std::mutex scheduler_mutex;

    std::optional<std::function<void()>> take_next();
};

} // namespace cairn::scheduler

#endif
