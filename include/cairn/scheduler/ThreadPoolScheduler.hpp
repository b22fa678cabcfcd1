//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_THREAD_POOL_SCHEDULER_H_
#define _CAIRN_THREAD_POOL_SCHEDULER_H_

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <queue>
#include <vector>

#include "../Scheduler.hpp"

namespace cairn::scheduler {

/**
 * A fixed size pool of worker threads sharing a single ready queue.
 */
class ThreadPoolScheduler final : public Scheduler {
public:
    /**
     * Construct a scheduler optionally configuring the number of threads
     * to use.
     *
     * @param poolSize The number of threads to use - defaults to matching
     *                 the number of hardware threads available in the system.
     */
    explicit ThreadPoolScheduler(unsigned int poolSize = std::thread::hardware_concurrency());

    /**
     * Destruct the scheduler. Workers drain the ready queue first, including
     * anything submitted while draining, so every submitted task runs and
     * the values it completes resolve.
     */
    ~ThreadPoolScheduler() override;

    ThreadPoolScheduler(const ThreadPoolScheduler&) = delete;
    ThreadPoolScheduler& operator=(const ThreadPoolScheduler&) = delete;

    void submit(const std::function<void()>& task) override;
    void submitBulk(const std::vector<std::function<void()>>& tasks) override;
    bool isIdle() const override;
    std::string toString() const override;

    /**
     * @return The number of worker threads in this pool.
     */
    std::size_t size() const;
private:
    bool should_run;
    std::mutex readyQueueMutex;
    std::condition_variable dataInQueue;
    std::queue<std::function<void()>> readyQueue;
    std::atomic_size_t pending;
    std::vector<std::thread> threads;

    void run();
};

} // namespace cairn::scheduler

#endif
