//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "cairn/scheduler/ThreadPoolScheduler.hpp"

namespace cairn::scheduler {

ThreadPoolScheduler::ThreadPoolScheduler(unsigned int poolSize)
    : should_run(true)
    , readyQueueMutex()
    , dataInQueue()
    , readyQueue()
    , pending(0)
    , threads()
{
    if(poolSize == 0) {
        poolSize = 1;
    }

    threads.reserve(poolSize);

    for(unsigned int i = 0; i < poolSize; i++) {
        threads.emplace_back(&ThreadPoolScheduler::run, this);
    }
}

ThreadPoolScheduler::~ThreadPoolScheduler() {
    {
        std::lock_guard<std::mutex> guard(readyQueueMutex);
        should_run = false;
    }

    dataInQueue.notify_all();

    for(auto& thread : threads) {
        if(thread.joinable()) {
            thread.join();
        }
    }
}

void ThreadPoolScheduler::submit(const std::function<void()>& task) {
    pending++;

    {
        std::lock_guard<std::mutex> guard(readyQueueMutex);
        readyQueue.emplace(task);
    }

    dataInQueue.notify_one();
}

void ThreadPoolScheduler::submitBulk(const std::vector<std::function<void()>>& tasks) {
    pending += tasks.size();

    {
        std::lock_guard<std::mutex> guard(readyQueueMutex);
        for(auto& task: tasks) {
            readyQueue.emplace(task);
        }
    }

    dataInQueue.notify_all();
}

bool ThreadPoolScheduler::isIdle() const {
    return pending.load() == 0;
}

std::string ThreadPoolScheduler::toString() const {
    return "ThreadPoolScheduler(" + std::to_string(threads.size()) + ")";
}

std::size_t ThreadPoolScheduler::size() const {
    return threads.size();
}

void ThreadPoolScheduler::run() {
    std::function<void()> task;

    while(true) {
        {
            std::unique_lock<std::mutex> readyQueueLock(readyQueueMutex);
            dataInQueue.wait(readyQueueLock, [this]() { return !should_run || !readyQueue.empty(); });

            if(readyQueue.empty()) {
                return;
            }

            task = std::move(readyQueue.front());
            readyQueue.pop();
        }

        task();
        task = nullptr;
        pending--;
    }
}

} // namespace cairn::scheduler
