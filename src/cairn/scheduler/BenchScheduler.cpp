//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "cairn/scheduler/BenchScheduler.hpp"

namespace cairn::scheduler {

BenchScheduler::BenchScheduler()
    : ready_queue()
    , scheduler_mutex()
{}

std::size_t BenchScheduler::num_task_ready() const {
    std::lock_guard<std::mutex> guard(scheduler_mutex);
    return ready_queue.size();
}

bool BenchScheduler::run_one_task() {
    auto task = take_next();
    if(!task.has_value()) {
        return false;
    }

    (*task)();
    return true;
}

std::size_t BenchScheduler::run_ready_tasks() {
    std::size_t num_executed = 0;

    for(auto task = take_next(); task.has_value(); task = take_next()) {
        (*task)();
        num_executed++;
    }

    return num_executed;
}

void BenchScheduler::submit(const std::function<void()>& task) {
    std::lock_guard<std::mutex> guard(scheduler_mutex);
    ready_queue.push_back(task);
}

void BenchScheduler::submitBulk(const std::vector<std::function<void()>>& tasks) {
    std::lock_guard<std::mutex> guard(scheduler_mutex);
    ready_queue.insert(ready_queue.end(), tasks.begin(), tasks.end());
}

bool BenchScheduler::isIdle() const {
    return num_task_ready() == 0;
}

std::string BenchScheduler::toString() const {
    return "BenchScheduler";
}

std::optional<std::function<void()>> BenchScheduler::take_next() {
    std::lock_guard<std::mutex> guard(scheduler_mutex);
    if(ready_queue.empty()) {
        return std::nullopt;
    }

    auto task = std::move(ready_queue.front());
    ready_queue.pop_front();
    return task;
}

} // namespace cairn::scheduler
