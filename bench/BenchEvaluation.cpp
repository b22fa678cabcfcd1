//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <benchmark/benchmark.h>
#include <map>
#include <mutex>
#include <optional>
#include "cairn/Task.hpp"
#include "cairn/context/MemoizingContext.hpp"
#include "cairn/context/SchedulerContext.hpp"
#include "cairn/scheduler/BenchScheduler.hpp"

using cairn::Memoizer;
using cairn::Task;
using cairn::TaskDef;
using cairn::TaskId;
using cairn::context::MemoizingContext;
using cairn::context::SchedulerContext;
using cairn::scheduler::BenchScheduler;

namespace {

class IntStore final : public Memoizer<int> {
public:
    std::optional<int> lookup(const TaskDef& task) override {
        std::lock_guard<std::mutex> guard(mutex);
        auto found = values.find(task.id());
        if(found != values.end()) {
            return found->second;
        } else {
            return std::nullopt;
        }
    }

    void store(const TaskDef& task, const int& value) override {
        std::lock_guard<std::mutex> guard(mutex);
        values[task.id()] = value;
    }

private:
    std::mutex mutex;
    std::map<TaskId, int> values;
};

Task<int> wideGraph(int width) {
    std::vector<Task<int>> leaves;
    leaves.reserve(width);
    for(int i = 0; i < width; i++) {
        leaves.push_back(Task<int>::named("leaf", i).process([i] { return i; }));
    }

    return Task<int>::named("sum", width).inputs(leaves).process([](const std::vector<int>& values) {
        int total = 0;
        for(auto v : values) total += v;
        return total;
    });
}

Task<int> deepGraph(int depth) {
    auto task = Task<int>::named("step", 0).process([] { return 0; });
    for(int i = 1; i < depth; i++) {
        task = Task<int>::named("step", i).input(task).process([](int v) { return v + 1; });
    }
    return task;
}

} // namespace

// Evaluate a graph in a fresh memoizing run on every iteration
static void BM_Evaluate_Wide(benchmark::State& state) {
    auto task = wideGraph(static_cast<int>(state.range(0)));
    auto sched = std::make_shared<BenchScheduler>();

    for (auto _ : state) {
        auto context = MemoizingContext::composeWith(SchedulerContext::create(sched));
        auto value = context->evaluate(task);
        sched->run_ready_tasks();
        benchmark::DoNotOptimize(value->await());
    }
}
BENCHMARK(BM_Evaluate_Wide)->Range(1, 1024);

static void BM_Evaluate_Deep(benchmark::State& state) {
    auto task = deepGraph(static_cast<int>(state.range(0)));
    auto sched = std::make_shared<BenchScheduler>();

    for (auto _ : state) {
        auto context = MemoizingContext::composeWith(SchedulerContext::create(sched));
        auto value = context->evaluate(task);
        sched->run_ready_tasks();
        benchmark::DoNotOptimize(value->await());
    }
}
BENCHMARK(BM_Evaluate_Deep)->Range(1, 512);

// The root is memoized so every iteration is a single lookup
static void BM_Evaluate_WideMemoized(benchmark::State& state) {
    auto task = wideGraph(static_cast<int>(state.range(0)));
    auto sched = std::make_shared<BenchScheduler>();
    auto store = std::make_shared<IntStore>();

    {
        auto context = MemoizingContext::builder(SchedulerContext::create(sched)).memoizer<int>(store).build();
        context->evaluate(task);
        sched->run_ready_tasks();
    }

    for (auto _ : state) {
        auto context = MemoizingContext::builder(SchedulerContext::create(sched)).memoizer<int>(store).build();
        benchmark::DoNotOptimize(context->evaluate(task)->await());
    }
}
BENCHMARK(BM_Evaluate_WideMemoized)->Range(1, 1024);
