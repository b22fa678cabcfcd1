//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <atomic>
#include <stdexcept>
#include <string>
#include "gtest/gtest.h"
#include "cairn/Task.hpp"
#include "cairn/context/SchedulerContext.hpp"
#include "cairn/scheduler/BenchScheduler.hpp"
#include "SchedulerTestBench.hpp"

using cairn::EvalContextPtr;
using cairn::Task;
using cairn::TaskId;
using cairn::context::SchedulerContext;
using cairn::scheduler::BenchScheduler;

TEST(Task, NamedWithArguments) {
    auto task = Task<int>::named("answer", 4, "two").process([] { return 42; });

    EXPECT_EQ(task.id().name(), "answer");
    EXPECT_EQ(task.id().args(), "4, two");
    EXPECT_TRUE(task.upstreams().empty());
    EXPECT_EQ(task.def()->type(), std::type_index(typeid(int)));
}

TEST(Task, StructurallyEqualTasksShareIds) {
    auto build = [] {
        auto leaf = Task<int>::named("leaf", 1).process([] { return 1; });
        return Task<int>::named("root").input(leaf).process([](int v) { return v; });
    };

    EXPECT_EQ(build().id(), build().id());
}

TEST(Task, IdDependsOnInputsAndType) {
    auto one = Task<int>::named("leaf", 1).process([] { return 1; });
    auto two = Task<int>::named("leaf", 2).process([] { return 2; });

    auto fromOne = Task<int>::named("root").input(one).process([](int v) { return v; });
    auto fromTwo = Task<int>::named("root").input(two).process([](int v) { return v; });
    auto asLong = Task<long>::named("root").input(one).process([](int v) { return static_cast<long>(v); });

    EXPECT_NE(fromOne.id(), fromTwo.id());
    EXPECT_NE(fromOne.id(), asLong.id());
}

TEST(Task, ListsUpstreamsInOrder) {
    auto a = Task<int>::named("a").process([] { return 1; });
    auto b = Task<std::string>::named("b").process([] { return std::string("b"); });
    auto c = Task<int>::named("c").process([] { return 3; });

    auto root = Task<int>::named("root")
        .input(a)
        .input(b)
        .inputs(std::vector<Task<int>>({ c, a }))
        .process([](int, const std::string&, const std::vector<int>&) { return 0; });

    auto upstreams = root.upstreams();
    ASSERT_EQ(upstreams.size(), 4);
    EXPECT_EQ(upstreams[0]->id(), a.id());
    EXPECT_EQ(upstreams[1]->id(), b.id());
    EXPECT_EQ(upstreams[2]->id(), c.id());
    EXPECT_EQ(upstreams[3]->id(), a.id());
}

TEST(Task, LazyInputIsNotSuppliedUntilNeeded) {
    int supplied = 0;
    auto leaf = Task<int>::named("leaf").process([] { return 1; });
    std::function<Task<int>()> lazy = [&supplied, leaf] {
        supplied++;
        return leaf;
    };

    auto root = Task<int>::named("root").input(lazy).process([](int v) { return v + 1; });
    EXPECT_EQ(supplied, 0);

    auto upstreams = root.upstreams();
    EXPECT_EQ(supplied, 1);
    ASSERT_EQ(upstreams.size(), 1);
    EXPECT_EQ(upstreams[0]->id(), leaf.id());
}

TEST(Task, LazyInputsContributeToId) {
    auto one = Task<int>::named("up", 1).process([] { return 1; });
    auto two = Task<int>::named("up", 2).process([] { return 2; });

    int supplied = 0;
    auto rootOf = [&supplied](const Task<int>& upstream) {
        std::function<Task<int>()> lazy = [&supplied, upstream] {
            supplied++;
            return upstream;
        };
        return Task<int>::named("root").input(lazy).process([](int v) { return v; });
    };

    auto fromOne = rootOf(one);
    auto fromTwo = rootOf(two);
    EXPECT_EQ(supplied, 0);

    EXPECT_NE(fromOne.id(), fromTwo.id());
    EXPECT_EQ(fromOne.id(), rootOf(one).id());
    EXPECT_EQ(fromOne.id(), Task<int>::named("root").input(one).process([](int v) { return v; }).id());

    int afterFirstIds = supplied;
    fromOne.id();
    fromTwo.id();
    EXPECT_EQ(supplied, afterFirstIds);
}

TEST(Task, ArgumentsAreComparedExactly) {
    auto scale = [](const auto& factor) {
        return Task<int>::named("scale", factor).process([] { return 0; });
    };

    EXPECT_NE(scale(1.0000001).id(), scale(1.0000002).id());
    EXPECT_NE(scale(1).id(), scale("1").id());
    EXPECT_NE(
        Task<int>::named("t", std::string("x, y")).process([] { return 0; }).id(),
        Task<int>::named("t", "x", "y").process([] { return 0; }).id());
}

class TaskEvaluation : public ::testing::Test {
protected:
    void SetUp() override {
        sched = std::make_shared<BenchScheduler>();
        context = SchedulerContext::create(sched);
    }

    std::shared_ptr<BenchScheduler> sched;
    EvalContextPtr context;
};

TEST_F(TaskEvaluation, RunsProcessFunctionOnScheduler) {
    int calls = 0;
    auto task = Task<int>::named("leaf").process([&calls] { calls++; return 42; });

    auto value = context->evaluate(task);
    EXPECT_FALSE(value->get().has_value());
    EXPECT_EQ(calls, 0);

    sched->run_ready_tasks();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(value->await(), 42);
}

TEST_F(TaskEvaluation, PassesInputsInOrder) {
    auto a = Task<int>::named("a").process([] { return 2; });
    auto b = Task<std::string>::named("b").process([] { return std::string("x"); });

    auto root = Task<std::string>::named("root")
        .input(a)
        .input(b)
        .process([](int times, const std::string& text) {
            std::string repeated;
            for(int i = 0; i < times; i++) {
                repeated += text;
            }
            return repeated;
        });

    auto value = context->evaluate(root);
    sched->run_ready_tasks();
    EXPECT_EQ(value->await(), "xx");
}

TEST_F(TaskEvaluation, PassesListInputs) {
    std::vector<Task<int>> leaves;
    for(int i = 1; i <= 3; i++) {
        leaves.push_back(Task<int>::named("leaf", i).process([i] { return i * 10; }));
    }

    auto sum = Task<int>::named("sum")
        .inputs(leaves)
        .process([](const std::vector<int>& values) {
            int total = 0;
            for(auto v : values) total += v;
            return total;
        });

    auto value = context->evaluate(sum);
    sched->run_ready_tasks();
    EXPECT_EQ(value->await(), 60);
}

TEST_F(TaskEvaluation, EmptyListInput) {
    auto count = Task<std::size_t>::named("count")
        .inputs(std::vector<Task<int>>())
        .process([](const std::vector<int>& values) { return values.size(); });

    auto value = context->evaluate(count);
    sched->run_ready_tasks();
    EXPECT_EQ(value->await(), 0);
}

TEST_F(TaskEvaluation, LazyInputEvaluates) {
    auto leaf = Task<int>::named("leaf").process([] { return 1; });
    std::function<Task<int>()> lazy = [leaf] { return leaf; };

    auto root = Task<int>::named("root").input(lazy).process([](int v) { return v + 1; });

    auto value = context->evaluate(root);
    sched->run_ready_tasks();
    EXPECT_EQ(value->await(), 2);
}

TEST_F(TaskEvaluation, ProcessFunctionFailure) {
    auto task = Task<int>::named("broken").process([]() -> int {
        throw std::runtime_error("broken");
    });

    auto value = context->evaluate(task);
    sched->run_ready_tasks();
    EXPECT_THROW(value->await(), std::runtime_error);
}

TEST_F(TaskEvaluation, InputFailureSkipsProcessFunction) {
    int calls = 0;
    auto broken = Task<int>::named("broken").process([]() -> int {
        throw std::invalid_argument("broken");
    });
    auto root = Task<int>::named("root").input(broken).process([&calls](int v) {
        calls++;
        return v;
    });

    auto value = context->evaluate(root);
    sched->run_ready_tasks();

    EXPECT_THROW(value->await(), std::invalid_argument);
    EXPECT_EQ(calls, 0);
}

TEST_F(TaskEvaluation, FailingLazySupplierFailsTask) {
    std::function<Task<int>()> lazy = []() -> Task<int> {
        throw std::runtime_error("no task");
    };
    auto root = Task<int>::named("root").input(lazy).process([](int v) { return v; });

    auto value = context->evaluate(root);
    sched->run_ready_tasks();
    EXPECT_THROW(value->await(), std::runtime_error);
}

TEST(SchedulerContext, RequiresScheduler) {
    EXPECT_THROW(SchedulerContext::create(nullptr), std::invalid_argument);
}

TEST(SchedulerContext, LiftsValuesAndPromises) {
    auto sched = std::make_shared<BenchScheduler>();
    auto context = SchedulerContext::create(sched);

    auto lifted = context->value([] { return std::any(5); });
    EXPECT_EQ(sched->num_task_ready(), 1);
    sched->run_ready_tasks();
    EXPECT_EQ(std::any_cast<int>(lifted->await()), 5);

    auto promise = context->promise();
    EXPECT_FALSE(promise->isComplete());
    promise->set(std::any(std::string("set")));
    EXPECT_EQ(std::any_cast<std::string>(promise->value()->await()), "set");
}

INSTANTIATE_SCHEDULER_TEST_BENCH_SUITE(TaskEvaluationAcrossSchedulers);

TEST_P(TaskEvaluationAcrossSchedulers, EvaluatesWideGraph) {
    auto context = baseContext();
    std::atomic_int calls(0);

    std::vector<Task<int>> leaves;
    for(int i = 0; i < 64; i++) {
        leaves.push_back(Task<int>::named("leaf", i).process([i, &calls] {
            calls++;
            return i;
        }));
    }

    auto sum = Task<int>::named("sum").inputs(leaves).process([](const std::vector<int>& values) {
        int total = 0;
        for(auto v : values) total += v;
        return total;
    });

    EXPECT_EQ(context->evaluate(sum)->await(), 2016);
    EXPECT_EQ(calls.load(), 64);
    awaitIdle();
}

TEST_P(TaskEvaluationAcrossSchedulers, EvaluatesDeepGraph) {
    auto context = baseContext();

    auto task = Task<int>::named("step", 0).process([] { return 0; });
    for(int i = 1; i <= 100; i++) {
        task = Task<int>::named("step", i).input(task).process([](int v) { return v + 1; });
    }

    EXPECT_EQ(context->evaluate(task)->await(), 100);
    awaitIdle();
}
