//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <memory>
#include <stdexcept>
#include <string>
#include "gtest/gtest.h"
#include "cairn/Task.hpp"
#include "cairn/context/LoggingContext.hpp"
#include "cairn/context/MemoizingContext.hpp"
#include "cairn/context/SchedulerContext.hpp"
#include "cairn/scheduler/BenchScheduler.hpp"
#include "MapMemoizer.hpp"
#include "RecordingLogging.hpp"
#include "SchedulerTestBench.hpp"

using cairn::EvalContextPtr;
using cairn::Logging;
using cairn::Task;
using cairn::TaskId;
using cairn::context::LoggingContext;
using cairn::context::MemoizingContext;
using cairn::context::SchedulerContext;
using cairn::scheduler::BenchScheduler;

namespace {

class ThrowingLogging final : public Logging {
public:
    void willEval(const TaskId&) override {
        throw std::runtime_error("willEval");
    }

    void startEval(const TaskId&) override {
        throw std::runtime_error("startEval");
    }

    void completedValue(const TaskId&, const std::any&, std::chrono::nanoseconds) override {
        throw std::runtime_error("completedValue");
    }

    void failedValue(const TaskId&, const cairn::Error&, std::chrono::nanoseconds) override {
        throw 42;
    }
};

} // namespace

class LoggingContextTest : public ::testing::Test {
protected:
    LoggingContextTest()
        : sched(std::make_shared<BenchScheduler>())
        , logging(std::make_shared<RecordingLogging>())
        , c(Task<double>::named("c").process([] { return 1.5; }))
        , b(Task<std::string>::named("b").input(c).process([](double v) {
            return std::string(static_cast<std::size_t>(v * 2), 'x');
        }))
        , a(Task<int>::named("a").input(b).process([](const std::string& s) {
            return static_cast<int>(s.size()) * 10;
        }))
    {}

    EvalContextPtr baseContext() {
        return SchedulerContext::create(sched);
    }

    std::shared_ptr<BenchScheduler> sched;
    std::shared_ptr<RecordingLogging> logging;
    Task<double> c;
    Task<std::string> b;
    Task<int> a;
};

TEST_F(LoggingContextTest, ReportsChainWithoutMemoizedValues) {
    auto context = LoggingContext::composeWith(
        MemoizingContext::composeWith(baseContext()),
        logging);

    auto value = context->evaluate(a);
    sched->run_ready_tasks();

    EXPECT_EQ(value->await(), 30);
    EXPECT_EQ(logging->events(), std::vector<std::string>({
        "willEval a",
        "willEval b",
        "willEval c",
        "startEval c",
        "completed c = 1.5",
        "startEval b",
        "completed b = xxx",
        "startEval a",
        "completed a = 30"
    }));
}

TEST_F(LoggingContextTest, ReportsShortCircuitedChain) {
    auto strings = std::make_shared<MapMemoizer<std::string>>();
    strings->preset(b.id(), "fooo");

    auto context = LoggingContext::composeWith(
        MemoizingContext::builder(SchedulerContext::create(sched))
            .memoizer<std::string>(strings)
            .build(),
        logging);

    auto value = context->evaluate(a);
    sched->run_ready_tasks();

    EXPECT_EQ(value->await(), 40);
    EXPECT_EQ(logging->events(), std::vector<std::string>({
        "willEval a",
        "willEval b",
        "startEval a",
        "completed a = 40"
    }));
}

TEST_F(LoggingContextTest, InsideMemoizationOnlySeesExpandedTasks) {
    auto strings = std::make_shared<MapMemoizer<std::string>>();
    strings->preset(b.id(), "fooo");

    auto context = MemoizingContext::builder(
            LoggingContext::composeWith(SchedulerContext::create(sched), logging))
        .memoizer<std::string>(strings)
        .build();

    auto value = context->evaluate(a);
    sched->run_ready_tasks();

    EXPECT_EQ(value->await(), 40);
    EXPECT_EQ(logging->events(), std::vector<std::string>({
        "willEval a",
        "startEval a",
        "completed a = 40"
    }));
}

TEST_F(LoggingContextTest, ReportsFailure) {
    auto broken = Task<int>::named("broken").process([]() -> int {
        throw std::runtime_error("disk full");
    });

    auto context = LoggingContext::composeWith(SchedulerContext::create(sched), logging);
    auto value = context->evaluate(broken);
    sched->run_ready_tasks();

    EXPECT_THROW(value->await(), std::runtime_error);
    EXPECT_EQ(logging->events(), std::vector<std::string>({
        "willEval broken",
        "startEval broken",
        "failed broken: disk full"
    }));
}

TEST_F(LoggingContextTest, ObserverFailuresDoNotAffectEvaluation) {
    auto broken = Task<int>::named("broken").process([]() -> int {
        throw std::invalid_argument("broken");
    });

    auto context = LoggingContext::composeWith(
        MemoizingContext::composeWith(baseContext()),
        std::make_shared<ThrowingLogging>());

    auto value = context->evaluate(a);
    auto failed = context->evaluate(broken);
    sched->run_ready_tasks();

    EXPECT_EQ(value->await(), 30);
    EXPECT_THROW(failed->await(), std::invalid_argument);
}

TEST(LoggingContext, RequiresLogging) {
    auto sched = std::make_shared<BenchScheduler>();
    EXPECT_THROW(LoggingContext::composeWith(SchedulerContext::create(sched), nullptr), std::invalid_argument);
}

INSTANTIATE_SCHEDULER_TEST_BENCH_SUITE(LoggingContextAcrossSchedulers);

TEST_P(LoggingContextAcrossSchedulers, CompletesEveryStartedTask) {
    auto logging = std::make_shared<RecordingLogging>();
    auto context = LoggingContext::composeWith(
        MemoizingContext::composeWith(baseContext()),
        logging);

    std::vector<Task<int>> leaves;
    for(int i = 0; i < 16; i++) {
        leaves.push_back(Task<int>::named("leaf", i).process([i] { return i; }));
    }
    auto sum = Task<int>::named("sum").inputs(leaves).inputs(leaves).process(
        [](const std::vector<int>& first, const std::vector<int>& second) {
            int total = 0;
            for(auto v : first) total += v;
            for(auto v : second) total += v;
            return total;
        });

    EXPECT_EQ(context->evaluate(sum)->await(), 240);
    awaitIdle();

    int started = 0;
    int completed = 0;
    for(auto& event : logging->events()) {
        if(event.rfind("startEval", 0) == 0) started++;
        if(event.rfind("completed", 0) == 0) completed++;
    }

    EXPECT_EQ(started, 17);
    EXPECT_EQ(completed, 17);
}
