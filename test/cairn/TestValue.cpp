//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include "gtest/gtest.h"
#include "cairn/Value.hpp"

using cairn::Error;
using cairn::Promise;
using cairn::Result;
using cairn::Value;

TEST(Value, Pure) {
    auto value = Value<int>::pure(123);

    auto result = value->get();
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->is_left());
    EXPECT_EQ(result->get_left(), 123);
    EXPECT_EQ(value->await(), 123);
}

TEST(Value, PureConsume) {
    int seen = 0;
    int failures = 0;
    auto value = Value<int>::pure(123);

    value->consume([&seen](int result) { seen = result; });
    value->onFail([&failures](const Error&) { failures++; });

    EXPECT_EQ(seen, 123);
    EXPECT_EQ(failures, 0);
}

TEST(Value, Failed) {
    int consumed = 0;
    int failures = 0;
    auto value = Value<int>::failed(std::make_exception_ptr(std::runtime_error("broke")));

    value->consume([&consumed](int) { consumed++; });
    value->onFail([&failures](const Error&) { failures++; });

    EXPECT_EQ(consumed, 0);
    EXPECT_EQ(failures, 1);
    EXPECT_THROW(value->await(), std::runtime_error);
}

TEST(Value, ForPromiseFiresOnce) {
    auto promise = Promise<int>::create();
    auto value = promise->value();

    int consumed = 0;
    int failures = 0;
    int completions = 0;

    value->consume([&consumed](int) { consumed++; });
    value->onFail([&failures](const Error&) { failures++; });
    value->onComplete([&completions](const Result<int>&) { completions++; });

    EXPECT_FALSE(value->get().has_value());

    promise->set(1);
    EXPECT_THROW(promise->set(2), std::runtime_error);

    EXPECT_EQ(consumed, 1);
    EXPECT_EQ(failures, 0);
    EXPECT_EQ(completions, 1);
}

TEST(Value, ForPromiseFailure) {
    auto promise = Promise<int>::create();
    auto value = promise->value();

    std::string message;
    value->onFail([&message](const Error& error) {
        try {
            std::rethrow_exception(error);
        } catch(const std::exception& thrown) {
            message = thrown.what();
        }
    });

    promise->fail(std::make_exception_ptr(std::runtime_error("broke")));
    EXPECT_EQ(message, "broke");
}

TEST(Value, AwaitAcrossThreads) {
    auto promise = Promise<std::string>::create();
    auto value = promise->value();

    std::thread producer([promise] {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        promise->set("done");
    });

    EXPECT_EQ(value->await(), "done");
    producer.join();
}

TEST(Value, AwaitRethrowsFailureAcrossThreads) {
    auto promise = Promise<int>::create();
    auto value = promise->value();

    std::thread producer([promise] {
        promise->fail(std::make_exception_ptr(std::invalid_argument("bad")));
    });

    EXPECT_THROW(value->await(), std::invalid_argument);
    producer.join();
}

TEST(Value, Map) {
    auto promise = Promise<int>::create();
    auto mapped = promise->value()->map<std::string>([](int result) {
        return std::to_string(result * 2);
    });

    EXPECT_FALSE(mapped->get().has_value());
    promise->set(21);
    EXPECT_EQ(mapped->await(), "42");
}

TEST(Value, MapPassesFailureThrough) {
    int calls = 0;
    auto mapped = Value<int>::failed(std::make_exception_ptr(std::runtime_error("broke")))
        ->map<int>([&calls](int result) { calls++; return result; });

    EXPECT_THROW(mapped->await(), std::runtime_error);
    EXPECT_EQ(calls, 0);
}

TEST(Value, MapTurnsThrowIntoFailure) {
    auto mapped = Value<int>::pure(1)->map<int>([](int) -> int {
        throw std::out_of_range("nope");
    });

    EXPECT_THROW(mapped->await(), std::out_of_range);
}

TEST(Value, ChainSuccess) {
    auto upstream = Promise<int>::create();
    auto downstream = Promise<int>::create();

    cairn::chain(upstream->value(), downstream);
    EXPECT_FALSE(downstream->isComplete());

    upstream->set(5);
    EXPECT_EQ(downstream->value()->await(), 5);
}

TEST(Value, ChainFailure) {
    auto downstream = Promise<int>::create();

    cairn::chain(Value<int>::failed(std::make_exception_ptr(std::runtime_error("broke"))), downstream);

    ASSERT_TRUE(downstream->isComplete());
    EXPECT_TRUE(downstream->get()->is_right());
}
