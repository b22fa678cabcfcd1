//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <stdexcept>
#include <string>
#include "gtest/gtest.h"
#include "cairn/BuilderUtils.hpp"

using cairn::builder::appendToList;
using cairn::builder::guardedCall;
using cairn::builder::lazyFlatten;
using cairn::builder::lazyList;

TEST(BuilderUtils, LazyListDefersEveryItem) {
    int calls = 0;
    auto list = lazyList<int>({
        [&calls] { calls++; return 1; },
        [&calls] { calls++; return 2; }
    });

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(list(), std::vector<int>({1, 2}));
    EXPECT_EQ(calls, 2);
}

TEST(BuilderUtils, LazyListDoesNotCache) {
    int calls = 0;
    auto list = lazyList<int>({ [&calls] { return ++calls; } });

    EXPECT_EQ(list(), std::vector<int>({1}));
    EXPECT_EQ(list(), std::vector<int>({2}));
}

TEST(BuilderUtils, LazyListEmpty) {
    auto list = lazyList<std::string>({});
    EXPECT_TRUE(list().empty());
}

TEST(BuilderUtils, LazyFlatten) {
    int calls = 0;
    auto flattened = lazyFlatten<int>({
        lazyList<int>({ [&calls] { calls++; return 1; }, [] { return 2; } }),
        lazyList<int>({}),
        lazyList<int>({ [] { return 3; } })
    });

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(flattened(), std::vector<int>({1, 2, 3}));
    EXPECT_EQ(calls, 1);
}

TEST(BuilderUtils, AppendToListLeavesOriginal) {
    std::vector<int> original = {1, 2};
    auto appended = appendToList(original, 3);

    EXPECT_EQ(original, std::vector<int>({1, 2}));
    EXPECT_EQ(appended, std::vector<int>({1, 2, 3}));
}

TEST(BuilderUtils, GuardedCallRuns) {
    int calls = 0;
    guardedCall([&calls] { calls++; });
    EXPECT_EQ(calls, 1);
}

TEST(BuilderUtils, GuardedCallSwallowsExceptions) {
    EXPECT_NO_THROW(guardedCall([] { throw std::runtime_error("observer broke"); }));
    EXPECT_NO_THROW(guardedCall([] { throw 42; }));
}
