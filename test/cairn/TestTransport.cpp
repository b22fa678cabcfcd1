//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include <cereal/types/map.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include "gtest/gtest.h"
#include "cairn/ConstructionError.hpp"
#include "cairn/Transport.hpp"

using cairn::ConstructionError;
using cairn::builder::requireTransportable;

namespace {

struct Partition {
    std::string table;
    std::vector<int> days;
    std::map<std::string, double> weights;

    bool operator==(const Partition& other) const {
        return table == other.table && days == other.days && weights == other.weights;
    }

    template <class Archive>
    void serialize(Archive& archive) {
        archive(table, days, weights);
    }
};

struct Connection {
    int handle = 0;

    template <class Archive>
    void save(Archive&) const {
        throw std::runtime_error("open handles cannot be moved");
    }

    template <class Archive>
    void load(Archive&) {}
};

} // namespace

TEST(Transport, RoundTripsToEqualValue) {
    Partition partition{"events", {1, 2, 3}, {{"a", 0.5}, {"b", 1.5}}};

    auto restored = requireTransportable(partition, "partition");

    EXPECT_EQ(restored, partition);
}

TEST(Transport, RoundTripsPlainValues) {
    EXPECT_EQ(requireTransportable(42, "count"), 42);
    EXPECT_EQ(requireTransportable(std::string("path/to/file"), "path"), "path/to/file");
}

TEST(Transport, FailureNamesArgument) {
    Connection connection;

    try {
        requireTransportable(connection, "connection");
        FAIL() << "Expected a construction error.";
    } catch(const ConstructionError& error) {
        std::string message = error.what();
        EXPECT_EQ(message.rfind("connection not transportable", 0), 0) << message;
        EXPECT_NE(message.find("open handles cannot be moved"), std::string::npos) << message;
    }
}
