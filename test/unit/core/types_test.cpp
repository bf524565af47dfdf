#include <gtest/gtest.h>
#include "tpch/core/types.h"
#include "tpch/core/error.h"
#include <algorithm>
#include <numeric>
#include <string>
#include <vector>

namespace tpch {
namespace core {
namespace {

TEST(ReplicaTest, ConnectionStringWithPassword) {
    Replica replica(3, "10.0.0.7", "5433", "tpch", "bench", "secret");
    EXPECT_EQ(replica.connection_string(), "host=10.0.0.7 port=5433 dbname=tpch user=bench password=secret");
}

TEST(ReplicaTest, ConnectionStringOmitsEmptyPassword) {
    Replica replica(0, "localhost", "5432", "tpch", "postgres");
    EXPECT_EQ(replica.connection_string(), "host=localhost port=5432 dbname=tpch user=postgres");
}

TEST(ReplicaTest, ToStringNamesIdAndTarget) {
    Replica replica(2, "db2", "5432", "tpch", "bench");
    EXPECT_EQ(replica.to_string(), "replica 2 (bench@db2:5432/tpch)");
}

TEST(StreamOrderTest, AcceptsPermutation) {
    StreamOrder order(kNumQueries);
    std::iota(order.begin(), order.end(), 1);
    EXPECT_TRUE(IsValidStreamOrder(order));
    std::reverse(order.begin(), order.end());
    EXPECT_TRUE(IsValidStreamOrder(order));
}

TEST(StreamOrderTest, RejectsDuplicatesAndWrongSize) {
    StreamOrder order(kNumQueries);
    std::iota(order.begin(), order.end(), 1);
    order[5] = 1;
    EXPECT_FALSE(IsValidStreamOrder(order));

    StreamOrder shorter(21);
    std::iota(shorter.begin(), shorter.end(), 1);
    EXPECT_FALSE(IsValidStreamOrder(shorter));

    StreamOrder zero_based(kNumQueries);
    std::iota(zero_based.begin(), zero_based.end(), 0);
    EXPECT_FALSE(IsValidStreamOrder(zero_based));
}

class RoutingTableTest : public ::testing::Test {
protected:
    std::vector<Replica> replicas_{
        Replica(10, "a", "5432", "tpch", "u"),
        Replica(20, "b", "5432", "tpch", "u"),
    };
};

TEST_F(RoutingTableTest, RoutesResolveById) {
    RoutingTable routes(kNumQueries, 10);
    routes[21] = 20;
    EXPECT_NO_THROW(ValidateRoutingTable(routes, replicas_));
}

TEST_F(RoutingTableTest, PositionIsNotAnId) {
    RoutingTable routes(kNumQueries, 0);
    EXPECT_THROW(ValidateRoutingTable(routes, replicas_), InvalidArgumentError);
}

TEST_F(RoutingTableTest, WrongLength) {
    RoutingTable routes(kNumQueries - 1, 10);
    EXPECT_THROW(ValidateRoutingTable(routes, replicas_), InvalidArgumentError);
}

TEST_F(RoutingTableTest, DuplicateReplicaIds) {
    replicas_.emplace_back(10, "c", "5432", "tpch", "u");
    RoutingTable routes(kNumQueries, 10);
    EXPECT_THROW(ValidateRoutingTable(routes, replicas_), InvalidArgumentError);
}

TEST(UnitFailureTest, ToStringNamesUnitAndCode) {
    UnitFailure failure{"throughput stream 2", Error::Code::STATEMENT, "relation \"lineitem\" does not exist"};
    EXPECT_EQ(failure.to_string(),
              "throughput stream 2 failed [STATEMENT]: relation \"lineitem\" does not exist");
}

TEST(StreamModeTest, Names) {
    EXPECT_STREQ(StreamModeName(StreamMode::POWER), "power");
    EXPECT_STREQ(StreamModeName(StreamMode::THROUGHPUT), "throughput");
    EXPECT_STREQ(StreamModeName(StreamMode::REFRESH), "refresh");
}

TEST(TimingSampleTest, StartsEmpty) {
    TimingSample sample;
    EXPECT_FALSE(sample.start.has_value());
    EXPECT_FALSE(sample.end.has_value());
    for (const auto& q : sample.query_times) {
        EXPECT_FALSE(q.has_value());
    }
    for (const auto& r : sample.refresh_times) {
        EXPECT_FALSE(r.has_value());
    }
}

} // namespace
} // namespace core
} // namespace tpch
