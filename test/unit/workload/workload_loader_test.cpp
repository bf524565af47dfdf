#include <gtest/gtest.h>
#include "tpch/workload/workload_loader.h"
#include "tpch/core/error.h"
#include "test_util/temp_dir.h"

#include <filesystem>
#include <string>

namespace tpch {
namespace workload {
namespace {

class WorkloadLoaderTest : public ::testing::Test {
protected:
    void write_queries() {
        std::filesystem::create_directories(dir_.path() / "queries");
        for (size_t q = 1; q <= core::kNumQueries; ++q) {
            testutil::WriteFile(dir_.path() / "queries" / (std::to_string(q) + ".sql"),
                                "-- Q" + std::to_string(q) + "\nselect " + std::to_string(q) + ";\n");
        }
    }

    void write_refresh(size_t set, const std::string& orders, const std::string& lineitems,
                       const std::string& deletes) {
        auto refresh = dir_.path() / "refresh";
        std::filesystem::create_directories(refresh);
        const std::string n = std::to_string(set);
        testutil::WriteFile(refresh / ("orders.tbl.u" + n), orders);
        testutil::WriteFile(refresh / ("lineitem.tbl.u" + n), lineitems);
        testutil::WriteFile(refresh / ("delete." + n), deletes);
    }

    std::string refresh_dir() const { return (dir_.path() / "refresh").string(); }

    testutil::ScopedTestDir dir_{"tpch_workload_loader"};
};

TEST_F(WorkloadLoaderTest, QueriesInCanonicalOrder) {
    write_queries();
    auto queries = load_queries((dir_.path() / "queries").string());
    ASSERT_EQ(queries.size(), core::kNumQueries);
    EXPECT_EQ(queries[0], "-- Q1\nselect 1;\n");
    EXPECT_EQ(queries[9], "-- Q10\nselect 10;\n");
    EXPECT_EQ(queries[21], "-- Q22\nselect 22;\n");
}

TEST_F(WorkloadLoaderTest, MissingQueryFile) {
    write_queries();
    std::filesystem::remove(dir_.path() / "queries" / "17.sql");
    EXPECT_THROW(load_queries((dir_.path() / "queries").string()), core::NotFoundError);
}

TEST_F(WorkloadLoaderTest, RefreshSetGroupsLineitemsByOrder) {
    write_refresh(1,
                  "9|100|O|10.00|1996-01-02|5-LOW|Clerk#1|0|first|\n"
                  "3|200|F|20.00|1996-01-03|1-URGENT|Clerk#2|0|second|\n",
                  "3|11|1|1|1|1.0|0.0|0.0|N|O|1996-03-13|1996-02-12|1996-03-22|NONE|MAIL|a|\n"
                  "9|12|1|1|1|1.0|0.0|0.0|N|O|1996-03-13|1996-02-12|1996-03-22|NONE|MAIL|b|\n"
                  "3|13|1|2|1|1.0|0.0|0.0|N|O|1996-03-13|1996-02-12|1996-03-22|NONE|MAIL|c|\n",
                  "41|\n42|\n");
    auto sets = load_refresh_sets(refresh_dir(), 1);
    ASSERT_EQ(sets.size(), 1u);
    const auto& set = sets[0];

    ASSERT_EQ(set.rf1.size(), 2u);
    EXPECT_EQ(set.rf1[0].order, "9|100|O|10.00|1996-01-02|5-LOW|Clerk#1|0|first");
    ASSERT_EQ(set.rf1[0].lineitems.size(), 1u);
    EXPECT_EQ(set.rf1[0].lineitems[0].back(), 'b');
    EXPECT_EQ(set.rf1[1].order.substr(0, 2), "3|");
    ASSERT_EQ(set.rf1[1].lineitems.size(), 2u);
    EXPECT_EQ(set.rf1[1].lineitems[0].back(), 'a');
    EXPECT_EQ(set.rf1[1].lineitems[1].back(), 'c');

    ASSERT_EQ(set.rf2.size(), 2u);
    EXPECT_EQ(set.rf2[0], "41");
    EXPECT_EQ(set.rf2[1], "42");
}

TEST_F(WorkloadLoaderTest, LoadsEveryRequestedSet) {
    write_refresh(1, "1|a|\n", "1|x|\n", "5|\n");
    write_refresh(2, "2|b|\n", "2|y|\n", "6|\n");
    write_refresh(3, "3|c|\n", "3|z|\n", "7|\n");
    auto sets = load_refresh_sets(refresh_dir(), 3);
    ASSERT_EQ(sets.size(), 3u);
    EXPECT_EQ(sets[2].rf1[0].order, "3|c");
    EXPECT_EQ(sets[2].rf2[0], "7");
}

TEST_F(WorkloadLoaderTest, OrphanLineitemIsRejected) {
    write_refresh(1, "1|a|\n", "2|x|\n", "5|\n");
    EXPECT_THROW(load_refresh_sets(refresh_dir(), 1), core::InvalidArgumentError);
}

TEST_F(WorkloadLoaderTest, MissingRefreshFile) {
    write_refresh(1, "1|a|\n", "1|x|\n", "5|\n");
    EXPECT_THROW(load_refresh_sets(refresh_dir(), 2), core::NotFoundError);
}

TEST(TrimRowTest, StripsLineEndingAndOneDelimiter) {
    EXPECT_EQ(TrimRow("1|2|\r\n"), "1|2");
    EXPECT_EQ(TrimRow("1|2"), "1|2");
    EXPECT_EQ(TrimRow("1||"), "1|");
    EXPECT_EQ(TrimRow(""), "");
}

} // namespace
} // namespace workload
} // namespace tpch
