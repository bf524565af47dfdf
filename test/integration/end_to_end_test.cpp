#include <gtest/gtest.h>
#include "tpch/bench/benchmark.h"
#include "tpch/bench/index_builder.h"
#include "tpch/common/logger.h"
#include "tpch/config/csv_loader.h"
#include "tpch/workload/workload_loader.h"
#include "test_util/memory_store.h"
#include "test_util/temp_dir.h"
#include "test_util/workload_fixture.h"

#include <cmath>
#include <filesystem>
#include <memory>
#include <string>

namespace tpch {
namespace {

// Lays out a data directory the way the CLI expects it and runs the whole
// benchmark against two in-memory replicas.
class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        common::Logger::Init();
        common::Logger::SetLevel(spdlog::level::warn);

        store_ = std::make_shared<testutil::MemoryStore>();
        factory_ = std::make_shared<testutil::MemoryConnectionFactory>(store_);

        testutil::WriteFile(dir_.path() / "replicas.csv",
                            "0,127.0.0.1,5432,tpch,postgres,postgres\n"
                            "1,127.0.0.1,5433,tpch,postgres,postgres\n");
        testutil::WriteFile(dir_.path() / "routes.csv",
                            "0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0\n");
        testutil::WriteFile(dir_.path() / "config.csv", "0,l_shipdate\n1,o_orderdate,o_custkey\n");

        auto queries = dir_.path() / "data" / "queries";
        std::filesystem::create_directories(queries);
        for (size_t q = 1; q <= core::kNumQueries; ++q) {
            testutil::WriteFile(queries / (std::to_string(q) + ".sql"),
                                "SELECT " + std::to_string(q) + " AS q" + std::to_string(q) + "\n");
        }

        // Set 1 feeds the power stream, set 2 the refresh stream
        auto refresh = dir_.path() / "data" / "refresh";
        std::filesystem::create_directories(refresh);
        for (int set = 1; set <= 2; ++set) {
            const int64_t key = 6000000 + set;
            const std::string n = std::to_string(set);
            testutil::WriteFile(refresh / ("orders.tbl.u" + n), testutil::OrderRow(key) + "|\n");
            testutil::WriteFile(refresh / ("lineitem.tbl.u" + n),
                                testutil::LineitemRow(key, 1) + "|\n" + testutil::LineitemRow(key, 2) + "|\n");
            testutil::WriteFile(refresh / ("delete." + n), std::to_string(key) + "|\n");
        }
    }

    void TearDown() override {
        EXPECT_EQ(store_->open_connections(), 0u);
    }

    testutil::ScopedTestDir dir_{"tpch_end_to_end"};
    std::shared_ptr<testutil::MemoryStore> store_;
    std::shared_ptr<testutil::MemoryConnectionFactory> factory_;
};

TEST_F(EndToEndTest, TwoReplicasOneStream) {
    core::BenchmarkConfig config;
    config.scale_factor = 1.0;
    config.query_streams = 1;

    auto replicas = config::load_replicas(dir_.file("replicas.csv"));
    auto indexes = config::load_index_config(dir_.file("config.csv"), replicas.size());

    bench::Workload workload;
    workload.replicas = replicas;
    workload.routes = config::load_routes(dir_.file("routes.csv"));
    workload.queries = workload::load_queries((dir_.path() / "data" / "queries").string());
    workload.refresh_sets = workload::load_refresh_sets((dir_.path() / "data" / "refresh").string(),
                                                        config.query_streams + 1);

    auto created = bench::IndexBuilder(replicas, factory_).create(indexes);
    ASSERT_TRUE(created.ok()) << created.error();
    EXPECT_EQ(created.value(), 2u);

    auto benchmark = bench::Benchmark::Create(config, std::move(workload), factory_);
    ASSERT_TRUE(benchmark.ok()) << benchmark.error();
    auto bench = benchmark.take_value();

    auto power = bench->run_power_test();
    ASSERT_TRUE(power.ok()) << power.error();
    auto throughput = bench->run_throughput_test();
    ASSERT_TRUE(throughput.ok()) << throughput.error();
    EXPECT_EQ(bench->messages_drained(), 3u);

    auto metrics = bench->results();
    ASSERT_TRUE(metrics.ok()) << metrics.error();
    EXPECT_GT(metrics.value().power, 0.0);
    EXPECT_GT(metrics.value().throughput, 0.0);
    EXPECT_TRUE(std::isfinite(metrics.value().power));
    EXPECT_TRUE(std::isfinite(metrics.value().throughput));
    EXPECT_TRUE(std::isfinite(metrics.value().qphh));
    EXPECT_DOUBLE_EQ(metrics.value().scale_factor, 1.0);

    // Every query ran on replica 0 only: once for power, once for the stream
    size_t queries_0 = 0;
    for (const auto& sql : store_->statements(0)) {
        if (sql.compare(0, 7, "SELECT ") == 0) {
            ++queries_0;
        }
    }
    EXPECT_EQ(queries_0, 2 * core::kNumQueries);
    for (const auto& sql : store_->statements(1)) {
        EXPECT_NE(sql.compare(0, 7, "SELECT "), 0) << sql;
    }

    // Both refresh sets were applied and removed on both replicas
    for (int id : {0, 1}) {
        EXPECT_EQ(store_->commits(id), 2u);
        for (int64_t key : {6000001, 6000002}) {
            EXPECT_FALSE(store_->has_order(id, key));
            EXPECT_EQ(store_->lineitem_count(id, key), 0);
        }
    }
}

} // namespace
} // namespace tpch
