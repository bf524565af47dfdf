#include <chrono>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include "tpch/common/logger.h"
#include <spdlog/spdlog.h>
#include "tpch/bench/benchmark.h"
#include "tpch/bench/index_builder.h"
#include "tpch/client/pg_connection.h"
#include "tpch/config/csv_loader.h"
#include "tpch/core/config.h"
#include "tpch/report/json_report.h"
#include "tpch/workload/workload_loader.h"

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -s, --scale-factor SF       TPC-H scale factor (default: 10)" << std::endl;
    std::cout << "  -d, --data-dir DIR          Directory with queries/ and refresh/ (default: ./data)" << std::endl;
    std::cout << "  -r, --replicas FILE         Replica connection details (default: replicas.csv)" << std::endl;
    std::cout << "  -i, --index-config FILE     Index configuration (default: config.csv)" << std::endl;
    std::cout << "  -t, --routing-table FILE    Query routing table (default: routes.csv)" << std::endl;
    std::cout << "  -q, --query-streams N       Throughput streams (default: TPC-H minimum for SF)" << std::endl;
    std::cout << "  --throughput-window RULE    pooled or refresh (default: pooled)" << std::endl;
    std::cout << "  --refresh-placement MODE    before or bracket (default: before)" << std::endl;
    std::cout << "  --clamp-short-queries       Raise power query times below max/1000" << std::endl;
    std::cout << "  --timeout SECONDS           Give up on a phase after SECONDS" << std::endl;
    std::cout << "  --report FILE               Also write the results as JSON" << std::endl;
    std::cout << "  --log-level LEVEL           Log level (trace, debug, info, warn, error, off)" << std::endl;
    std::cout << "  -v, --verbose               Same as --log-level debug" << std::endl;
    std::cout << "  -h, --help                  Show this help message" << std::endl;
}

void PrintResults(const tpch::core::Metrics& metrics) {
    std::printf("==============================\n");
    std::printf("TPC-H Performance Benchmark Results\n\n");
    std::printf("Power@Size       = %.2f\n", metrics.power);
    std::printf("Throughput@Size  = %.2f\n", metrics.throughput);
    std::printf("QphH@Size        = %.2f\n\n", metrics.qphh);
    std::printf("Scale factor: %g\n", metrics.scale_factor);
    std::printf("==============================\n");
}

} // namespace

int main(int argc, char* argv[]) {
    tpch::common::Logger::Init();

    // Parse command-line arguments
    tpch::core::BenchmarkConfig config = tpch::core::BenchmarkConfig::Default();
    std::string data_dir = "./data";
    std::string replicas_path = "replicas.csv";
    std::string index_config_path = "config.csv";
    std::string routes_path = "routes.csv";
    std::string report_path;
    bool query_streams_set = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if ((arg == "-s" || arg == "--scale-factor") && i + 1 < argc) {
                config.scale_factor = std::stod(argv[++i]);
            } else if ((arg == "-d" || arg == "--data-dir") && i + 1 < argc) {
                data_dir = argv[++i];
            } else if ((arg == "-r" || arg == "--replicas") && i + 1 < argc) {
                replicas_path = argv[++i];
            } else if ((arg == "-i" || arg == "--index-config") && i + 1 < argc) {
                index_config_path = argv[++i];
            } else if ((arg == "-t" || arg == "--routing-table") && i + 1 < argc) {
                routes_path = argv[++i];
            } else if ((arg == "-q" || arg == "--query-streams") && i + 1 < argc) {
                const int streams = std::stoi(argv[++i]);
                if (streams < 1) {
                    std::cerr << "Query streams must be at least 1" << std::endl;
                    return 1;
                }
                config.query_streams = static_cast<uint32_t>(streams);
                query_streams_set = true;
            } else if (arg == "--throughput-window" && i + 1 < argc) {
                std::string rule = argv[++i];
                if (rule == "pooled") config.throughput_window = tpch::core::ThroughputWindow::POOLED_NON_POWER;
                else if (rule == "refresh") config.throughput_window = tpch::core::ThroughputWindow::REFRESH_STREAM_ONLY;
                else {
                    std::cerr << "Unknown throughput window: " << rule << std::endl;
                    return 1;
                }
            } else if (arg == "--refresh-placement" && i + 1 < argc) {
                std::string mode = argv[++i];
                if (mode == "before") config.power_refresh_placement = tpch::core::PowerRefreshPlacement::BEFORE_QUERIES;
                else if (mode == "bracket") config.power_refresh_placement = tpch::core::PowerRefreshPlacement::BRACKET_QUERIES;
                else {
                    std::cerr << "Unknown refresh placement: " << mode << std::endl;
                    return 1;
                }
            } else if (arg == "--clamp-short-queries") {
                config.clamp_short_queries = true;
            } else if (arg == "--timeout" && i + 1 < argc) {
                const double seconds = std::stod(argv[++i]);
                if (!(seconds > 0.0)) {
                    std::cerr << "Timeout must be positive" << std::endl;
                    return 1;
                }
                config.unit_timeout = std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
            } else if (arg == "--report" && i + 1 < argc) {
                report_path = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                std::string level_str = argv[++i];
                if (!tpch::common::Logger::SetLevel(level_str)) {
                    std::cerr << "Unknown log level: " << level_str << ". Using default (info)." << std::endl;
                }
            } else if (arg == "-v" || arg == "--verbose") {
                tpch::common::Logger::SetLevel(spdlog::level::debug);
            } else if (arg == "-h" || arg == "--help") {
                PrintUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                std::cerr << "Use --help for usage information" << std::endl;
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << std::endl;
        return 1;
    }

    if (!query_streams_set) {
        config.query_streams = tpch::config::default_query_streams(config.scale_factor);
    }

    try {
        auto replicas = tpch::config::load_replicas(replicas_path);
        auto indexes = tpch::config::load_index_config(index_config_path, replicas.size());
        auto routes = tpch::config::load_routes(routes_path);

        TPCH_INFO("loading TPC-H workload from {}", data_dir);
        tpch::bench::Workload workload;
        workload.replicas = replicas;
        workload.routes = routes;
        workload.queries = tpch::workload::load_queries(data_dir + "/queries");
        workload.refresh_sets = tpch::workload::load_refresh_sets(data_dir + "/refresh", config.query_streams + 1);

        auto factory = std::make_shared<tpch::client::PgConnectionFactory>();

        auto created = tpch::bench::IndexBuilder(replicas, factory).create(indexes);
        if (!created.ok()) {
            TPCH_ERROR("Failed to create indexes: {}", created.error());
            return 1;
        }

        auto benchmark = tpch::bench::Benchmark::Create(config, std::move(workload), factory);
        if (!benchmark.ok()) {
            TPCH_ERROR("Invalid benchmark setup: {}", benchmark.error());
            return 1;
        }
        auto bench = benchmark.take_value();

        auto power = bench->run_power_test();
        if (!power.ok()) {
            TPCH_ERROR("{}", power.error());
            return 1;
        }
        auto throughput = bench->run_throughput_test();
        if (!throughput.ok()) {
            TPCH_ERROR("{}", throughput.error());
            return 1;
        }
        auto metrics = bench->results();
        if (!metrics.ok()) {
            TPCH_ERROR("Failed to compute metrics: {}", metrics.error());
            return 1;
        }

        PrintResults(metrics.value());

        if (!report_path.empty()) {
            auto written = tpch::report::write_json(report_path, metrics.value(), *bench->power_sample(),
                                                    bench->throughput_samples(), config.query_streams);
            if (!written.ok()) {
                TPCH_ERROR("{}", written.error());
                return 1;
            }
        }
        return 0;
    } catch (const std::exception& e) {
        TPCH_CRITICAL("Fatal error: {}", e.what());
        return 1;
    }
}
