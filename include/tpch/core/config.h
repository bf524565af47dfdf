#ifndef TPCH_CORE_CONFIG_H_
#define TPCH_CORE_CONFIG_H_

#include <chrono>
#include <cstdint>
#include <optional>

namespace tpch {
namespace core {

/**
 * @brief Which timing samples bound the throughput test's elapsed time
 */
enum class ThroughputWindow {
    POOLED_NON_POWER,   // min start / max end over every non-power sample
    REFRESH_STREAM_ONLY // min start / max end over refresh samples only
};

/**
 * @brief Where the power stream runs its refresh pair relative to its queries
 */
enum class PowerRefreshPlacement {
    BEFORE_QUERIES,  // RF1, RF2, then Q1..Q22 in stream order
    BRACKET_QUERIES  // RF1, Q1..Q22 in stream order, RF2
};

/**
 * @brief Configuration for one benchmark run
 */
struct BenchmarkConfig {
    double scale_factor;                 // TPC-H scale factor (SF)
    uint32_t query_streams;              // Number of throughput streams (N)
    ThroughputWindow throughput_window;  // Elapsed-time rule for Throughput@Size
    PowerRefreshPlacement power_refresh_placement;
    bool clamp_short_queries;            // Apply TPC-H 5.4.1.4 to power query intervals

    // Deadline for each phase to drain its messages; unset waits forever
    std::optional<std::chrono::milliseconds> unit_timeout;

    BenchmarkConfig()
        : scale_factor(1.0), query_streams(2),
          throughput_window(ThroughputWindow::POOLED_NON_POWER),
          power_refresh_placement(PowerRefreshPlacement::BEFORE_QUERIES),
          clamp_short_queries(false) {}

    static BenchmarkConfig Default() {
        BenchmarkConfig config;
        config.scale_factor = 10.0;
        config.query_streams = 3;        // TPC-H minimum at SF 10
        config.throughput_window = ThroughputWindow::POOLED_NON_POWER;
        config.power_refresh_placement = PowerRefreshPlacement::BEFORE_QUERIES;
        config.clamp_short_queries = false;
        config.unit_timeout = std::nullopt;
        return config;
    }
};

} // namespace core
} // namespace tpch

#endif // TPCH_CORE_CONFIG_H_
