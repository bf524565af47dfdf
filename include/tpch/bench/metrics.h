#ifndef TPCH_BENCH_METRICS_H_
#define TPCH_BENCH_METRICS_H_

#include <cstdint>
#include <vector>

#include "tpch/core/config.h"
#include "tpch/core/result.h"
#include "tpch/core/types.h"

namespace tpch {
namespace bench {
namespace metrics {

/**
 * @brief Power@Size = 3600 * SF / (prod(qi) * prod(ri))^(1/24)
 *
 * Computed in log space so 24 long intervals cannot overflow.
 * Throws InvalidArgumentError unless there are 22 query and 2 refresh
 * intervals, all positive, and SF is positive.
 */
double PowerAtSize(const std::vector<double>& query_seconds,
                   const std::vector<double>& refresh_seconds,
                   double scale_factor);

/**
 * @brief Throughput@Size = streams * 22 * 3600 * SF / elapsed
 */
double ThroughputAtSize(uint32_t streams, double elapsed_seconds, double scale_factor);

/**
 * @brief QphH@Size = sqrt(Power@Size * Throughput@Size)
 */
double QphHAtSize(double power, double throughput);

/**
 * @brief TPC-H 5.4.1.4: when the longest query interval is more than 1000
 *        times the shortest, raise every interval below longest/1000 to it
 */
std::vector<double> ClampShortIntervals(std::vector<double> query_seconds);

/**
 * @brief Elapsed time of the throughput test, max(end) - min(start) over the
 *        samples the window rule selects. Power samples never count.
 */
core::Result<double> ThroughputElapsed(const std::vector<core::TimingSample>& samples,
                                       core::ThroughputWindow window);

/**
 * @brief Reduce the power sample and the throughput-phase samples to the three metrics
 */
core::Result<core::Metrics> Compute(const core::TimingSample& power_sample,
                                    const std::vector<core::TimingSample>& throughput_samples,
                                    const core::BenchmarkConfig& config);

} // namespace metrics
} // namespace bench
} // namespace tpch

#endif // TPCH_BENCH_METRICS_H_
