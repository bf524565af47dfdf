#ifndef TPCH_REPORT_JSON_REPORT_H_
#define TPCH_REPORT_JSON_REPORT_H_

#include <cstdint>
#include <string>
#include <vector>

#include "tpch/core/result.h"
#include "tpch/core/types.h"

namespace tpch {
namespace report {

/**
 * @brief Render the benchmark outcome as a JSON document.
 *
 * Top level: scale_factor, query_streams, power_at_size,
 * throughput_at_size, qphh_at_size, power (per-query and per-refresh
 * seconds of the power test) and streams (one entry per throughput-phase
 * sample with its mode and elapsed seconds).
 */
std::string to_json(const core::Metrics& metrics,
                    const core::TimingSample& power_sample,
                    const std::vector<core::TimingSample>& throughput_samples,
                    uint32_t query_streams);

/**
 * @brief Write to_json() to a file
 */
core::Result<void> write_json(const std::string& path,
                              const core::Metrics& metrics,
                              const core::TimingSample& power_sample,
                              const std::vector<core::TimingSample>& throughput_samples,
                              uint32_t query_streams);

} // namespace report
} // namespace tpch

#endif // TPCH_REPORT_JSON_REPORT_H_
