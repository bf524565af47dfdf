#ifndef TPCH_BENCH_BENCHMARK_H_
#define TPCH_BENCH_BENCHMARK_H_

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tpch/bench/query_stream.h"
#include "tpch/bench/result_channel.h"
#include "tpch/client/connection.h"
#include "tpch/core/config.h"
#include "tpch/core/result.h"
#include "tpch/core/types.h"

namespace tpch {
namespace bench {

/**
 * @brief Inputs prepared outside the timed regions
 */
struct Workload {
    std::vector<core::Replica> replicas;
    core::RoutingTable routes;
    std::vector<std::string> queries;            // canonical order
    std::vector<core::RefreshSet> refresh_sets;  // set 0 power, set k + 1 refresh repetition k
};

/**
 * @brief TPC-H benchmark orchestrator.
 *
 * Owns one power stream, N throughput streams and one refresh stream. The
 * power test runs the power stream alone; the throughput test runs the N
 * throughput streams and the refresh stream as concurrent threads and
 * drains exactly N + 1 messages from the shared result channel. Metrics are
 * available once both phases succeeded.
 */
class Benchmark {
public:
    /**
     * @brief Build and validate every stream; throws InvalidArgumentError
     */
    Benchmark(const core::BenchmarkConfig& config,
              Workload workload,
              std::shared_ptr<client::ConnectionFactory> factory);

    ~Benchmark();

    // Disable copy
    Benchmark(const Benchmark&) = delete;
    Benchmark& operator=(const Benchmark&) = delete;

    /**
     * @brief Build a benchmark, reporting invalid input as an error result
     */
    static core::Result<std::unique_ptr<Benchmark>> Create(const core::BenchmarkConfig& config,
                                                           Workload workload,
                                                           std::shared_ptr<client::ConnectionFactory> factory);

    /**
     * @brief Run the power stream on its own
     */
    core::Result<void> run_power_test();

    /**
     * @brief Run the throughput streams and the refresh stream concurrently.
     *        Requires a successful power test.
     */
    core::Result<void> run_throughput_test();

    /**
     * @brief Power@Size, Throughput@Size and QphH@Size; an error until both tests succeeded
     */
    core::Result<core::Metrics> results() const;

    const core::BenchmarkConfig& config() const { return config_; }
    const std::optional<core::TimingSample>& power_sample() const { return power_sample_; }
    const std::vector<core::TimingSample>& throughput_samples() const { return throughput_samples_; }

    /**
     * @brief Total messages taken off the result channels so far
     */
    size_t messages_drained() const { return messages_drained_; }

private:
    using Channel = ResultChannel<core::UnitMessage>;

    // Start every stream on its own thread and drain one message per stream
    core::Result<std::vector<core::TimingSample>> run_phase(
        const std::vector<std::shared_ptr<QueryStream>>& streams, const char* phase);

    core::BenchmarkConfig config_;
    std::shared_ptr<client::ConnectionFactory> factory_;

    std::shared_ptr<QueryStream> power_stream_;
    std::vector<std::shared_ptr<QueryStream>> throughput_streams_;
    std::shared_ptr<QueryStream> refresh_stream_;

    std::optional<core::TimingSample> power_sample_;
    std::vector<core::TimingSample> throughput_samples_;
    bool power_done_ = false;
    bool throughput_done_ = false;
    size_t messages_drained_ = 0;
};

} // namespace bench
} // namespace tpch

#endif // TPCH_BENCH_BENCHMARK_H_
