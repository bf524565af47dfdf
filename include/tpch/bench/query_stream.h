#ifndef TPCH_BENCH_QUERY_STREAM_H_
#define TPCH_BENCH_QUERY_STREAM_H_

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "tpch/bench/refresh_pair.h"
#include "tpch/bench/result_channel.h"
#include "tpch/client/connection.h"
#include "tpch/core/config.h"
#include "tpch/core/types.h"

namespace tpch {
namespace bench {

/**
 * @brief Everything a stream needs to know before it runs
 */
struct QueryStreamOptions {
    core::StreamMode mode = core::StreamMode::THROUGHPUT;
    int stream = 0;                          // stream index: 0 power, 1..N throughput
    core::StreamOrder order;                 // unused for refresh streams
    std::vector<core::Replica> replicas;
    std::vector<std::string> queries;        // canonical order, query i at index i - 1
    core::RoutingTable routes;
    std::vector<core::RefreshSet> refresh_sets;  // one per repetition
    size_t refresh_pairs = 0;                // 1 power, 0 throughput, N refresh
    core::PowerRefreshPlacement power_refresh_placement = core::PowerRefreshPlacement::BEFORE_QUERIES;
};

/**
 * @brief One benchmark stream: 22 queries in a fixed permutation and/or a
 *        number of refresh-pair repetitions.
 *
 * run() sends exactly one message on the channel: the TimingSample when the
 * stream completes, or a UnitFailure naming the stream when any database call
 * fails. All connections the stream opened are closed in both cases.
 */
class QueryStream {
public:
    enum class State {
        IDLE,
        RUNNING,
        FINALIZED
    };

    QueryStream(QueryStreamOptions options, std::shared_ptr<client::ConnectionFactory> factory);

    // Disable copy
    QueryStream(const QueryStream&) = delete;
    QueryStream& operator=(const QueryStream&) = delete;

    /**
     * @brief Run the stream to completion; callable once
     */
    void run(ResultChannel<core::UnitMessage>& channel);

    core::StreamMode mode() const { return options_.mode; }
    int stream() const { return options_.stream; }
    State state() const { return state_.load(); }
    const std::string& name() const { return name_; }

private:
    void run_power();
    void run_throughput();
    void run_refresh();

    void run_query_set();
    void run_refresh_function_1(size_t repetition);
    void run_refresh_function_2(size_t repetition);

    // Runs one refresh function on every replica at once; returns the
    // earliest start and latest end
    core::Interval run_on_all_replicas(size_t repetition, int function);

    void open_query_connections();
    client::Connection& connection_for(int replica_id);
    void close_connections() noexcept;

    QueryStreamOptions options_;
    std::shared_ptr<client::ConnectionFactory> factory_;
    std::string name_;
    std::atomic<State> state_{State::IDLE};

    // refresh_pairs_[repetition][replica position]
    std::vector<std::vector<RefreshPair>> refresh_pairs_;
    std::map<int, std::unique_ptr<client::Connection>> connections_;

    core::TimingSample sample_;
};

} // namespace bench
} // namespace tpch

#endif // TPCH_BENCH_QUERY_STREAM_H_
