#include "tpch/bench/query_stream.h"
#include "tpch/common/logger.h"
#include "tpch/core/error.h"

#include <algorithm>
#include <optional>
#include <system_error>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace tpch {
namespace bench {

namespace {

std::string StreamName(core::StreamMode mode, int stream) {
    switch (mode) {
        case core::StreamMode::POWER:
            return "power stream";
        case core::StreamMode::THROUGHPUT:
            return "throughput stream " + std::to_string(stream);
        case core::StreamMode::REFRESH:
            return "refresh stream";
    }
    return "stream " + std::to_string(stream);
}

using RefreshOutcome = std::variant<core::Interval, core::UnitFailure>;

} // namespace

QueryStream::QueryStream(QueryStreamOptions options, std::shared_ptr<client::ConnectionFactory> factory)
    : options_(std::move(options)),
      factory_(std::move(factory)),
      name_(StreamName(options_.mode, options_.stream)) {
    if (!factory_) {
        throw core::InvalidArgumentError(name_ + ": no connection factory");
    }
    if (options_.replicas.empty()) {
        throw core::InvalidArgumentError(name_ + ": no replicas");
    }
    if (options_.mode != core::StreamMode::REFRESH) {
        if (!core::IsValidStreamOrder(options_.order)) {
            throw core::InvalidArgumentError(name_ + ": query order is not a permutation of 1..22");
        }
        if (options_.queries.size() != core::kNumQueries) {
            throw core::InvalidArgumentError(name_ + ": expected 22 queries, got " +
                                             std::to_string(options_.queries.size()));
        }
        core::ValidateRoutingTable(options_.routes, options_.replicas);
    }
    if (options_.mode == core::StreamMode::POWER && options_.refresh_pairs != 1) {
        throw core::InvalidArgumentError(name_ + ": the power stream runs exactly one refresh pair");
    }
    if (options_.refresh_sets.size() < options_.refresh_pairs) {
        throw core::InvalidArgumentError(name_ + ": " + std::to_string(options_.refresh_pairs) +
                                         " refresh pairs need as many refresh sets, got " +
                                         std::to_string(options_.refresh_sets.size()));
    }

    refresh_pairs_.resize(options_.refresh_pairs);
    for (size_t i = 0; i < options_.refresh_pairs; ++i) {
        refresh_pairs_[i].reserve(options_.replicas.size());
        for (const auto& replica : options_.replicas) {
            refresh_pairs_[i].emplace_back(options_.refresh_sets[i], replica, factory_);
        }
    }

    sample_.mode = options_.mode;
    sample_.stream = options_.stream;
}

void QueryStream::run(ResultChannel<core::UnitMessage>& channel) {
    State expected = State::IDLE;
    if (!state_.compare_exchange_strong(expected, State::RUNNING)) {
        throw core::InternalError(name_ + " has already run");
    }
    TPCH_DEBUG("{} starting", name_);

    try {
        switch (options_.mode) {
            case core::StreamMode::POWER:
                run_power();
                break;
            case core::StreamMode::THROUGHPUT:
                run_throughput();
                break;
            case core::StreamMode::REFRESH:
                run_refresh();
                break;
        }
    } catch (const core::Error& e) {
        close_connections();
        state_ = State::FINALIZED;
        TPCH_ERROR("{} failed: {}", name_, e.what());
        channel.send(core::UnitFailure{name_, e.code(), e.what()});
        return;
    } catch (const std::exception& e) {
        close_connections();
        state_ = State::FINALIZED;
        TPCH_ERROR("{} failed: {}", name_, e.what());
        channel.send(core::UnitFailure{name_, core::Error::Code::UNKNOWN, e.what()});
        return;
    }

    close_connections();
    state_ = State::FINALIZED;
    TPCH_DEBUG("{} finished", name_);
    channel.send(sample_);
}

void QueryStream::run_power() {
    open_query_connections();
    run_refresh_function_1(0);
    if (options_.power_refresh_placement == core::PowerRefreshPlacement::BEFORE_QUERIES) {
        run_refresh_function_2(0);
        run_query_set();
    } else {
        run_query_set();
        run_refresh_function_2(0);
    }
}

void QueryStream::run_throughput() {
    open_query_connections();
    run_query_set();
}

void QueryStream::run_refresh() {
    for (size_t i = 0; i < options_.refresh_pairs; ++i) {
        run_refresh_function_1(i);
        run_refresh_function_2(i);
    }
}

void QueryStream::run_query_set() {
    for (int query : options_.order) {
        const size_t index = static_cast<size_t>(query - 1);
        client::Connection& conn = connection_for(options_.routes[index]);

        auto tic = core::Clock::now();
        conn.execute(options_.queries[index]);
        auto toc = core::Clock::now();

        core::Seconds elapsed = toc - tic;
        sample_.query_times[index] = elapsed;
        TPCH_DEBUG("QS{}:Q{} : {:.2f}s", options_.stream, query, elapsed.count());
    }
}

void QueryStream::run_refresh_function_1(size_t repetition) {
    TPCH_DEBUG("starting refresh function #1 in query stream {}:I{}", options_.stream, repetition);
    core::Interval interval = run_on_all_replicas(repetition, 1);
    TPCH_DEBUG("QS{}:I{}:RF1 : {:.2f}s", options_.stream, repetition, interval.elapsed().count());
    if (!sample_.start) {
        sample_.start = interval.start;
    }
    sample_.refresh_times[0] = interval.elapsed();
}

void QueryStream::run_refresh_function_2(size_t repetition) {
    TPCH_DEBUG("starting refresh function #2 in query stream {}:I{}", options_.stream, repetition);
    core::Interval interval = run_on_all_replicas(repetition, 2);
    TPCH_DEBUG("QS{}:I{}:RF2 : {:.2f}s", options_.stream, repetition, interval.elapsed().count());
    sample_.end = interval.end;
    sample_.refresh_times[1] = interval.elapsed();
}

core::Interval QueryStream::run_on_all_replicas(size_t repetition, int function) {
    const auto& pairs = refresh_pairs_[repetition];
    ResultChannel<RefreshOutcome> outcomes;
    std::vector<std::thread> units;
    units.reserve(pairs.size());

    auto join_all = [&units]() {
        for (auto& unit : units) {
            if (unit.joinable()) {
                unit.join();
            }
        }
    };

    try {
        for (const auto& pair : pairs) {
            std::string unit_name = name_ + " RF" + std::to_string(function) + " replica " +
                                    std::to_string(pair.replica().id());
            units.emplace_back([&outcomes, &pair, function, unit_name]() {
                try {
                    if (function == 1) {
                        outcomes.send(pair.run_refresh_function_1());
                    } else {
                        outcomes.send(pair.run_refresh_function_2());
                    }
                } catch (const core::Error& e) {
                    outcomes.send(core::UnitFailure{unit_name, e.code(), e.what()});
                } catch (const std::exception& e) {
                    outcomes.send(core::UnitFailure{unit_name, core::Error::Code::UNKNOWN, e.what()});
                }
            });
        }
    } catch (const std::system_error& e) {
        join_all();
        throw core::InternalError(name_ + ": cannot start refresh unit: " + e.what());
    }
    join_all();

    std::optional<core::Interval> combined;
    std::optional<core::UnitFailure> failure;
    for (size_t i = 0; i < units.size(); ++i) {
        RefreshOutcome outcome = outcomes.receive();
        if (auto* failed = std::get_if<core::UnitFailure>(&outcome)) {
            if (!failure) {
                failure = *failed;
            }
            continue;
        }
        const auto& interval = std::get<core::Interval>(outcome);
        if (!combined) {
            combined = interval;
        } else {
            combined->start = std::min(combined->start, interval.start);
            combined->end = std::max(combined->end, interval.end);
        }
    }

    if (failure) {
        throw core::Error(failure->to_string(), failure->code);
    }
    return *combined;
}

void QueryStream::open_query_connections() {
    for (int replica_id : options_.routes) {
        if (connections_.count(replica_id) != 0) {
            continue;
        }
        auto it = std::find_if(options_.replicas.begin(), options_.replicas.end(),
                               [replica_id](const core::Replica& r) { return r.id() == replica_id; });
        connections_[replica_id] = factory_->open(*it);
    }
}

client::Connection& QueryStream::connection_for(int replica_id) {
    auto it = connections_.find(replica_id);
    if (it == connections_.end()) {
        throw core::InternalError(name_ + ": no connection to replica " + std::to_string(replica_id));
    }
    return *it->second;
}

void QueryStream::close_connections() noexcept {
    for (auto& entry : connections_) {
        entry.second->close();
    }
    connections_.clear();
}

} // namespace bench
} // namespace tpch
