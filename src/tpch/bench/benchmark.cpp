#include "tpch/bench/benchmark.h"
#include "tpch/bench/metrics.h"
#include "tpch/common/logger.h"
#include "tpch/core/error.h"
#include "tpch/core/stream_orders.h"

#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <variant>

namespace tpch {
namespace bench {

Benchmark::Benchmark(const core::BenchmarkConfig& config,
                     Workload workload,
                     std::shared_ptr<client::ConnectionFactory> factory)
    : config_(config), factory_(std::move(factory)) {
    if (!factory_) {
        throw core::InvalidArgumentError("benchmark requires a connection factory");
    }
    if (!(config_.scale_factor > 0.0)) {
        throw core::InvalidArgumentError("scale factor must be positive");
    }
    if (config_.query_streams == 0) {
        throw core::InvalidArgumentError("at least one throughput stream is required");
    }
    if (workload.replicas.empty()) {
        throw core::InvalidArgumentError("at least one replica is required");
    }
    if (workload.queries.size() != core::kNumQueries) {
        throw core::InvalidArgumentError("expected 22 queries, got " + std::to_string(workload.queries.size()));
    }
    core::ValidateRoutingTable(workload.routes, workload.replicas);

    const size_t n = config_.query_streams;
    if (workload.refresh_sets.size() < n + 1) {
        throw core::InvalidArgumentError("need " + std::to_string(n + 1) + " refresh sets for " +
                                         std::to_string(n) + " streams, got " +
                                         std::to_string(workload.refresh_sets.size()));
    }

    QueryStreamOptions power;
    power.mode = core::StreamMode::POWER;
    power.stream = 0;
    power.order = core::StreamOrderFor(0);
    power.replicas = workload.replicas;
    power.queries = workload.queries;
    power.routes = workload.routes;
    power.refresh_sets = {workload.refresh_sets[0]};
    power.refresh_pairs = 1;
    power.power_refresh_placement = config_.power_refresh_placement;
    power_stream_ = std::make_shared<QueryStream>(std::move(power), factory_);

    for (size_t i = 1; i <= n; ++i) {
        QueryStreamOptions throughput;
        throughput.mode = core::StreamMode::THROUGHPUT;
        throughput.stream = static_cast<int>(i);
        throughput.order = core::StreamOrderFor(i);
        throughput.replicas = workload.replicas;
        throughput.queries = workload.queries;
        throughput.routes = workload.routes;
        throughput.refresh_pairs = 0;
        throughput_streams_.push_back(std::make_shared<QueryStream>(std::move(throughput), factory_));
    }

    QueryStreamOptions refresh;
    refresh.mode = core::StreamMode::REFRESH;
    refresh.stream = static_cast<int>(n + 1);
    refresh.replicas = workload.replicas;
    refresh.routes = workload.routes;
    refresh.refresh_sets.assign(workload.refresh_sets.begin() + 1, workload.refresh_sets.begin() + 1 + n);
    refresh.refresh_pairs = n;
    refresh_stream_ = std::make_shared<QueryStream>(std::move(refresh), factory_);
}

Benchmark::~Benchmark() = default;

core::Result<std::unique_ptr<Benchmark>> Benchmark::Create(const core::BenchmarkConfig& config,
                                                           Workload workload,
                                                           std::shared_ptr<client::ConnectionFactory> factory) {
    try {
        return core::Result<std::unique_ptr<Benchmark>>(
            std::make_unique<Benchmark>(config, std::move(workload), std::move(factory)));
    } catch (const core::Error& e) {
        return core::Result<std::unique_ptr<Benchmark>>(e);
    }
}

core::Result<void> Benchmark::run_power_test() {
    if (power_done_ || power_stream_->state() != QueryStream::State::IDLE) {
        return core::Result<void>::error("power test has already run", core::Error::Code::INTERNAL);
    }
    TPCH_INFO("starting power test...");
    auto samples = run_phase({power_stream_}, "power test");
    if (!samples.ok()) {
        return core::Result<void>::error(samples.error(), samples.error_code());
    }
    power_sample_ = samples.value().front();
    power_done_ = true;
    TPCH_INFO("power test finished");
    return core::Result<void>();
}

core::Result<void> Benchmark::run_throughput_test() {
    if (!power_done_) {
        return core::Result<void>::error("throughput test requires a completed power test",
                                         core::Error::Code::INTERNAL);
    }
    if (throughput_done_ || refresh_stream_->state() != QueryStream::State::IDLE) {
        return core::Result<void>::error("throughput test has already run", core::Error::Code::INTERNAL);
    }
    TPCH_INFO("starting throughput test with {} query streams...", throughput_streams_.size());

    std::vector<std::shared_ptr<QueryStream>> streams(throughput_streams_);
    streams.push_back(refresh_stream_);
    auto samples = run_phase(streams, "throughput test");
    if (!samples.ok()) {
        return core::Result<void>::error(samples.error(), samples.error_code());
    }
    throughput_samples_ = samples.take_value();
    throughput_done_ = true;
    TPCH_INFO("throughput test finished");
    return core::Result<void>();
}

core::Result<core::Metrics> Benchmark::results() const {
    if (!power_done_ || !throughput_done_) {
        return core::Result<core::Metrics>::error("metrics need a completed power test and throughput test",
                                                  core::Error::Code::INTERNAL);
    }
    return metrics::Compute(*power_sample_, throughput_samples_, config_);
}

core::Result<std::vector<core::TimingSample>> Benchmark::run_phase(
    const std::vector<std::shared_ptr<QueryStream>>& streams, const char* phase) {
    using PhaseResult = core::Result<std::vector<core::TimingSample>>;

    auto channel = std::make_shared<Channel>();
    std::vector<std::thread> units;
    units.reserve(streams.size());

    try {
        for (const auto& stream : streams) {
            units.emplace_back([stream, channel]() {
                try {
                    stream->run(*channel);
                } catch (const core::Error& e) {
                    channel->send(core::UnitFailure{stream->name(), e.code(), e.what()});
                }
            });
        }
    } catch (const std::system_error& e) {
        for (auto& unit : units) {
            unit.join();
        }
        return PhaseResult::error(std::string(phase) + ": cannot start execution unit: " + e.what(),
                                  core::Error::Code::INTERNAL);
    }

    std::optional<core::TimePoint> deadline;
    if (config_.unit_timeout) {
        deadline = core::Clock::now() + *config_.unit_timeout;
    }

    std::vector<core::TimingSample> samples;
    std::vector<core::UnitFailure> failures;
    for (size_t received = 0; received < streams.size(); ++received) {
        std::optional<core::UnitMessage> message;
        if (deadline) {
            message = channel->receive_until(*deadline);
        } else {
            message = channel->receive();
        }

        if (!message) {
            std::string missing;
            for (size_t i = 0; i < streams.size(); ++i) {
                if (streams[i]->state() == QueryStream::State::FINALIZED) {
                    units[i].join();
                } else {
                    missing += (missing.empty() ? "" : ", ") + streams[i]->name();
                    units[i].detach();
                }
            }
            TPCH_ERROR("{} timed out after {}ms waiting for: {}", phase, config_.unit_timeout->count(), missing);
            return PhaseResult::error(std::string(phase) + " timed out waiting for: " + missing,
                                      core::Error::Code::TIMEOUT);
        }

        ++messages_drained_;
        if (auto* failure = std::get_if<core::UnitFailure>(&*message)) {
            failures.push_back(*failure);
        } else {
            samples.push_back(std::get<core::TimingSample>(*message));
        }
    }

    for (auto& unit : units) {
        unit.join();
    }

    if (!failures.empty()) {
        std::string reason;
        for (const auto& failure : failures) {
            TPCH_ERROR("{}: {}", phase, failure.to_string());
            reason += (reason.empty() ? "" : "; ") + failure.to_string();
        }
        return PhaseResult::error(std::string(phase) + " failed: " + reason, failures.front().code);
    }
    return PhaseResult(std::move(samples));
}

} // namespace bench
} // namespace tpch
