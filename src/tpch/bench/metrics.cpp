#include "tpch/bench/metrics.h"
#include "tpch/core/error.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

namespace tpch {
namespace bench {
namespace metrics {

namespace {

constexpr double kSecondsPerHour = 3600.0;
constexpr double kClampRatio = 1000.0;

void CheckPositive(const std::vector<double>& values, const char* what) {
    for (size_t i = 0; i < values.size(); ++i) {
        if (!(values[i] > 0.0) || !std::isfinite(values[i])) {
            throw core::InvalidArgumentError(std::string(what) + " interval " + std::to_string(i + 1) +
                                             " is not a positive duration");
        }
    }
}

bool InWindow(const core::TimingSample& sample, core::ThroughputWindow window) {
    switch (window) {
        case core::ThroughputWindow::POOLED_NON_POWER:
            return sample.mode != core::StreamMode::POWER;
        case core::ThroughputWindow::REFRESH_STREAM_ONLY:
            return sample.mode == core::StreamMode::REFRESH;
    }
    return false;
}

} // namespace

double PowerAtSize(const std::vector<double>& query_seconds,
                   const std::vector<double>& refresh_seconds,
                   double scale_factor) {
    if (query_seconds.size() != core::kNumQueries) {
        throw core::InvalidArgumentError("Power@Size needs 22 query intervals, got " +
                                         std::to_string(query_seconds.size()));
    }
    if (refresh_seconds.size() != core::kNumRefreshFunctions) {
        throw core::InvalidArgumentError("Power@Size needs 2 refresh intervals, got " +
                                         std::to_string(refresh_seconds.size()));
    }
    if (!(scale_factor > 0.0)) {
        throw core::InvalidArgumentError("scale factor must be positive");
    }
    CheckPositive(query_seconds, "query");
    CheckPositive(refresh_seconds, "refresh");

    double log_sum = 0.0;
    for (double q : query_seconds) {
        log_sum += std::log(q);
    }
    for (double r : refresh_seconds) {
        log_sum += std::log(r);
    }
    const double n = static_cast<double>(core::kNumQueries + core::kNumRefreshFunctions);
    return kSecondsPerHour * scale_factor * std::exp(-log_sum / n);
}

double ThroughputAtSize(uint32_t streams, double elapsed_seconds, double scale_factor) {
    if (streams == 0) {
        throw core::InvalidArgumentError("Throughput@Size needs at least one stream");
    }
    if (!(elapsed_seconds > 0.0)) {
        throw core::InvalidArgumentError("throughput elapsed time must be positive");
    }
    if (!(scale_factor > 0.0)) {
        throw core::InvalidArgumentError("scale factor must be positive");
    }
    return static_cast<double>(streams) * core::kNumQueries * kSecondsPerHour * scale_factor /
           elapsed_seconds;
}

double QphHAtSize(double power, double throughput) {
    return std::sqrt(power * throughput);
}

std::vector<double> ClampShortIntervals(std::vector<double> query_seconds) {
    if (query_seconds.empty()) {
        return query_seconds;
    }
    const auto [min_it, max_it] = std::minmax_element(query_seconds.begin(), query_seconds.end());
    const double longest = *max_it;
    if (*min_it > 0.0 && longest / *min_it <= kClampRatio) {
        return query_seconds;
    }
    const double floor = longest / kClampRatio;
    for (double& q : query_seconds) {
        q = std::max(q, floor);
    }
    return query_seconds;
}

core::Result<double> ThroughputElapsed(const std::vector<core::TimingSample>& samples,
                                       core::ThroughputWindow window) {
    std::optional<core::TimePoint> first;
    std::optional<core::TimePoint> last;
    for (const auto& sample : samples) {
        if (!InWindow(sample, window)) {
            continue;
        }
        if (sample.start && (!first || *sample.start < *first)) {
            first = sample.start;
        }
        if (sample.end && (!last || *sample.end > *last)) {
            last = sample.end;
        }
    }
    if (!first || !last) {
        return core::Result<double>::error("no timing sample bounds the throughput test",
                                           core::Error::Code::INVALID_ARGUMENT);
    }
    return core::Result<double>(core::Seconds(*last - *first).count());
}

core::Result<core::Metrics> Compute(const core::TimingSample& power_sample,
                                    const std::vector<core::TimingSample>& throughput_samples,
                                    const core::BenchmarkConfig& config) {
    std::vector<double> qi;
    std::vector<double> ri;
    for (size_t i = 0; i < power_sample.query_times.size(); ++i) {
        if (!power_sample.query_times[i]) {
            return core::Result<core::Metrics>::error("power test has no timing for Q" + std::to_string(i + 1),
                                                      core::Error::Code::INVALID_ARGUMENT);
        }
        qi.push_back(power_sample.query_times[i]->count());
    }
    for (size_t i = 0; i < power_sample.refresh_times.size(); ++i) {
        if (!power_sample.refresh_times[i]) {
            return core::Result<core::Metrics>::error("power test has no timing for RF" + std::to_string(i + 1),
                                                      core::Error::Code::INVALID_ARGUMENT);
        }
        ri.push_back(power_sample.refresh_times[i]->count());
    }
    if (config.clamp_short_queries) {
        qi = ClampShortIntervals(std::move(qi));
    }

    auto elapsed = ThroughputElapsed(throughput_samples, config.throughput_window);
    if (!elapsed.ok()) {
        return core::Result<core::Metrics>::error(elapsed.error(), elapsed.error_code());
    }

    try {
        core::Metrics m;
        m.scale_factor = config.scale_factor;
        m.power = PowerAtSize(qi, ri, config.scale_factor);
        m.throughput = ThroughputAtSize(config.query_streams, elapsed.value(), config.scale_factor);
        m.qphh = QphHAtSize(m.power, m.throughput);
        return core::Result<core::Metrics>(m);
    } catch (const core::Error& e) {
        return core::Result<core::Metrics>(e);
    }
}

} // namespace metrics
} // namespace bench
} // namespace tpch
