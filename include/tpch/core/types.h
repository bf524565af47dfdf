#ifndef TPCH_CORE_TYPES_H_
#define TPCH_CORE_TYPES_H_

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "tpch/core/error.h"

namespace tpch {
namespace core {

/**
 * @brief Number of queries in the TPC-H workload
 */
constexpr size_t kNumQueries = 22;

/**
 * @brief Number of refresh functions (RF1, RF2)
 */
constexpr size_t kNumRefreshFunctions = 2;

/**
 * @brief Clock used for every timing interval
 */
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Duration in (fractional) seconds
 */
using Seconds = std::chrono::duration<double>;

/**
 * @brief Identity and connection parameters of one database replica
 */
class Replica {
public:
    Replica() = default;
    Replica(int id, std::string host, std::string port, std::string dbname,
            std::string user, std::string password = "");

    int id() const { return id_; }
    const std::string& host() const { return host_; }
    const std::string& port() const { return port_; }
    const std::string& dbname() const { return dbname_; }
    const std::string& user() const { return user_; }
    const std::string& password() const { return password_; }

    /**
     * @brief libpq keyword/value connection string
     */
    std::string connection_string() const;

    std::string to_string() const;

private:
    int id_ = 0;
    std::string host_;
    std::string port_;
    std::string dbname_;
    std::string user_;
    std::string password_;
};

/**
 * @brief Position i holds the replica id that serves canonical query i + 1
 */
using RoutingTable = std::vector<int>;

/**
 * @brief Execution order of one stream: a permutation of 1..22
 */
using StreamOrder = std::vector<int>;

/**
 * @brief One new order for RF1 with its line items, as '|'-delimited rows
 */
struct Rf1Record {
    std::string order;
    std::vector<std::string> lineitems;
};

/**
 * @brief The RF1 and RF2 data consumed by one refresh-pair repetition
 */
struct RefreshSet {
    std::vector<Rf1Record> rf1;
    std::vector<std::string> rf2;  // order keys
};

/**
 * @brief Secondary index to create on one replica
 */
struct IndexSpec {
    int replica = 0;
    std::string table;
    std::vector<std::string> columns;
};

enum class StreamMode {
    POWER,
    THROUGHPUT,
    REFRESH
};

const char* StreamModeName(StreamMode mode);

/**
 * @brief Wall-clock bounds of one timed operation
 */
struct Interval {
    TimePoint start;
    TimePoint end;

    Seconds elapsed() const { return end - start; }
};

/**
 * @brief Timing data emitted once by a stream when it finishes
 */
struct TimingSample {
    StreamMode mode = StreamMode::THROUGHPUT;
    int stream = 0;
    std::optional<TimePoint> start;
    std::optional<TimePoint> end;
    std::array<std::optional<Seconds>, kNumQueries> query_times{};  // by canonical query number - 1
    std::array<std::optional<Seconds>, kNumRefreshFunctions> refresh_times{};
};

/**
 * @brief Emitted in place of a TimingSample by a unit that failed
 */
struct UnitFailure {
    std::string unit;
    Error::Code code = Error::Code::UNKNOWN;
    std::string message;

    std::string to_string() const;
};

/**
 * @brief The one message every execution unit sends on its result channel
 */
using UnitMessage = std::variant<TimingSample, UnitFailure>;

/**
 * @brief Final benchmark score
 */
struct Metrics {
    double power = 0.0;
    double throughput = 0.0;
    double qphh = 0.0;
    double scale_factor = 0.0;
};

/**
 * @brief Check that a stream order is a permutation of 1..22
 */
bool IsValidStreamOrder(const StreamOrder& order);

/**
 * @brief Throws InvalidArgumentError unless the table has 22 entries that are all known replica ids
 */
void ValidateRoutingTable(const RoutingTable& routes, const std::vector<Replica>& replicas);

} // namespace core
} // namespace tpch

#endif // TPCH_CORE_TYPES_H_
