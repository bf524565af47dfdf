#ifndef TPCH_BENCH_REFRESH_PAIR_H_
#define TPCH_BENCH_REFRESH_PAIR_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "tpch/client/connection.h"
#include "tpch/core/types.h"

namespace tpch {
namespace bench {

/**
 * @brief INSERT of one generator row, kept structured until execution
 */
struct InsertStatement {
    std::string table;
    std::vector<std::string> values;

    /**
     * @brief Render as SQL; every value becomes a quoted literal
     */
    std::string render() const;
};

/**
 * @brief DELETE of every row of a table whose key column equals key
 */
struct DeleteStatement {
    std::string table;
    std::string key_column;
    int64_t key = 0;

    std::string render() const;
};

/**
 * @brief Split a '|'-delimited generator row; a trailing delimiter is ignored
 */
std::vector<std::string> SplitRow(const std::string& row);

/**
 * @brief Parse an order key; throws InvalidArgumentError unless it is a non-negative integer
 */
int64_t ParseOrderKey(const std::string& text);

/**
 * @brief The two refresh functions of one repetition, bound to one replica.
 *
 * All statements are prepared at construction so the timed regions only
 * execute them. RF1 inserts each order before its line items inside one
 * transaction with deferred constraint checking. RF2 deletes the line items
 * of a key before the order itself, for every key, and treats absent keys as
 * already deleted.
 */
class RefreshPair {
public:
    RefreshPair(const core::RefreshSet& data,
                core::Replica replica,
                std::shared_ptr<client::ConnectionFactory> factory);

    /**
     * @brief Insert the new orders and line items; times the inserts and the commit
     */
    core::Interval run_refresh_function_1() const;

    /**
     * @brief Delete the old orders and their line items
     */
    core::Interval run_refresh_function_2() const;

    const core::Replica& replica() const { return replica_; }
    const std::vector<InsertStatement>& rf1_statements() const { return rf1_statements_; }
    const std::vector<DeleteStatement>& rf2_statements() const { return rf2_statements_; }

private:
    static std::vector<InsertStatement> prepare_rf1(const std::vector<core::Rf1Record>& records);
    static std::vector<DeleteStatement> prepare_rf2(const std::vector<std::string>& keys);

    core::Replica replica_;
    std::shared_ptr<client::ConnectionFactory> factory_;
    std::vector<InsertStatement> rf1_statements_;
    std::vector<DeleteStatement> rf2_statements_;
};

} // namespace bench
} // namespace tpch

#endif // TPCH_BENCH_REFRESH_PAIR_H_
