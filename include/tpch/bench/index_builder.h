#ifndef TPCH_BENCH_INDEX_BUILDER_H_
#define TPCH_BENCH_INDEX_BUILDER_H_

#include <memory>
#include <string>
#include <vector>

#include "tpch/client/connection.h"
#include "tpch/core/result.h"
#include "tpch/core/types.h"

namespace tpch {
namespace bench {

/**
 * @brief Creates the configured secondary indexes before the power test.
 *
 * IndexSpec::replica is the replica's position in the replica list. Indexes
 * are named idx_1, idx_2, ... in replica order and, within a replica, in
 * configuration order.
 */
class IndexBuilder {
public:
    IndexBuilder(std::vector<core::Replica> replicas, std::shared_ptr<client::ConnectionFactory> factory);

    /**
     * @brief CREATE INDEX statement for the index numbered `number`
     */
    static std::string Render(size_t number, const core::IndexSpec& spec);

    /**
     * @brief Create every index; returns the number created
     */
    core::Result<size_t> create(const std::vector<core::IndexSpec>& specs) const;

private:
    std::vector<core::Replica> replicas_;
    std::shared_ptr<client::ConnectionFactory> factory_;
};

} // namespace bench
} // namespace tpch

#endif // TPCH_BENCH_INDEX_BUILDER_H_
