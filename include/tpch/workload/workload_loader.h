#ifndef TPCH_WORKLOAD_WORKLOAD_LOADER_H_
#define TPCH_WORKLOAD_WORKLOAD_LOADER_H_

#include <string>
#include <vector>

#include "tpch/core/types.h"

namespace tpch {
namespace workload {

/**
 * @brief Read dir/1.sql ... dir/22.sql; element i holds query i + 1
 */
std::vector<std::string> load_queries(const std::string& dir);

/**
 * @brief Read `count` refresh sets generated by dbgen.
 *
 * Set i (0-based) comes from orders.tbl.u<i+1>, lineitem.tbl.u<i+1> and
 * delete.<i+1>. Line items are attached to their order by order key and the
 * orders keep their file order. Throws NotFoundError for a missing file and
 * InvalidArgumentError for a line item without its order.
 */
std::vector<core::RefreshSet> load_refresh_sets(const std::string& dir, size_t count);

/**
 * @brief Strip line endings and one trailing '|' from a generator row
 */
std::string TrimRow(const std::string& row);

} // namespace workload
} // namespace tpch

#endif // TPCH_WORKLOAD_WORKLOAD_LOADER_H_
