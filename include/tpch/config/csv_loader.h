#ifndef TPCH_CONFIG_CSV_LOADER_H_
#define TPCH_CONFIG_CSV_LOADER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "tpch/core/types.h"

namespace tpch {
namespace config {

/**
 * @brief Read replica connection details.
 *
 * One replica per non-empty line: id,host,port,dbname,user[,password].
 * Throws NotFoundError if the file cannot be opened and InvalidArgumentError
 * on a malformed line.
 */
std::vector<core::Replica> load_replicas(const std::string& path);

/**
 * @brief Read the routing table: 22 comma-separated replica ids on the first line
 */
core::RoutingTable load_routes(const std::string& path);

/**
 * @brief Read the index configuration.
 *
 * One index per non-empty line: replica,column[,column...]. The replica is a
 * position in the replica list. The table comes from the first column's
 * prefix (see table_from_column).
 */
std::vector<core::IndexSpec> load_index_config(const std::string& path, size_t num_replicas);

/**
 * @brief Table owning a TPC-H column, e.g. ps_suppkey -> PARTSUPP
 */
std::string table_from_column(const std::string& column);

/**
 * @brief Minimum number of throughput streams for a scale factor
 */
uint32_t default_query_streams(double scale_factor);

} // namespace config
} // namespace tpch

#endif // TPCH_CONFIG_CSV_LOADER_H_
