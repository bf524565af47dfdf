#ifndef TPCH_CORE_STREAM_ORDERS_H_
#define TPCH_CORE_STREAM_ORDERS_H_

#include <cstddef>

#include "tpch/core/types.h"

namespace tpch {
namespace core {

/**
 * @brief Number of precomputed query orderings (TPC-H Appendix A, streams 0-20)
 */
size_t StreamOrderCount();

/**
 * @brief Query ordering for a stream; index 0 is the power stream.
 *        Indexes beyond the table wrap around modulo StreamOrderCount().
 */
StreamOrder StreamOrderFor(size_t stream);

} // namespace core
} // namespace tpch

#endif // TPCH_CORE_STREAM_ORDERS_H_
