#include "tpch/core/stream_orders.h"

#include <array>

namespace tpch {
namespace core {

namespace {

// TPC-H Appendix A, ordering of queries within each query stream
constexpr std::array<std::array<int, kNumQueries>, 21> kStreamOrders = {{
    {14,  2,  9, 20,  6, 17, 18,  8, 21, 13,  3, 22, 16,  4, 11, 15,  1, 10, 19,  5,  7, 12},
    {21,  3, 18,  5, 11,  7,  6, 20, 17, 12, 16, 15, 13, 10,  2,  8, 14, 19,  9, 22,  1,  4},
    { 6, 17, 14, 16, 19, 10,  9,  2, 15,  8,  5, 22, 12,  7, 13, 18,  1,  4, 20,  3, 11, 21},
    { 8,  5,  4,  6, 17,  7,  1, 18, 22, 14,  9, 10, 15, 11, 20,  2, 21, 19, 13, 16, 12,  3},
    { 5, 21, 14, 19, 15, 17, 12,  6,  4,  9,  8, 16, 11,  2, 10, 18,  1, 13,  7, 22,  3, 20},
    {21, 15,  4,  6,  7, 16, 19, 18, 14, 22, 11, 13,  3,  1,  2,  5,  8, 20, 12, 17, 10,  9},
    {10,  3, 15, 13,  6,  8,  9,  7,  4, 11, 22, 18, 12,  1,  5, 16,  2, 14, 19, 20, 17, 21},
    {18,  8, 20, 21,  2,  4, 22, 17,  1, 11,  9, 19,  3, 13,  5,  7, 10, 16,  6, 14, 15, 12},
    {19,  1, 15, 17,  5,  8,  9, 12, 14,  7,  4,  3, 20, 16,  6, 22, 10, 13,  2, 21, 18, 11},
    { 8, 13,  2, 20, 17,  3,  6, 21, 18, 11, 19, 10, 15,  4, 22,  1,  7, 12,  9, 14,  5, 16},
    { 6, 15, 18, 17, 12,  1,  7,  2, 22, 13, 21, 10, 14,  9,  3, 16, 20, 19, 11,  4,  8,  5},
    {15, 14, 18, 17, 10, 20, 16, 11,  1,  8,  4, 22,  5, 12,  3,  9, 21,  2, 13,  6, 19,  7},
    { 1,  7, 16, 17, 18, 22, 12,  6,  8,  9, 11,  4,  2,  5, 20, 21, 13, 10, 19,  3, 14, 15},
    {21, 17,  7,  3,  1, 10, 12, 22,  9, 16,  6, 11,  2,  4,  5, 14,  8, 20, 13, 18, 15, 19},
    { 2,  9,  5,  4, 18,  1, 20, 15, 16, 17,  7, 21, 13, 14, 19,  8, 22, 11, 10,  3, 12,  6},
    {16,  9, 17,  8, 14, 11, 10, 12,  6, 21,  7,  3, 15,  5, 22, 20,  1, 13, 19,  2,  4, 18},
    { 1,  3,  6,  5,  2, 16, 14, 22, 17, 20,  4,  9, 10, 11, 15,  8, 12, 19, 18, 13,  7, 21},
    { 3, 16,  5, 11, 21,  9,  2, 15, 10, 18, 17,  7,  8, 19, 14, 13,  1,  4, 22, 20,  6, 12},
    {14,  4, 13,  5, 21, 11,  8,  6,  3, 17,  2, 20,  1, 19, 10,  9, 12, 18, 15,  7, 22, 16},
    { 4, 12, 22, 14,  5, 15, 16,  2,  8, 10, 17,  9, 21,  7,  3,  6, 13, 18, 11, 20, 19,  1},
    {16, 15, 14, 13,  4, 22, 18, 19,  7,  1, 12, 17,  5, 10, 20,  3,  9, 21, 11,  2,  6,  8},
}};

} // namespace

size_t StreamOrderCount() {
    return kStreamOrders.size();
}

StreamOrder StreamOrderFor(size_t stream) {
    const auto& row = kStreamOrders[stream % kStreamOrders.size()];
    return StreamOrder(row.begin(), row.end());
}

} // namespace core
} // namespace tpch
