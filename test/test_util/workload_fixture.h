#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tpch/core/types.h"

namespace tpch {
namespace testutil {

// Query i + 1 is "SELECT <i + 1> AS qN" so tests can tell queries apart
inline std::vector<std::string> MakeQueries() {
    std::vector<std::string> queries;
    for (size_t q = 1; q <= core::kNumQueries; ++q) {
        queries.push_back("SELECT " + std::to_string(q) + " AS q" + std::to_string(q));
    }
    return queries;
}

inline std::vector<core::Replica> MakeReplicas(size_t count, int first_id = 0) {
    std::vector<core::Replica> replicas;
    for (size_t i = 0; i < count; ++i) {
        int id = first_id + static_cast<int>(i);
        replicas.emplace_back(id, "db" + std::to_string(id), "5432", "tpch", "bench");
    }
    return replicas;
}

inline core::RoutingTable MakeRoutes(int replica_id) {
    return core::RoutingTable(core::kNumQueries, replica_id);
}

inline std::string OrderRow(int64_t key) {
    return std::to_string(key) + "|36901|O|173665.47|1996-01-02|5-LOW|Clerk#000000951|0|nstructions sleep furiously";
}

inline std::string LineitemRow(int64_t key, int line) {
    return std::to_string(key) + "|155190|7706|" + std::to_string(line) +
           "|17|21168.23|0.04|0.02|N|O|1996-03-13|1996-02-12|1996-03-22|DELIVER IN PERSON|TRUCK|egular courts";
}

// One new order with `lineitems` line items; RF2 deletes the same key
inline core::RefreshSet MakeRefreshSet(int64_t key, int lineitems = 2) {
    core::RefreshSet set;
    core::Rf1Record record;
    record.order = OrderRow(key);
    for (int line = 1; line <= lineitems; ++line) {
        record.lineitems.push_back(LineitemRow(key, line));
    }
    set.rf1.push_back(record);
    set.rf2.push_back(std::to_string(key));
    return set;
}

inline std::vector<core::RefreshSet> MakeRefreshSets(size_t count, int64_t first_key = 1000) {
    std::vector<core::RefreshSet> sets;
    for (size_t i = 0; i < count; ++i) {
        sets.push_back(MakeRefreshSet(first_key + static_cast<int64_t>(i)));
    }
    return sets;
}

} // namespace testutil
} // namespace tpch
