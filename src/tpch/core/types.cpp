#include "tpch/core/types.h"

#include <algorithm>
#include <set>
#include <sstream>

namespace tpch {
namespace core {

Replica::Replica(int id, std::string host, std::string port, std::string dbname,
                 std::string user, std::string password)
    : id_(id),
      host_(std::move(host)),
      port_(std::move(port)),
      dbname_(std::move(dbname)),
      user_(std::move(user)),
      password_(std::move(password)) {}

std::string Replica::connection_string() const {
    std::ostringstream oss;
    oss << "host=" << host_ << " port=" << port_ << " dbname=" << dbname_ << " user=" << user_;
    if (!password_.empty()) {
        oss << " password=" << password_;
    }
    return oss.str();
}

std::string Replica::to_string() const {
    std::ostringstream oss;
    oss << "replica " << id_ << " (" << user_ << "@" << host_ << ":" << port_ << "/" << dbname_ << ")";
    return oss.str();
}

const char* StreamModeName(StreamMode mode) {
    switch (mode) {
        case StreamMode::POWER: return "power";
        case StreamMode::THROUGHPUT: return "throughput";
        case StreamMode::REFRESH: return "refresh";
    }
    return "unknown";
}

std::string UnitFailure::to_string() const {
    return unit + " failed [" + ErrorCodeName(code) + "]: " + message;
}

bool IsValidStreamOrder(const StreamOrder& order) {
    if (order.size() != kNumQueries) {
        return false;
    }
    std::vector<int> sorted(order);
    std::sort(sorted.begin(), sorted.end());
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (sorted[i] != static_cast<int>(i + 1)) {
            return false;
        }
    }
    return true;
}

void ValidateRoutingTable(const RoutingTable& routes, const std::vector<Replica>& replicas) {
    if (routes.size() != kNumQueries) {
        throw InvalidArgumentError("routing table must have " + std::to_string(kNumQueries) +
                                   " entries, got " + std::to_string(routes.size()));
    }
    std::set<int> ids;
    for (const auto& replica : replicas) {
        if (!ids.insert(replica.id()).second) {
            throw InvalidArgumentError("duplicate replica id " + std::to_string(replica.id()));
        }
    }
    for (size_t i = 0; i < routes.size(); ++i) {
        if (ids.count(routes[i]) == 0) {
            throw InvalidArgumentError("query " + std::to_string(i + 1) +
                                       " is routed to unknown replica " + std::to_string(routes[i]));
        }
    }
}

} // namespace core
} // namespace tpch
