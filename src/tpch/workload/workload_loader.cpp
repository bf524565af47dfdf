#include "tpch/workload/workload_loader.h"
#include "tpch/common/logger.h"
#include "tpch/core/error.h"

#include <fstream>
#include <sstream>
#include <unordered_map>

namespace tpch {
namespace workload {

namespace {

std::string JoinPath(const std::string& dir, const std::string& name) {
    if (dir.empty() || dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

std::ifstream OpenFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw core::NotFoundError("cannot open " + path);
    }
    return in;
}

std::vector<std::string> ReadRows(const std::string& path) {
    std::ifstream in = OpenFile(path);
    std::vector<std::string> rows;
    std::string line;
    while (std::getline(in, line)) {
        line = TrimRow(line);
        if (!line.empty()) {
            rows.push_back(line);
        }
    }
    return rows;
}

std::string KeyOf(const std::string& row) {
    return row.substr(0, row.find('|'));
}

} // namespace

std::string TrimRow(const std::string& row) {
    std::string out(row);
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) {
        out.pop_back();
    }
    if (!out.empty() && out.back() == '|') {
        out.pop_back();
    }
    return out;
}

std::vector<std::string> load_queries(const std::string& dir) {
    TPCH_INFO("reading queries from {}", dir);
    std::vector<std::string> queries;
    queries.reserve(core::kNumQueries);
    for (size_t q = 1; q <= core::kNumQueries; ++q) {
        std::ifstream in = OpenFile(JoinPath(dir, std::to_string(q) + ".sql"));
        std::ostringstream text;
        text << in.rdbuf();
        queries.push_back(text.str());
    }
    return queries;
}

std::vector<core::RefreshSet> load_refresh_sets(const std::string& dir, size_t count) {
    TPCH_INFO("loading {} refresh sets from {}", count, dir);
    std::vector<core::RefreshSet> sets;
    sets.reserve(count);
    for (size_t i = 1; i <= count; ++i) {
        const std::string suffix = std::to_string(i);
        const std::string lineitem_path = JoinPath(dir, "lineitem.tbl.u" + suffix);

        core::RefreshSet set;
        std::unordered_map<std::string, size_t> position;
        for (auto& row : ReadRows(JoinPath(dir, "orders.tbl.u" + suffix))) {
            position[KeyOf(row)] = set.rf1.size();
            set.rf1.push_back(core::Rf1Record{std::move(row), {}});
        }
        for (auto& row : ReadRows(lineitem_path)) {
            auto it = position.find(KeyOf(row));
            if (it == position.end()) {
                throw core::InvalidArgumentError(lineitem_path + ": line item for unknown order " + KeyOf(row));
            }
            set.rf1[it->second].lineitems.push_back(std::move(row));
        }
        for (auto& row : ReadRows(JoinPath(dir, "delete." + suffix))) {
            set.rf2.push_back(std::move(row));
        }
        TPCH_DEBUG("refresh set {}: {} new orders, {} deletes", i, set.rf1.size(), set.rf2.size());
        sets.push_back(std::move(set));
    }
    return sets;
}

} // namespace workload
} // namespace tpch
