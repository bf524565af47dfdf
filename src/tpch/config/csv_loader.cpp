#include "tpch/config/csv_loader.h"
#include "tpch/core/error.h"

#include <cctype>
#include <fstream>
#include <map>
#include <sstream>
#include <utility>

namespace tpch {
namespace config {

namespace {

std::string Trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::vector<std::string> SplitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream in(line);
    std::string field;
    while (std::getline(in, field, ',')) {
        fields.push_back(Trim(field));
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

int ParseInt(const std::string& text, const std::string& where) {
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::exception&) {
        throw core::InvalidArgumentError(where + ": '" + text + "' is not an integer");
    }
    if (used != text.size()) {
        throw core::InvalidArgumentError(where + ": '" + text + "' is not an integer");
    }
    return value;
}

std::ifstream OpenFile(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw core::NotFoundError(std::string("cannot open ") + what + " file: " + path);
    }
    return in;
}

std::string Location(const std::string& path, size_t line) {
    return path + ":" + std::to_string(line);
}

} // namespace

std::vector<core::Replica> load_replicas(const std::string& path) {
    std::ifstream in = OpenFile(path, "replica");
    std::vector<core::Replica> replicas;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = Trim(line);
        if (line.empty()) {
            continue;
        }
        auto fields = SplitFields(line);
        if (fields.size() < 5 || fields.size() > 6) {
            throw core::InvalidArgumentError(Location(path, line_no) +
                                             ": expected id,host,port,dbname,user[,password]");
        }
        const int id = ParseInt(fields[0], Location(path, line_no));
        replicas.emplace_back(id, fields[1], fields[2], fields[3], fields[4],
                              fields.size() == 6 ? fields[5] : std::string());
    }
    if (replicas.empty()) {
        throw core::InvalidArgumentError("no replicas in " + path);
    }
    return replicas;
}

core::RoutingTable load_routes(const std::string& path) {
    std::ifstream in = OpenFile(path, "routing table");
    std::string line;
    if (!std::getline(in, line)) {
        throw core::InvalidArgumentError("routing table " + path + " is empty");
    }
    core::RoutingTable routes;
    for (const auto& field : SplitFields(Trim(line))) {
        routes.push_back(ParseInt(field, Location(path, 1)));
    }
    if (routes.size() != core::kNumQueries) {
        throw core::InvalidArgumentError("routing table " + path + " has " + std::to_string(routes.size()) +
                                         " entries, expected " + std::to_string(core::kNumQueries));
    }
    return routes;
}

std::vector<core::IndexSpec> load_index_config(const std::string& path, size_t num_replicas) {
    std::ifstream in = OpenFile(path, "index configuration");
    std::vector<core::IndexSpec> specs;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = Trim(line);
        if (line.empty()) {
            continue;
        }
        auto fields = SplitFields(line);
        if (fields.size() < 2) {
            throw core::InvalidArgumentError(Location(path, line_no) + ": expected replica,column[,column...]");
        }
        core::IndexSpec spec;
        spec.replica = ParseInt(fields[0], Location(path, line_no));
        if (spec.replica < 0 || static_cast<size_t>(spec.replica) >= num_replicas) {
            throw core::InvalidArgumentError(Location(path, line_no) + ": replica " + fields[0] +
                                             " is out of range");
        }
        spec.columns.assign(fields.begin() + 1, fields.end());
        spec.table = table_from_column(spec.columns.front());
        specs.push_back(std::move(spec));
    }
    return specs;
}

std::string table_from_column(const std::string& column) {
    static const std::map<std::string, std::string> kPrefixes = {
        {"l", "LINEITEM"},
        {"p", "PART"},
        {"ps", "PARTSUPP"},
        {"o", "ORDERS"},
        {"c", "CUSTOMER"},
        {"n", "NATION"},
        {"r", "REGION"},
        {"s", "SUPPLIER"},
    };
    std::string prefix = column.substr(0, column.find('_'));
    for (auto& c : prefix) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    auto it = kPrefixes.find(prefix);
    if (it == kPrefixes.end()) {
        throw core::InvalidArgumentError("column '" + column + "' has no known table prefix");
    }
    return it->second;
}

uint32_t default_query_streams(double scale_factor) {
    static const std::pair<double, uint32_t> kMinimumStreams[] = {
        {10, 2}, {30, 3}, {100, 4}, {300, 5}, {1000, 6},
        {3000, 7}, {10000, 8}, {30000, 9}, {100000, 10},
    };
    for (const auto& entry : kMinimumStreams) {
        if (scale_factor < entry.first) {
            return entry.second;
        }
    }
    return 11;
}

} // namespace config
} // namespace tpch
