#include "tpch/bench/refresh_pair.h"
#include "tpch/common/logger.h"
#include "tpch/core/error.h"

#include <cctype>
#include <utility>

namespace tpch {
namespace bench {

namespace {

constexpr const char* kOrdersTable = "ORDERS";
constexpr const char* kLineitemTable = "LINEITEM";
constexpr const char* kOrdersKey = "O_ORDERKEY";
constexpr const char* kLineitemKey = "L_ORDERKEY";

std::string QuoteLiteral(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted.push_back('\'');
    for (char c : value) {
        if (c == '\'') {
            quoted.push_back('\'');
        }
        quoted.push_back(c);
    }
    quoted.push_back('\'');
    return quoted;
}

} // namespace

std::string InsertStatement::render() const {
    std::string sql = "INSERT INTO " + table + " VALUES (";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            sql += ", ";
        }
        sql += QuoteLiteral(values[i]);
    }
    sql += ")";
    return sql;
}

std::string DeleteStatement::render() const {
    return "DELETE FROM " + table + " WHERE " + key_column + " = " + std::to_string(key);
}

std::vector<std::string> SplitRow(const std::string& row) {
    std::string trimmed = row;
    while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
        trimmed.pop_back();
    }
    if (!trimmed.empty() && trimmed.back() == '|') {
        trimmed.pop_back();
    }

    std::vector<std::string> fields;
    size_t begin = 0;
    while (true) {
        size_t pos = trimmed.find('|', begin);
        if (pos == std::string::npos) {
            fields.push_back(trimmed.substr(begin));
            break;
        }
        fields.push_back(trimmed.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return fields;
}

int64_t ParseOrderKey(const std::string& text) {
    if (text.empty() || text.size() > 18) {
        throw core::InvalidArgumentError("invalid order key '" + text + "'");
    }
    int64_t key = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw core::InvalidArgumentError("invalid order key '" + text + "'");
        }
        key = key * 10 + (c - '0');
    }
    return key;
}

RefreshPair::RefreshPair(const core::RefreshSet& data,
                         core::Replica replica,
                         std::shared_ptr<client::ConnectionFactory> factory)
    : replica_(std::move(replica)),
      factory_(std::move(factory)),
      rf1_statements_(prepare_rf1(data.rf1)),
      rf2_statements_(prepare_rf2(data.rf2)) {
    if (!factory_) {
        throw core::InvalidArgumentError("RefreshPair requires a connection factory");
    }
}

std::vector<InsertStatement> RefreshPair::prepare_rf1(const std::vector<core::Rf1Record>& records) {
    std::vector<InsertStatement> statements;
    for (const auto& record : records) {
        statements.push_back({kOrdersTable, SplitRow(record.order)});
        for (const auto& lineitem : record.lineitems) {
            statements.push_back({kLineitemTable, SplitRow(lineitem)});
        }
    }
    return statements;
}

std::vector<DeleteStatement> RefreshPair::prepare_rf2(const std::vector<std::string>& keys) {
    std::vector<DeleteStatement> statements;
    statements.reserve(keys.size() * 2);
    for (const auto& text : keys) {
        int64_t key = ParseOrderKey(text);
        // child rows first so immediate foreign key checks never fire
        statements.push_back({kLineitemTable, kLineitemKey, key});
        statements.push_back({kOrdersTable, kOrdersKey, key});
    }
    return statements;
}

core::Interval RefreshPair::run_refresh_function_1() const {
    auto conn = factory_->open(replica_);
    core::Interval interval;
    try {
        conn->begin(client::TransactionMode::DEFERRED_CONSTRAINTS);
        interval.start = core::Clock::now();
        for (const auto& statement : rf1_statements_) {
            conn->execute(statement.render());
        }
        conn->commit();
        interval.end = core::Clock::now();
    } catch (const std::exception&) {
        conn->close();
        throw;
    }
    conn->close();
    TPCH_TRACE("RF1 on replica {}: {} inserts in {:.3f}s", replica_.id(), rf1_statements_.size(),
               interval.elapsed().count());
    return interval;
}

core::Interval RefreshPair::run_refresh_function_2() const {
    auto conn = factory_->open(replica_);
    core::Interval interval;
    try {
        interval.start = core::Clock::now();
        for (const auto& statement : rf2_statements_) {
            conn->execute(statement.render());
        }
        interval.end = core::Clock::now();
    } catch (const std::exception&) {
        conn->close();
        throw;
    }
    conn->close();
    TPCH_TRACE("RF2 on replica {}: {} deletes in {:.3f}s", replica_.id(), rf2_statements_.size(),
               interval.elapsed().count());
    return interval;
}

} // namespace bench
} // namespace tpch
