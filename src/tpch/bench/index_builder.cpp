#include "tpch/bench/index_builder.h"
#include "tpch/common/logger.h"
#include "tpch/core/error.h"

#include <memory>
#include <string>
#include <utility>

namespace tpch {
namespace bench {

IndexBuilder::IndexBuilder(std::vector<core::Replica> replicas,
                           std::shared_ptr<client::ConnectionFactory> factory)
    : replicas_(std::move(replicas)), factory_(std::move(factory)) {
    if (!factory_) {
        throw core::InvalidArgumentError("index builder requires a connection factory");
    }
}

std::string IndexBuilder::Render(size_t number, const core::IndexSpec& spec) {
    if (spec.table.empty() || spec.columns.empty()) {
        throw core::InvalidArgumentError("index " + std::to_string(number) + " names no table or columns");
    }
    std::string sql = "CREATE INDEX idx_" + std::to_string(number) + " ON " + spec.table + " (";
    for (size_t i = 0; i < spec.columns.size(); ++i) {
        if (i > 0) {
            sql += ",";
        }
        sql += spec.columns[i];
    }
    sql += ")";
    return sql;
}

core::Result<size_t> IndexBuilder::create(const std::vector<core::IndexSpec>& specs) const {
    for (const auto& spec : specs) {
        if (spec.replica < 0 || static_cast<size_t>(spec.replica) >= replicas_.size()) {
            return core::Result<size_t>::error("index on " + spec.table + " targets unknown replica " +
                                               std::to_string(spec.replica),
                                               core::Error::Code::INVALID_ARGUMENT);
        }
    }

    TPCH_INFO("creating indexes!");
    size_t created = 0;
    for (size_t position = 0; position < replicas_.size(); ++position) {
        std::unique_ptr<client::Connection> conn;
        try {
            for (const auto& spec : specs) {
                if (static_cast<size_t>(spec.replica) != position) {
                    continue;
                }
                if (!conn) {
                    conn = factory_->open(replicas_[position]);
                }
                const std::string sql = Render(created + 1, spec);
                TPCH_DEBUG("{}: {}", replicas_[position].to_string(), sql);
                conn->execute(sql);
                ++created;
            }
        } catch (const core::Error& e) {
            if (conn) {
                conn->close();
            }
            TPCH_ERROR("index creation failed after {} indexes: {}", created, e.what());
            return core::Result<size_t>(e);
        }
        if (conn) {
            conn->close();
        }
    }
    TPCH_INFO("created {} indexes", created);
    return core::Result<size_t>(created);
}

} // namespace bench
} // namespace tpch
