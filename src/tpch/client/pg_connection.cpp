#include "tpch/client/pg_connection.h"
#include "tpch/common/logger.h"
#include "tpch/core/error.h"

namespace tpch {
namespace client {

namespace {

// Statements are logged truncated; RF1 inserts and some queries are long
std::string Abbreviate(const std::string& sql) {
    constexpr size_t kMaxLen = 120;
    if (sql.size() <= kMaxLen) {
        return sql;
    }
    return sql.substr(0, kMaxLen) + "...";
}

} // namespace

PgConnection::PgConnection(const core::Replica& replica)
    : Connection(replica) {
    try {
        conn_ = std::make_unique<pqxx::connection>(replica.connection_string());
    } catch (const pqxx::broken_connection& e) {
        throw core::ConnectionError("cannot connect to " + replica.to_string() + ": " + e.what());
    } catch (const pqxx::failure& e) {
        throw core::ConnectionError("cannot connect to " + replica.to_string() + ": " + e.what());
    }
    TPCH_TRACE("connected to {}", replica.to_string());
}

PgConnection::~PgConnection() {
    close_on_destroy();
}

void PgConnection::do_execute(const std::string& sql) {
    try {
        if (work_) {
            work_->exec(sql);
        } else {
            pqxx::nontransaction tx(*conn_);
            tx.exec(sql);
        }
    } catch (const pqxx::broken_connection& e) {
        throw core::ConnectionError("lost connection to " + replica().to_string() + ": " + e.what());
    } catch (const pqxx::sql_error& e) {
        throw core::StatementError("statement rejected by " + replica().to_string() + ": " +
                                   e.what() + " [" + Abbreviate(e.query()) + "]");
    } catch (const pqxx::failure& e) {
        throw core::StatementError("statement failed on " + replica().to_string() + ": " +
                                   e.what() + " [" + Abbreviate(sql) + "]");
    }
}

void PgConnection::do_begin(TransactionMode mode) {
    try {
        work_ = std::make_unique<pqxx::work>(*conn_);
        if (mode == TransactionMode::DEFERRED_CONSTRAINTS) {
            work_->exec("SET CONSTRAINTS ALL DEFERRED");
        }
    } catch (const pqxx::broken_connection& e) {
        work_.reset();
        throw core::ConnectionError("lost connection to " + replica().to_string() + ": " + e.what());
    } catch (const pqxx::failure& e) {
        work_.reset();
        throw core::StatementError("cannot begin transaction on " + replica().to_string() + ": " + e.what());
    }
}

void PgConnection::do_commit() {
    try {
        work_->commit();
        work_.reset();
    } catch (const pqxx::failure& e) {
        work_.reset();
        throw core::StatementError("commit failed on " + replica().to_string() + ": " + e.what());
    }
}

void PgConnection::do_rollback() {
    try {
        work_->abort();
    } catch (const pqxx::failure& e) {
        TPCH_WARN("rollback failed on {}: {}", replica().to_string(), e.what());
    }
    work_.reset();
}

void PgConnection::do_close() noexcept {
    // Destroying an open pqxx::work aborts it
    work_.reset();
    conn_.reset();
    TPCH_TRACE("closed connection to {}", replica().to_string());
}

std::unique_ptr<Connection> PgConnectionFactory::open(const core::Replica& replica) {
    return std::make_unique<PgConnection>(replica);
}

} // namespace client
} // namespace tpch
