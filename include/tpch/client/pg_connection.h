#ifndef TPCH_CLIENT_PG_CONNECTION_H_
#define TPCH_CLIENT_PG_CONNECTION_H_

#include <memory>
#include <string>

#include <pqxx/pqxx>

#include "tpch/client/connection.h"

namespace tpch {
namespace client {

/**
 * @brief PostgreSQL session backed by libpqxx.
 *
 * Statements outside begin()/commit() run in autocommit mode through a
 * pqxx::nontransaction.
 */
class PgConnection final : public Connection {
public:
    explicit PgConnection(const core::Replica& replica);
    ~PgConnection() override;

protected:
    void do_execute(const std::string& sql) override;
    void do_begin(TransactionMode mode) override;
    void do_commit() override;
    void do_rollback() override;
    void do_close() noexcept override;

private:
    std::unique_ptr<pqxx::connection> conn_;
    std::unique_ptr<pqxx::work> work_;
};

class PgConnectionFactory : public ConnectionFactory {
public:
    std::unique_ptr<Connection> open(const core::Replica& replica) override;
};

} // namespace client
} // namespace tpch

#endif // TPCH_CLIENT_PG_CONNECTION_H_
