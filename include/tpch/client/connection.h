#ifndef TPCH_CLIENT_CONNECTION_H_
#define TPCH_CLIENT_CONNECTION_H_

#include <memory>
#include <string>

#include "tpch/core/types.h"

namespace tpch {
namespace client {

enum class TransactionMode {
    DEFAULT,
    DEFERRED_CONSTRAINTS  // referential checks run at commit
};

/**
 * @brief One live session to one replica.
 *
 * A connection is owned by exactly one execution unit and is never shared
 * across threads. Every operation after close() throws UseAfterCloseError.
 * Implementations report unreachable replicas with ConnectionError and
 * rejected statements with StatementError.
 */
class Connection {
public:
    virtual ~Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Execute one statement and consume its whole result
     */
    void execute(const std::string& sql);

    void begin(TransactionMode mode = TransactionMode::DEFAULT);
    void commit();
    void rollback();

    /**
     * @brief Release the session. Closing twice is a no-op.
     */
    void close();

    bool is_open() const { return open_; }
    bool in_transaction() const { return in_transaction_; }
    const core::Replica& replica() const { return replica_; }

protected:
    explicit Connection(core::Replica replica);

    virtual void do_execute(const std::string& sql) = 0;
    virtual void do_begin(TransactionMode mode) = 0;
    virtual void do_commit() = 0;
    virtual void do_rollback() = 0;
    virtual void do_close() noexcept = 0;

    // Derived destructors call this; warns when the owner forgot close()
    void close_on_destroy() noexcept;

private:
    void ensure_open(const char* operation) const;

    core::Replica replica_;
    bool open_ = true;
    bool in_transaction_ = false;
};

/**
 * @brief Opens connections to replicas. open() may be called from many
 *        threads at once.
 */
class ConnectionFactory {
public:
    virtual ~ConnectionFactory() = default;

    /**
     * @brief Establish a session; throws ConnectionError on failure
     */
    virtual std::unique_ptr<Connection> open(const core::Replica& replica) = 0;
};

} // namespace client
} // namespace tpch

#endif // TPCH_CLIENT_CONNECTION_H_
