#include "tpch/client/connection.h"
#include "tpch/common/logger.h"
#include "tpch/core/error.h"

#include <string>
#include <utility>

namespace tpch {
namespace client {

Connection::Connection(core::Replica replica)
    : replica_(std::move(replica)) {}

void Connection::ensure_open(const char* operation) const {
    if (!open_) {
        throw core::UseAfterCloseError(std::string(operation) + " on closed connection to " +
                                       replica_.to_string());
    }
}

void Connection::execute(const std::string& sql) {
    ensure_open("execute");
    do_execute(sql);
}

void Connection::begin(TransactionMode mode) {
    ensure_open("begin");
    if (in_transaction_) {
        throw core::InternalError("transaction already open on " + replica_.to_string());
    }
    do_begin(mode);
    in_transaction_ = true;
}

void Connection::commit() {
    ensure_open("commit");
    if (!in_transaction_) {
        throw core::InternalError("commit without transaction on " + replica_.to_string());
    }
    in_transaction_ = false;
    do_commit();
}

void Connection::rollback() {
    ensure_open("rollback");
    if (!in_transaction_) {
        return;
    }
    in_transaction_ = false;
    do_rollback();
}

void Connection::close() {
    if (!open_) {
        return;
    }
    open_ = false;
    in_transaction_ = false;
    do_close();
}

void Connection::close_on_destroy() noexcept {
    if (open_) {
        TPCH_WARN("connection to {} destroyed while open, closing it", replica_.to_string());
        open_ = false;
        in_transaction_ = false;
        do_close();
    }
}

} // namespace client
} // namespace tpch
