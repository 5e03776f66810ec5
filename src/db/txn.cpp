#include "lostore/db/connection.hpp"

namespace lostore::db {

using namespace lostore::core;

TxnScope::~TxnScope() noexcept {
    if (conn_ && owned_ && !done_) {
        (void)conn_->rollback();
    }
}

Status TxnScope::begin(LoConnection& conn) noexcept {
    if (conn_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    conn_ = &conn;
    if (conn.in_transaction()) {
        owned_ = false;
        return ok_status();
    }
    Status s = conn.begin();
    if (!is_ok(s)) {
        conn_ = nullptr;
        return s;
    }
    owned_ = true;
    return ok_status();
}

Status TxnScope::finish(Status s) noexcept {
    if (!conn_ || done_) {
        return is_ok(s) ? make_status(StatusDomain::Db, StatusCode::Invalid) : s;
    }
    done_ = true;
    if (!owned_) {
        return s;
    }
    if (!is_ok(s)) {
        (void)conn_->rollback();
        return s;
    }
    return conn_->commit();
}

} // namespace lostore::db
