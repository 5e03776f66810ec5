#include "lostore/db/pg_connection.hpp"
#include <libpq-fe.h>
#include <libpq/libpq-fs.h>
#include <climits>
#include <cstdio>
#include <cstring>
#include <string>
#include <type_traits>

namespace lostore::db {

using namespace lostore::core;

namespace {
    // SQLSTATE raised for "large object N does not exist".
    constexpr const char* kUndefinedObject = "42704";

    // PostgreSQL object identifiers are 32-bit.
    [[nodiscard]] bool fits_oid(Loid id) noexcept {
        return id.v != 0 && id.v <= static_cast<u64>(UINT_MAX);
    }

    [[nodiscard]] int pg_mode(LoAccess access) noexcept {
        int mode = 0;
        if (access_can_read(access)) mode |= INV_READ;
        if (access_can_write(access)) mode |= INV_WRITE;
        return mode;
    }

    [[nodiscard]] int pg_whence(Whence whence) noexcept {
        switch (whence) {
            case Whence::Set: return SEEK_SET;
            case Whence::Cur: return SEEK_CUR;
            case Whence::End: return SEEK_END;
        }
        return SEEK_SET;
    }

    // Owns a PGresult for the duration of one call.
    struct Result {
        PGresult* r{nullptr};
        Result() = default;
        Result(const Result&) = delete;
        Result& operator=(const Result&) = delete;
        ~Result() { PQclear(r); }
    };
    static_assert(!std::is_copy_constructible_v<Result>);
    static_assert(!std::is_copy_assignable_v<Result>);
}

// ============================================================================
// Lifecycle
// ============================================================================

PgConnection::PgConnection(PGconn* conn) noexcept : conn_(conn) {}

PgConnection::~PgConnection() {
    if (conn_) {
        if (in_txn_) {
            PQclear(PQexec(conn_, "ROLLBACK"));
        }
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

Status PgConnection::open(const PgConfig& cfg, std::unique_ptr<PgConnection>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    PGconn* conn = PQconnectdb(cfg.conninfo.c_str());
    if (!conn) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }
    if (PQstatus(conn) != CONNECTION_OK) {
        PQfinish(conn);
        return make_status(StatusDomain::Db, StatusCode::Network);
    }

    out->reset(new PgConnection(conn));
    return ok_status();
}

const char* PgConnection::last_error() const noexcept {
    return conn_ ? PQerrorMessage(conn_) : "connection closed";
}

Status PgConnection::fail() noexcept {
    if (PQstatus(conn_) != CONNECTION_OK) {
        return make_status(StatusDomain::Db, StatusCode::Network);
    }
    return make_status(StatusDomain::Db, StatusCode::Backend);
}

Status PgConnection::exec(const char* sql) noexcept {
    Result res;
    res.r = PQexec(conn_, sql);
    if (PQresultStatus(res.r) != PGRES_COMMAND_OK) {
        return fail();
    }
    return ok_status();
}

// ============================================================================
// Transactions
// ============================================================================

Status PgConnection::begin() noexcept {
    if (in_txn_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    Status s = exec("BEGIN");
    if (!is_ok(s)) {
        return s;
    }
    in_txn_ = true;
    return ok_status();
}

Status PgConnection::commit() noexcept {
    if (!in_txn_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    in_txn_ = false;
    return exec("COMMIT");
}

Status PgConnection::rollback() noexcept {
    if (!in_txn_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    in_txn_ = false;
    return exec("ROLLBACK");
}

// ============================================================================
// Large-object primitives
// ============================================================================

Status PgConnection::lo_create(Loid* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    const Oid oid = ::lo_create(conn_, InvalidOid);
    if (oid == InvalidOid) {
        return fail();
    }
    out->v = static_cast<u64>(oid);
    return ok_status();
}

Status PgConnection::lo_open(Loid id, LoAccess access, LoFd* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (!fits_oid(id)) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    const int fd = ::lo_open(conn_, static_cast<Oid>(id.v), pg_mode(access));
    if (fd < 0) {
        return fail();
    }
    out->v = fd;
    return ok_status();
}

Status PgConnection::lo_read(LoFd fd, u64 n, Bytes* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    out->clear();
    if (n == 0) {
        return ok_status();
    }
    // lo_read reports its byte count as an int.
    const u64 want = n > static_cast<u64>(INT_MAX) ? static_cast<u64>(INT_MAX) : n;
    out->resize(static_cast<size_t>(want));
    const int got = ::lo_read(conn_, fd.v, reinterpret_cast<char*>(out->data()), static_cast<size_t>(want));
    if (got < 0) {
        out->clear();
        return fail();
    }
    out->resize(static_cast<size_t>(got));
    return ok_status();
}

Status PgConnection::lo_write(LoFd fd, const u8* data, u64 len, u64* written) noexcept {
    if (!written || (len > 0 && !data)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    *written = 0;
    if (len == 0) {
        return ok_status();
    }
    if (len > static_cast<u64>(INT_MAX)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    const int n = ::lo_write(conn_, fd.v, reinterpret_cast<const char*>(data), static_cast<size_t>(len));
    if (n < 0) {
        return fail();
    }
    *written = static_cast<u64>(n);
    return ok_status();
}

Status PgConnection::lo_lseek(LoFd fd, i64 offset, Whence whence, i64* pos) noexcept {
    if (!pos) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    const pg_int64 p = ::lo_lseek64(conn_, fd.v, offset, pg_whence(whence));
    if (p < 0) {
        return fail();
    }
    *pos = p;
    return ok_status();
}

Status PgConnection::lo_tell(LoFd fd, i64* pos) noexcept {
    if (!pos) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    const pg_int64 p = ::lo_tell64(conn_, fd.v);
    if (p < 0) {
        return fail();
    }
    *pos = p;
    return ok_status();
}

Status PgConnection::lo_truncate(LoFd fd, i64 len) noexcept {
    if (len < 0) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (::lo_truncate64(conn_, fd.v, len) < 0) {
        return fail();
    }
    return ok_status();
}

Status PgConnection::lo_close(LoFd fd) noexcept {
    if (::lo_close(conn_, fd.v) < 0) {
        return fail();
    }
    return ok_status();
}

Status PgConnection::lo_unlink(Loid id) noexcept {
    if (!fits_oid(id)) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    // Issued as SQL so an absent object is recognizable by its SQLSTATE.
    // Inside a transaction the failure must not abort the whole block.
    if (in_txn_) {
        Status s = exec("SAVEPOINT lo_unlink");
        if (!is_ok(s)) {
            return s;
        }
    }

    const std::string oid = std::to_string(id.v);
    const char* params[1] = {oid.c_str()};

    Result res;
    res.r = PQexecParams(conn_, "SELECT lo_unlink($1::oid)", 1, nullptr, params, nullptr, nullptr, 0);
    if (PQresultStatus(res.r) == PGRES_TUPLES_OK) {
        return in_txn_ ? exec("RELEASE SAVEPOINT lo_unlink") : ok_status();
    }

    const char* state = PQresultErrorField(res.r, PG_DIAG_SQLSTATE);
    const bool absent = state && std::strcmp(state, kUndefinedObject) == 0;
    Status failure = absent ? make_status(StatusDomain::Db, StatusCode::NotFound) : fail();
    if (in_txn_) {
        Status s = exec("ROLLBACK TO SAVEPOINT lo_unlink");
        if (!is_ok(s)) {
            return s;
        }
    }
    return failure;
}

Status PgConnection::lo_exists(Loid id, bool* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (!fits_oid(id)) {
        *out = false;
        return ok_status();
    }
    const std::string oid = std::to_string(id.v);
    const char* params[1] = {oid.c_str()};

    Result res;
    res.r = PQexecParams(conn_,
        "SELECT EXISTS(SELECT 1 FROM pg_largeobject_metadata WHERE oid = $1::oid)",
        1, nullptr, params, nullptr, nullptr, 0);
    if (PQresultStatus(res.r) != PGRES_TUPLES_OK || PQntuples(res.r) != 1) {
        return fail();
    }
    const char* v = PQgetvalue(res.r, 0, 0);
    *out = v && v[0] == 't';
    return ok_status();
}

} // namespace lostore::db
