#include "lostore/db/sqlite_connection.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <string>
#include <type_traits>

namespace lostore::db {

using namespace lostore::core;

namespace {
    constexpr const char* kSchemaSQL = R"SQL(
        CREATE TABLE IF NOT EXISTS lo_metadata (
            oid INTEGER PRIMARY KEY AUTOINCREMENT
        );

        CREATE TABLE IF NOT EXISTS lo_pages (
            loid INTEGER NOT NULL,
            pageno INTEGER NOT NULL,
            data BLOB NOT NULL,
            PRIMARY KEY (loid, pageno)
        );
    )SQL";

    [[nodiscard]] Status backend_error(int rc) noexcept {
        return make_status(StatusDomain::Db, StatusCode::Backend, static_cast<u32>(rc));
    }

    [[nodiscard]] Status invalid_fd() noexcept {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    // Finalizes the statement on every exit path.
    struct Stmt {
        sqlite3_stmt* s{nullptr};
        Stmt() = default;
        Stmt(const Stmt&) = delete;
        Stmt& operator=(const Stmt&) = delete;
        ~Stmt() { sqlite3_finalize(s); }
    };
    static_assert(!std::is_copy_constructible_v<Stmt>);
    static_assert(!std::is_copy_assignable_v<Stmt>);

    [[nodiscard]] Status prepare(sqlite3* db, const char* sql, Stmt* out) noexcept {
        const int rc = sqlite3_prepare_v2(db, sql, -1, &out->s, nullptr);
        if (rc != SQLITE_OK || out->s == nullptr) {
            return backend_error(rc);
        }
        return ok_status();
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db) noexcept : db_(db) {}

SqliteConnection::~SqliteConnection() {
    if (db_) {
        if (in_txn_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Status SqliteConnection::open(const SqliteConfig& cfg, std::unique_ptr<SqliteConnection>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const std::string path = cfg.path.empty() ? std::string(":memory:") : cfg.path;
    sqlite3* db = nullptr;
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return backend_error(rc);
    }

    // Journal mode is configurable; WAL is ignored for in-memory databases.
    const char* journal_mode = std::getenv("LOSTORE_DB_JOURNAL_MODE");
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    }
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += journal_mode;
    char* err_msg = nullptr;
    rc = sqlite3_exec(db, journal_sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        sqlite3_free(err_msg);
        err_msg = nullptr;
    }
    sqlite3_exec(db, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db, 5000);

    rc = sqlite3_exec(db, kSchemaSQL, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        sqlite3_free(err_msg);
        sqlite3_close(db);
        return backend_error(rc);
    }

    out->reset(new SqliteConnection(db));
    return ok_status();
}

const char* SqliteConnection::last_error() const noexcept {
    return db_ ? sqlite3_errmsg(db_) : "connection closed";
}

Status SqliteConnection::exec(const char* sql) noexcept {
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (err_msg) sqlite3_free(err_msg);
    if (rc != SQLITE_OK) {
        return backend_error(rc);
    }
    return ok_status();
}

// ============================================================================
// Transactions
// ============================================================================

void SqliteConnection::end_transaction() noexcept {
    in_txn_ = false;
    fds_.clear();
}

Status SqliteConnection::begin() noexcept {
    if (in_txn_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    Status s = exec("BEGIN TRANSACTION");
    if (!is_ok(s)) {
        return s;
    }
    in_txn_ = true;
    return ok_status();
}

Status SqliteConnection::commit() noexcept {
    if (!in_txn_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    Status s = exec("COMMIT");
    if (!is_ok(s)) {
        return s;
    }
    end_transaction();
    return ok_status();
}

Status SqliteConnection::rollback() noexcept {
    if (!in_txn_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    Status s = exec("ROLLBACK");
    end_transaction();
    return s;
}

// ============================================================================
// Page helpers
// ============================================================================

SqliteConnection::Descriptor* SqliteConnection::find_fd(LoFd fd) noexcept {
    auto it = fds_.find(fd.v);
    if (it == fds_.end()) {
        return nullptr;
    }
    return &it->second;
}

Status SqliteConnection::object_size(Loid id, i64* out) noexcept {
    Stmt stmt;
    Status s = prepare(db_,
        "SELECT MAX(pageno * 2048 + length(data)) FROM lo_pages WHERE loid = ?", &stmt);
    if (!is_ok(s)) return s;

    sqlite3_bind_int64(stmt.s, 1, static_cast<sqlite3_int64>(id.v));
    const int rc = sqlite3_step(stmt.s);
    if (rc != SQLITE_ROW) {
        return backend_error(rc);
    }
    *out = sqlite3_column_type(stmt.s, 0) == SQLITE_NULL ? 0 : sqlite3_column_int64(stmt.s, 0);
    return ok_status();
}

Status SqliteConnection::load_page(Loid id, i64 pageno, Bytes* out) noexcept {
    out->clear();
    Stmt stmt;
    Status s = prepare(db_, "SELECT data FROM lo_pages WHERE loid = ? AND pageno = ?", &stmt);
    if (!is_ok(s)) return s;

    sqlite3_bind_int64(stmt.s, 1, static_cast<sqlite3_int64>(id.v));
    sqlite3_bind_int64(stmt.s, 2, pageno);
    const int rc = sqlite3_step(stmt.s);
    if (rc == SQLITE_DONE) {
        return ok_status();
    }
    if (rc != SQLITE_ROW) {
        return backend_error(rc);
    }
    const auto* blob = static_cast<const u8*>(sqlite3_column_blob(stmt.s, 0));
    const int n = sqlite3_column_bytes(stmt.s, 0);
    if (blob && n > 0) {
        out->assign(blob, blob + n);
    }
    return ok_status();
}

Status SqliteConnection::store_page(Loid id, i64 pageno, const Bytes& page) noexcept {
    Stmt stmt;
    Status s = prepare(db_,
        "INSERT OR REPLACE INTO lo_pages (loid, pageno, data) VALUES (?, ?, ?)", &stmt);
    if (!is_ok(s)) return s;

    sqlite3_bind_int64(stmt.s, 1, static_cast<sqlite3_int64>(id.v));
    sqlite3_bind_int64(stmt.s, 2, pageno);
    sqlite3_bind_blob(stmt.s, 3, page.empty() ? "" : static_cast<const void*>(page.data()),
                      static_cast<int>(page.size()), SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt.s);
    if (rc != SQLITE_DONE) {
        return backend_error(rc);
    }
    return ok_status();
}

Status SqliteConnection::drop_pages_from(Loid id, i64 first_pageno) noexcept {
    Stmt stmt;
    Status s = prepare(db_, "DELETE FROM lo_pages WHERE loid = ? AND pageno >= ?", &stmt);
    if (!is_ok(s)) return s;

    sqlite3_bind_int64(stmt.s, 1, static_cast<sqlite3_int64>(id.v));
    sqlite3_bind_int64(stmt.s, 2, first_pageno);
    const int rc = sqlite3_step(stmt.s);
    if (rc != SQLITE_DONE) {
        return backend_error(rc);
    }
    return ok_status();
}

// ============================================================================
// Large-object primitives
// ============================================================================

Status SqliteConnection::lo_create(Loid* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    Status s = exec("INSERT INTO lo_metadata DEFAULT VALUES");
    if (!is_ok(s)) {
        return s;
    }
    out->v = static_cast<u64>(sqlite3_last_insert_rowid(db_));
    return ok_status();
}

Status SqliteConnection::lo_open(Loid id, LoAccess access, LoFd* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    bool exists = false;
    Status s = lo_exists(id, &exists);
    if (!is_ok(s)) {
        return s;
    }
    if (!exists) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    // In autocommit the descriptor ends with the statement, as in PostgreSQL.
    const i32 fd = next_fd_++;
    if (in_txn_) {
        fds_[fd] = Descriptor{id, access, 0};
    }
    out->v = fd;
    return ok_status();
}

Status SqliteConnection::lo_read(LoFd fd, u64 n, Bytes* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    out->clear();
    Descriptor* d = find_fd(fd);
    if (!d) {
        return invalid_fd();
    }
    if (!access_can_read(d->access)) {
        return make_status(StatusDomain::Db, StatusCode::PermissionDenied);
    }

    i64 size = 0;
    Status s = object_size(d->id, &size);
    if (!is_ok(s)) {
        return s;
    }
    if (n == 0 || d->pos >= size) {
        return ok_status();
    }

    const i64 count = static_cast<i64>(std::min<u64>(n, static_cast<u64>(size - d->pos)));
    out->assign(static_cast<size_t>(count), 0);

    Stmt stmt;
    s = prepare(db_,
        "SELECT pageno, data FROM lo_pages WHERE loid = ? AND pageno BETWEEN ? AND ? ORDER BY pageno",
        &stmt);
    if (!is_ok(s)) {
        out->clear();
        return s;
    }
    const i64 first = d->pos / kSqlitePageBytes;
    const i64 last = (d->pos + count - 1) / kSqlitePageBytes;
    sqlite3_bind_int64(stmt.s, 1, static_cast<sqlite3_int64>(d->id.v));
    sqlite3_bind_int64(stmt.s, 2, first);
    sqlite3_bind_int64(stmt.s, 3, last);

    int rc;
    while ((rc = sqlite3_step(stmt.s)) == SQLITE_ROW) {
        const i64 pageno = sqlite3_column_int64(stmt.s, 0);
        const auto* blob = static_cast<const u8*>(sqlite3_column_blob(stmt.s, 1));
        const i64 blob_len = sqlite3_column_bytes(stmt.s, 1);
        const i64 page_start = pageno * kSqlitePageBytes;

        // Overlap of [page_start, page_start + blob_len) with [pos, pos + count).
        const i64 lo = std::max(page_start, d->pos);
        const i64 hi = std::min(page_start + blob_len, d->pos + count);
        if (blob && hi > lo) {
            std::memcpy(out->data() + (lo - d->pos), blob + (lo - page_start), static_cast<size_t>(hi - lo));
        }
    }
    if (rc != SQLITE_DONE) {
        out->clear();
        return backend_error(rc);
    }

    d->pos += count;
    return ok_status();
}

Status SqliteConnection::lo_write(LoFd fd, const u8* data, u64 len, u64* written) noexcept {
    if (!written || (len > 0 && !data)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    *written = 0;
    Descriptor* d = find_fd(fd);
    if (!d) {
        return invalid_fd();
    }
    if (!access_can_write(d->access)) {
        return make_status(StatusDomain::Db, StatusCode::PermissionDenied);
    }
    if (len == 0) {
        return ok_status();
    }

    // All pages of one write land together or not at all.
    Status s = exec("SAVEPOINT lo_write");
    if (!is_ok(s)) {
        return s;
    }

    const i64 end = d->pos + static_cast<i64>(len);
    i64 cursor = d->pos;
    Bytes page;
    while (cursor < end) {
        const i64 pageno = cursor / kSqlitePageBytes;
        const i64 page_off = cursor % kSqlitePageBytes;
        const i64 piece = std::min(kSqlitePageBytes - page_off, end - cursor);

        s = load_page(d->id, pageno, &page);
        if (!is_ok(s)) break;
        if (static_cast<i64>(page.size()) < page_off + piece) {
            page.resize(static_cast<size_t>(page_off + piece), 0);
        }
        std::memcpy(page.data() + page_off, data + (cursor - d->pos), static_cast<size_t>(piece));
        s = store_page(d->id, pageno, page);
        if (!is_ok(s)) break;

        cursor += piece;
    }

    if (!is_ok(s)) {
        (void)exec("ROLLBACK TO lo_write");
        (void)exec("RELEASE lo_write");
        return s;
    }
    s = exec("RELEASE lo_write");
    if (!is_ok(s)) {
        return s;
    }

    d->pos = end;
    *written = len;
    return ok_status();
}

Status SqliteConnection::lo_lseek(LoFd fd, i64 offset, Whence whence, i64* pos) noexcept {
    if (!pos) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    Descriptor* d = find_fd(fd);
    if (!d) {
        return invalid_fd();
    }

    i64 base = 0;
    switch (whence) {
        case Whence::Set:
            base = 0;
            break;
        case Whence::Cur:
            base = d->pos;
            break;
        case Whence::End: {
            Status s = object_size(d->id, &base);
            if (!is_ok(s)) {
                return s;
            }
            break;
        }
        default:
            return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const i64 target = base + offset;
    if (target < 0) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    d->pos = target;
    *pos = target;
    return ok_status();
}

Status SqliteConnection::lo_tell(LoFd fd, i64* pos) noexcept {
    if (!pos) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    Descriptor* d = find_fd(fd);
    if (!d) {
        return invalid_fd();
    }
    *pos = d->pos;
    return ok_status();
}

Status SqliteConnection::lo_truncate(LoFd fd, i64 len) noexcept {
    Descriptor* d = find_fd(fd);
    if (!d) {
        return invalid_fd();
    }
    if (len < 0) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (!access_can_write(d->access)) {
        return make_status(StatusDomain::Db, StatusCode::PermissionDenied);
    }

    Status s = exec("SAVEPOINT lo_truncate");
    if (!is_ok(s)) {
        return s;
    }

    // The tail page is kept even when empty so the object keeps its length.
    const i64 tail_pageno = len / kSqlitePageBytes;
    const i64 tail_len = len % kSqlitePageBytes;
    Bytes page;
    s = load_page(d->id, tail_pageno, &page);
    if (is_ok(s)) {
        page.resize(static_cast<size_t>(tail_len), 0);
        s = store_page(d->id, tail_pageno, page);
    }
    if (is_ok(s)) {
        s = drop_pages_from(d->id, tail_pageno + 1);
    }

    if (!is_ok(s)) {
        (void)exec("ROLLBACK TO lo_truncate");
        (void)exec("RELEASE lo_truncate");
        return s;
    }
    return exec("RELEASE lo_truncate");
}

Status SqliteConnection::lo_close(LoFd fd) noexcept {
    if (fds_.erase(fd.v) == 0) {
        return invalid_fd();
    }
    return ok_status();
}

Status SqliteConnection::lo_unlink(Loid id) noexcept {
    Stmt stmt;
    Status s = prepare(db_, "DELETE FROM lo_metadata WHERE oid = ?", &stmt);
    if (!is_ok(s)) return s;

    sqlite3_bind_int64(stmt.s, 1, static_cast<sqlite3_int64>(id.v));
    const int rc = sqlite3_step(stmt.s);
    if (rc != SQLITE_DONE) {
        return backend_error(rc);
    }
    if (sqlite3_changes(db_) == 0) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    return drop_pages_from(id, 0);
}

Status SqliteConnection::lo_exists(Loid id, bool* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    Stmt stmt;
    Status s = prepare(db_, "SELECT 1 FROM lo_metadata WHERE oid = ? LIMIT 1", &stmt);
    if (!is_ok(s)) return s;

    sqlite3_bind_int64(stmt.s, 1, static_cast<sqlite3_int64>(id.v));
    const int rc = sqlite3_step(stmt.s);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return backend_error(rc);
    }
    *out = rc == SQLITE_ROW;
    return ok_status();
}

} // namespace lostore::db
