#pragma once

#include "lostore/core/errors.hpp"
#include "lostore/core/types.hpp"

namespace lostore::db {
    using u8 = lostore::core::u8;
    using u64 = lostore::core::u64;
    using i64 = lostore::core::i64;

    // ========================================================================
    // Connection
    // ========================================================================

    // One transactional connection to a store that supports large objects.
    //
    // Every lo_* primitive is a single round trip on a networked backend.
    // Descriptors returned by lo_open belong to this connection; on PostgreSQL
    // they are only valid until the surrounding transaction ends.
    //
    // A connection is single-owner: it must not be used from two threads at
    // the same time.
    class LoConnection {
    public:
        virtual ~LoConnection() = default;

        LoConnection(const LoConnection&) = delete;
        LoConnection& operator=(const LoConnection&) = delete;

        // Transactions
        [[nodiscard]] virtual lostore::core::Status begin() noexcept = 0;
        [[nodiscard]] virtual lostore::core::Status commit() noexcept = 0;
        [[nodiscard]] virtual lostore::core::Status rollback() noexcept = 0;
        [[nodiscard]] virtual bool in_transaction() const noexcept = 0;

        // Large-object primitives
        [[nodiscard]] virtual lostore::core::Status lo_create(lostore::core::Loid* out) noexcept = 0;
        [[nodiscard]] virtual lostore::core::Status lo_open(lostore::core::Loid id,
                                                            lostore::core::LoAccess access,
                                                            lostore::core::LoFd* out) noexcept = 0;
        // Reads at most n bytes; `out` is replaced, empty at end of object.
        [[nodiscard]] virtual lostore::core::Status lo_read(lostore::core::LoFd fd, u64 n,
                                                            lostore::core::Bytes* out) noexcept = 0;
        [[nodiscard]] virtual lostore::core::Status lo_write(lostore::core::LoFd fd, const u8* data, u64 len,
                                                             u64* written) noexcept = 0;
        // Writes the new absolute position to `pos`.
        [[nodiscard]] virtual lostore::core::Status lo_lseek(lostore::core::LoFd fd, i64 offset,
                                                             lostore::core::Whence whence,
                                                             i64* pos) noexcept = 0;
        [[nodiscard]] virtual lostore::core::Status lo_tell(lostore::core::LoFd fd, i64* pos) noexcept = 0;
        [[nodiscard]] virtual lostore::core::Status lo_truncate(lostore::core::LoFd fd, i64 len) noexcept = 0;
        [[nodiscard]] virtual lostore::core::Status lo_close(lostore::core::LoFd fd) noexcept = 0;
        // NotFound when the object does not exist.
        [[nodiscard]] virtual lostore::core::Status lo_unlink(lostore::core::Loid id) noexcept = 0;
        [[nodiscard]] virtual lostore::core::Status lo_exists(lostore::core::Loid id, bool* out) noexcept = 0;

        // Backend message for the most recent failure, for log lines.
        [[nodiscard]] virtual const char* last_error() const noexcept = 0;

    protected:
        LoConnection() = default;
    };

    // Read- and write-oriented connection aliases. Both may point at the
    // same connection when the deployment does not separate them.
    struct Connections {
        LoConnection* read{nullptr};
        LoConnection* write{nullptr};
    };

    [[nodiscard]] inline Connections single_connection(LoConnection& conn) noexcept {
        return Connections{&conn, &conn};
    }

    // ========================================================================
    // Transaction scope
    // ========================================================================

    // Opens a transaction on begin(), or joins the one already active on the
    // connection. finish() commits an owned transaction when the status is ok
    // and rolls it back otherwise. An owned transaction that was never
    // finished is rolled back on destruction.
    class TxnScope {
    public:
        TxnScope() noexcept = default;
        ~TxnScope() noexcept;

        TxnScope(const TxnScope&) = delete;
        TxnScope& operator=(const TxnScope&) = delete;

        [[nodiscard]] lostore::core::Status begin(LoConnection& conn) noexcept;

        // Returns `s` when it is an error, otherwise the commit status.
        [[nodiscard]] lostore::core::Status finish(lostore::core::Status s) noexcept;

        [[nodiscard]] bool owns() const noexcept { return owned_; }

    private:
        LoConnection* conn_{nullptr};
        bool owned_{false};
        bool done_{false};
    };

} // namespace lostore::db
