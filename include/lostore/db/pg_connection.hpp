#pragma once

#include <memory>
#include <string>

#include "lostore/db/connection.hpp"

typedef struct pg_conn PGconn;

namespace lostore::db {

    struct PgConfig {
        std::string conninfo;  // libpq connection string
    };

    // PostgreSQL connection using the libpq client large-object interface.
    //
    // libpq requires every large-object call to run inside a transaction
    // block; callers wrap stream lifetimes in a TxnScope.
    class PgConnection final : public LoConnection {
    public:
        [[nodiscard]] static lostore::core::Status open(const PgConfig& cfg,
                                                        std::unique_ptr<PgConnection>* out) noexcept;
        ~PgConnection() override;

        [[nodiscard]] lostore::core::Status begin() noexcept override;
        [[nodiscard]] lostore::core::Status commit() noexcept override;
        [[nodiscard]] lostore::core::Status rollback() noexcept override;
        [[nodiscard]] bool in_transaction() const noexcept override { return in_txn_; }

        [[nodiscard]] lostore::core::Status lo_create(lostore::core::Loid* out) noexcept override;
        [[nodiscard]] lostore::core::Status lo_open(lostore::core::Loid id, lostore::core::LoAccess access,
                                                    lostore::core::LoFd* out) noexcept override;
        [[nodiscard]] lostore::core::Status lo_read(lostore::core::LoFd fd, u64 n,
                                                    lostore::core::Bytes* out) noexcept override;
        [[nodiscard]] lostore::core::Status lo_write(lostore::core::LoFd fd, const u8* data, u64 len,
                                                     u64* written) noexcept override;
        [[nodiscard]] lostore::core::Status lo_lseek(lostore::core::LoFd fd, i64 offset,
                                                     lostore::core::Whence whence, i64* pos) noexcept override;
        [[nodiscard]] lostore::core::Status lo_tell(lostore::core::LoFd fd, i64* pos) noexcept override;
        [[nodiscard]] lostore::core::Status lo_truncate(lostore::core::LoFd fd, i64 len) noexcept override;
        [[nodiscard]] lostore::core::Status lo_close(lostore::core::LoFd fd) noexcept override;
        [[nodiscard]] lostore::core::Status lo_unlink(lostore::core::Loid id) noexcept override;
        [[nodiscard]] lostore::core::Status lo_exists(lostore::core::Loid id, bool* out) noexcept override;
        [[nodiscard]] const char* last_error() const noexcept override;

    private:
        explicit PgConnection(PGconn* conn) noexcept;

        [[nodiscard]] lostore::core::Status exec(const char* sql) noexcept;
        [[nodiscard]] lostore::core::Status fail() noexcept;

        PGconn* conn_{nullptr};
        bool in_txn_{false};
    };

} // namespace lostore::db
