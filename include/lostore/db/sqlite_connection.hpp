#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "lostore/db/connection.hpp"

struct sqlite3;

namespace lostore::db {
    using i32 = lostore::core::i32;

    struct SqliteConfig {
        std::string path;  // ":memory:" when empty
    };

    // Page size of the embedded store, same as PostgreSQL's LOBLKSIZE.
    inline constexpr i64 kSqlitePageBytes = 2048;

    // Large objects kept inside an SQLite database.
    //
    // Objects are split into fixed-size pages in lo_pages(loid, pageno, data);
    // identities live in lo_metadata(oid). Semantics follow PostgreSQL:
    // holes read back as zero bytes, seeking past the end is allowed, and
    // descriptors live until the end of the transaction that opened them.
    // Outside a transaction lo_open hands back a descriptor that is already
    // gone.
    class SqliteConnection final : public LoConnection {
    public:
        [[nodiscard]] static lostore::core::Status open(const SqliteConfig& cfg,
                                                        std::unique_ptr<SqliteConnection>* out) noexcept;
        ~SqliteConnection() override;

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

        // Number of descriptors currently open on this connection.
        [[nodiscard]] u64 open_descriptors() const noexcept { return fds_.size(); }

    private:
        struct Descriptor {
            lostore::core::Loid id{};
            lostore::core::LoAccess access{lostore::core::LoAccess::Read};
            i64 pos{0};
        };

        explicit SqliteConnection(sqlite3* db) noexcept;

        [[nodiscard]] Descriptor* find_fd(lostore::core::LoFd fd) noexcept;
        [[nodiscard]] lostore::core::Status object_size(lostore::core::Loid id, i64* out) noexcept;
        [[nodiscard]] lostore::core::Status load_page(lostore::core::Loid id, i64 pageno,
                                                      lostore::core::Bytes* out) noexcept;
        [[nodiscard]] lostore::core::Status store_page(lostore::core::Loid id, i64 pageno,
                                                       const lostore::core::Bytes& page) noexcept;
        [[nodiscard]] lostore::core::Status drop_pages_from(lostore::core::Loid id, i64 first_pageno) noexcept;
        [[nodiscard]] lostore::core::Status exec(const char* sql) noexcept;
        void end_transaction() noexcept;

        sqlite3* db_{nullptr};
        bool in_txn_{false};
        i32 next_fd_{0};
        std::unordered_map<i32, Descriptor> fds_;
    };

} // namespace lostore::db
