#pragma once

#include "lostore/core/errors.hpp"
#include "lostore/core/types.hpp"

namespace lostore::bindings::http {
    using u8 = lostore::core::u8;
    using u64 = lostore::core::u64;

    inline constexpr u64 kDefaultSpoolMemory = 1024 * 1024;

    // Response body staging area. Bytes stay in memory up to the threshold,
    // after which everything moves to an unlinked temporary file. Written
    // once, then read back from the start with rewind().
    class SpoolBuffer {
    public:
        explicit SpoolBuffer(u64 max_memory = kDefaultSpoolMemory) noexcept;
        ~SpoolBuffer() noexcept;

        SpoolBuffer(const SpoolBuffer&) = delete;
        SpoolBuffer& operator=(const SpoolBuffer&) = delete;

        [[nodiscard]] lostore::core::Status write(const u8* data, u64 len) noexcept;

        [[nodiscard]] lostore::core::Status rewind() noexcept;
        // Empty at the end.
        [[nodiscard]] lostore::core::Status read(u64 n, lostore::core::Bytes* out) noexcept;
        // Everything from the read position on.
        [[nodiscard]] lostore::core::Status read_all(lostore::core::Bytes* out) noexcept;

        [[nodiscard]] u64 size() const noexcept { return size_; }
        [[nodiscard]] bool spilled() const noexcept { return fd_ >= 0; }

    private:
        [[nodiscard]] lostore::core::Status spill() noexcept;

        u64 max_memory_;
        lostore::core::Bytes mem_;
        int fd_{-1};
        u64 size_{0};
        u64 read_pos_{0};
    };

} // namespace lostore::bindings::http
