#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "lostore/core/errors.hpp"
#include "lostore/core/types.hpp"
#include "lostore/db/connection.hpp"
#include "lostore/storage/buffer.hpp"
#include "lostore/storage/open_mode.hpp"

namespace lostore::storage {

using u64 = lostore::core::u64;
using i64 = lostore::core::i64;

// Bulk transfer unit; bounds the cost of a single round trip.
inline constexpr u64 kChunkBytes = 64 * 1024;

// Read unit used when scanning for a single line.
inline constexpr u64 kLineScanBytes = 64;

// Receives consecutive pieces of an object.
using ByteSink = std::function<lostore::core::Status(const lostore::core::u8* data, u64 len)>;

class LoStream;

// ========================================================================
// Line iteration
// ========================================================================

// Lazy, finite sequence of '\n'-terminated lines (the last one may lack the
// terminator). Not restartable.
//
// Reads run ahead in kChunkBytes pieces, but after every yielded line the
// stream is positioned just past that line and nowhere else, so the stream
// can be closed after partial iteration and reopened at the right place.
class LineIterator {
public:
    explicit LineIterator(LoStream& stream) noexcept;

    // Sets *has_line to false once the sequence is exhausted.
    [[nodiscard]] lostore::core::Status next(lostore::core::Bytes* line, bool* has_line) noexcept;

private:
    [[nodiscard]] lostore::core::Status fetch() noexcept;
    [[nodiscard]] lostore::core::Status consume(u64 len) noexcept;

    LoStream* stream_;
    lostore::core::Bytes buf_;
    u64 scan_{0};       // start of the unconsumed bytes in buf_
    u64 searched_{0};   // buf_ before this offset holds no terminator
    i64 logical_{0};    // position of the first unconsumed byte
    i64 fetched_{0};    // position just past the last fetched byte
    bool started_{false};
    bool exhausted_{false};
    bool finished_{false};
};

// ========================================================================
// Large-object stream
// ========================================================================

// File-like access to one large object.
//
// Every operation is one or more round trips to the backing store; nothing
// is cached locally and no call is retried. Mode violations fail with
// InvalidMode and operations on a closed stream fail with Invalid, both
// before any remote call.
//
// A stream is owned by one caller at a time. close() is idempotent; the
// destructor closes a descriptor that is still open.
class LoStream {
public:
    LoStream(lostore::db::Connections conns, lostore::core::Loid id) noexcept;
    ~LoStream() noexcept;

    LoStream(const LoStream&) = delete;
    LoStream& operator=(const LoStream&) = delete;

    // Opens (or reopens) the object. With the create sentinel as loid, a
    // write-capable mode creates a new object and `name` contributes its
    // suffixes to the assigned name. Append modes start at the end of an
    // existing object. The connection must already be inside a transaction;
    // the stream is usable until that transaction ends.
    [[nodiscard]] lostore::core::Status open(OpenMode mode, std::string_view name = {}) noexcept;
    [[nodiscard]] lostore::core::Status close() noexcept;

    [[nodiscard]] bool closed() const noexcept { return fd_ == lostore::core::kNoFd; }
    [[nodiscard]] bool readable() const noexcept { return !closed() && mode_readable(mode_); }
    [[nodiscard]] bool writable() const noexcept { return !closed() && mode_writable(mode_); }

    [[nodiscard]] lostore::core::Loid loid() const noexcept { return id_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] OpenMode mode() const noexcept { return mode_; }

    // A negative n reads everything up to the end. Otherwise one primitive
    // read of n bytes; the result is short only at the end and empty exactly
    // there.
    [[nodiscard]] lostore::core::Status read(i64 n, lostore::core::Bytes* out) noexcept;
    [[nodiscard]] lostore::core::Status read_all(lostore::core::Bytes* out) noexcept;
    [[nodiscard]] lostore::core::Status readinto(const ByteSink& sink) noexcept;

    // Returns at most max_len bytes (unbounded when negative) up to and
    // including the next '\n', leaving the stream just past what it returned.
    [[nodiscard]] lostore::core::Status readline(i64 max_len, lostore::core::Bytes* out) noexcept;
    [[nodiscard]] LineIterator lines() noexcept { return LineIterator(*this); }
    // No limit when max_count is negative.
    [[nodiscard]] lostore::core::Status readlines(i64 max_count, std::vector<lostore::core::Bytes>* out) noexcept;

    [[nodiscard]] lostore::core::Status write(BufferView data, u64* written) noexcept;
    [[nodiscard]] lostore::core::Status write_all(const BufferView* chunks, u64 count) noexcept;

    // `pos` may be null.
    [[nodiscard]] lostore::core::Status seek(i64 offset, lostore::core::Whence whence, i64* pos) noexcept;
    [[nodiscard]] lostore::core::Status tell(i64* pos) noexcept;
    // Leaves the position unchanged.
    [[nodiscard]] lostore::core::Status size(i64* out) noexcept;

    // Truncates at the current position.
    [[nodiscard]] lostore::core::Status truncate(i64* resolved) noexcept;
    [[nodiscard]] lostore::core::Status truncate(i64 size, i64* resolved) noexcept;

private:
    [[nodiscard]] lostore::core::Status require_open() const noexcept;
    [[nodiscard]] lostore::core::Status require_readable() const noexcept;
    [[nodiscard]] lostore::core::Status require_writable() const noexcept;

    lostore::db::Connections conns_;
    lostore::db::LoConnection* conn_{nullptr};
    lostore::core::Loid id_;
    lostore::core::LoFd fd_{lostore::core::kNoFd};
    OpenMode mode_{OpenMode::Read};
    std::string name_;
};

} // namespace lostore::storage
