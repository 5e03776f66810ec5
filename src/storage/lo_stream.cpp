#include "lostore/storage/lo_stream.hpp"
#include "lostore/storage/name_codec.hpp"

#include <algorithm>
#include <utility>

namespace lostore::storage {

using namespace lostore::core;

// ========================================================================
// Lifecycle
// ========================================================================

LoStream::LoStream(db::Connections conns, Loid id) noexcept : conns_(conns), id_(id) {}

LoStream::~LoStream() noexcept {
    if (!closed()) {
        (void)close();
    }
}

Status LoStream::open(OpenMode mode, std::string_view name) noexcept {
    if (!closed()) {
        Status s = close();
        if (!is_ok(s)) {
            return s;
        }
    }

    const bool create = loid_is_new(id_);
    if (create && !mode_can_create(mode)) {
        return make_status(StatusDomain::Storage, StatusCode::InvalidMode);
    }

    db::LoConnection* conn = mode_role(mode) == ConnRole::Read ? conns_.read : conns_.write;
    if (!conn) {
        return make_status(StatusDomain::Storage, StatusCode::Config);
    }
    // Descriptors end with the transaction that opened them.
    if (!conn->in_transaction()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    Loid id = id_;
    std::string next_name;
    if (create) {
        Status s = conn->lo_create(&id);
        if (!is_ok(s)) {
            return s;
        }
        s = encode_name(id, name, &next_name);
        if (!is_ok(s)) {
            return s;
        }
    } else if (!name.empty()) {
        next_name = std::string(name);
    } else if (!name_.empty()) {
        next_name = name_;
    } else {
        next_name = std::to_string(id.v);
    }

    LoFd fd = kNoFd;
    Status s = conn->lo_open(id, mode_access(mode), &fd);
    if (!is_ok(s)) {
        return s;
    }

    if (mode_appends(mode) && !create) {
        i64 end = 0;
        s = conn->lo_lseek(fd, 0, Whence::End, &end);
        if (!is_ok(s)) {
            (void)conn->lo_close(fd);
            return s;
        }
    }

    id_ = id;
    name_ = std::move(next_name);
    conn_ = conn;
    fd_ = fd;
    mode_ = mode;
    return ok_status();
}

Status LoStream::close() noexcept {
    if (closed()) {
        return ok_status();
    }
    const LoFd fd = fd_;
    fd_ = kNoFd;
    return conn_->lo_close(fd);
}

Status LoStream::require_open() const noexcept {
    if (closed()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    return ok_status();
}

Status LoStream::require_readable() const noexcept {
    Status s = require_open();
    if (!is_ok(s)) {
        return s;
    }
    if (!mode_readable(mode_)) {
        return make_status(StatusDomain::Storage, StatusCode::InvalidMode);
    }
    return ok_status();
}

Status LoStream::require_writable() const noexcept {
    Status s = require_open();
    if (!is_ok(s)) {
        return s;
    }
    if (!mode_writable(mode_)) {
        return make_status(StatusDomain::Storage, StatusCode::InvalidMode);
    }
    return ok_status();
}

// ========================================================================
// Reading
// ========================================================================

Status LoStream::read(i64 n, Bytes* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (n < 0) {
        return read_all(out);
    }
    Status s = require_readable();
    if (!is_ok(s)) {
        return s;
    }
    return conn_->lo_read(fd_, static_cast<u64>(n), out);
}

Status LoStream::read_all(Bytes* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    out->clear();
    return readinto([out](const u8* data, u64 len) {
        out->insert(out->end(), data, data + len);
        return ok_status();
    });
}

Status LoStream::readinto(const ByteSink& sink) noexcept {
    Status s = require_readable();
    if (!is_ok(s)) {
        return s;
    }

    Bytes chunk;
    while (true) {
        s = conn_->lo_read(fd_, kChunkBytes, &chunk);
        if (!is_ok(s)) {
            return s;
        }
        if (!chunk.empty()) {
            s = sink(chunk.data(), chunk.size());
            if (!is_ok(s)) {
                return s;
            }
        }
        // A short chunk only happens at the end of the object.
        if (chunk.size() < kChunkBytes) {
            return ok_status();
        }
    }
}

Status LoStream::readline(i64 max_len, Bytes* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    out->clear();
    Status s = require_readable();
    if (!is_ok(s)) {
        return s;
    }
    if (max_len == 0) {
        return ok_status();
    }

    i64 start = 0;
    s = conn_->lo_tell(fd_, &start);
    if (!is_ok(s)) {
        return s;
    }

    Bytes chunk;
    while (true) {
        s = conn_->lo_read(fd_, kLineScanBytes, &chunk);
        if (!is_ok(s)) {
            return s;
        }
        if (chunk.empty()) {
            break;
        }
        const auto nl = std::find(chunk.begin(), chunk.end(), static_cast<u8>('\n'));
        if (nl != chunk.end()) {
            out->insert(out->end(), chunk.begin(), nl + 1);
            break;
        }
        out->insert(out->end(), chunk.begin(), chunk.end());
        if (max_len > 0 && static_cast<i64>(out->size()) >= max_len) {
            break;
        }
    }

    if (out->empty()) {
        return ok_status();
    }
    if (max_len > 0 && static_cast<i64>(out->size()) > max_len) {
        out->resize(static_cast<size_t>(max_len));
    }

    // Undo the read-ahead.
    i64 pos = 0;
    return conn_->lo_lseek(fd_, start + static_cast<i64>(out->size()), Whence::Set, &pos);
}

Status LoStream::readlines(i64 max_count, std::vector<Bytes>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    out->clear();
    if (max_count == 0) {
        return ok_status();
    }

    LineIterator it = lines();
    Bytes line;
    bool has_line = false;
    while (max_count < 0 || static_cast<i64>(out->size()) < max_count) {
        Status s = it.next(&line, &has_line);
        if (!is_ok(s)) {
            return s;
        }
        if (!has_line) {
            break;
        }
        out->push_back(std::move(line));
    }
    return ok_status();
}

// ========================================================================
// Writing
// ========================================================================

Status LoStream::write(BufferView data, u64* written) noexcept {
    if (!written || (data.len > 0 && !data.data)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    *written = 0;
    Status s = require_writable();
    if (!is_ok(s)) {
        return s;
    }
    return conn_->lo_write(fd_, data.data, data.len, written);
}

Status LoStream::write_all(const BufferView* chunks, u64 count) noexcept {
    if (count > 0 && !chunks) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    Status s = require_writable();
    if (!is_ok(s)) {
        return s;
    }
    for (u64 i = 0; i < count; ++i) {
        u64 written = 0;
        s = write(chunks[i], &written);
        if (!is_ok(s)) {
            return s;
        }
    }
    return ok_status();
}

// ========================================================================
// Positioning
// ========================================================================

Status LoStream::seek(i64 offset, Whence whence, i64* pos) noexcept {
    Status s = require_open();
    if (!is_ok(s)) {
        return s;
    }
    i64 result = 0;
    s = conn_->lo_lseek(fd_, offset, whence, &result);
    if (!is_ok(s)) {
        return s;
    }
    if (pos) {
        *pos = result;
    }
    return ok_status();
}

Status LoStream::tell(i64* pos) noexcept {
    if (!pos) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    Status s = require_open();
    if (!is_ok(s)) {
        return s;
    }
    return conn_->lo_tell(fd_, pos);
}

Status LoStream::size(i64* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    Status s = require_open();
    if (!is_ok(s)) {
        return s;
    }

    i64 saved = 0;
    s = conn_->lo_tell(fd_, &saved);
    if (!is_ok(s)) {
        return s;
    }
    i64 end = 0;
    s = conn_->lo_lseek(fd_, 0, Whence::End, &end);
    if (!is_ok(s)) {
        return s;
    }
    i64 restored = 0;
    s = conn_->lo_lseek(fd_, saved, Whence::Set, &restored);
    if (!is_ok(s)) {
        return s;
    }
    *out = end;
    return ok_status();
}

Status LoStream::truncate(i64* resolved) noexcept {
    if (!resolved) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    Status s = require_writable();
    if (!is_ok(s)) {
        return s;
    }
    i64 pos = 0;
    s = conn_->lo_tell(fd_, &pos);
    if (!is_ok(s)) {
        return s;
    }
    return truncate(pos, resolved);
}

Status LoStream::truncate(i64 size, i64* resolved) noexcept {
    if (!resolved || size < 0) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    Status s = require_writable();
    if (!is_ok(s)) {
        return s;
    }
    s = conn_->lo_truncate(fd_, size);
    if (!is_ok(s)) {
        return s;
    }
    *resolved = size;
    return ok_status();
}

// ========================================================================
// Line iteration
// ========================================================================

LineIterator::LineIterator(LoStream& stream) noexcept : stream_(&stream) {}

Status LineIterator::consume(u64 len) noexcept {
    Status s = stream_->seek(static_cast<i64>(len), Whence::Cur, nullptr);
    if (!is_ok(s)) {
        return s;
    }
    logical_ += static_cast<i64>(len);
    return ok_status();
}

Status LineIterator::fetch() noexcept {
    // The stream sits at the consumer's position; move to the read-ahead edge.
    if (fetched_ != logical_) {
        Status s = stream_->seek(fetched_, Whence::Set, nullptr);
        if (!is_ok(s)) {
            return s;
        }
    }

    Bytes chunk;
    Status s = stream_->read(static_cast<i64>(kChunkBytes), &chunk);
    if (!is_ok(s)) {
        return s;
    }
    fetched_ += static_cast<i64>(chunk.size());
    if (chunk.size() < kChunkBytes) {
        exhausted_ = true;
    }
    buf_.insert(buf_.end(), chunk.begin(), chunk.end());

    // Hand the position back to the consumer.
    if (fetched_ != logical_) {
        s = stream_->seek(logical_, Whence::Set, nullptr);
        if (!is_ok(s)) {
            return s;
        }
    }
    return ok_status();
}

Status LineIterator::next(Bytes* line, bool* has_line) noexcept {
    if (!line || !has_line) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    line->clear();
    *has_line = false;
    if (finished_) {
        return ok_status();
    }

    if (!started_) {
        Status s = stream_->tell(&logical_);
        if (!is_ok(s)) {
            return s;
        }
        fetched_ = logical_;
        started_ = true;
    }

    while (true) {
        const auto from = buf_.begin() + static_cast<std::ptrdiff_t>(scan_);
        const auto nl = std::find(buf_.begin() + static_cast<std::ptrdiff_t>(std::max(scan_, searched_)),
                                  buf_.end(), static_cast<u8>('\n'));
        if (nl != buf_.end()) {
            line->assign(from, nl + 1);
            Status s = consume(line->size());
            if (!is_ok(s)) {
                return s;
            }
            scan_ = static_cast<u64>(nl - buf_.begin()) + 1;
            searched_ = scan_;
            if (scan_ >= buf_.size()) {
                buf_.clear();
                scan_ = 0;
                searched_ = 0;
            }
            *has_line = true;
            return ok_status();
        }

        // Keep only the unterminated remainder.
        if (scan_ > 0) {
            buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(scan_));
            scan_ = 0;
        }
        searched_ = buf_.size();

        if (exhausted_) {
            finished_ = true;
            if (buf_.empty()) {
                return ok_status();
            }
            line->swap(buf_);
            buf_.clear();
            Status s = consume(line->size());
            if (!is_ok(s)) {
                return s;
            }
            *has_line = true;
            return ok_status();
        }

        Status s = fetch();
        if (!is_ok(s)) {
            return s;
        }
    }
}

} // namespace lostore::storage
